//----------------------------------------------------------------------------------------------------------------------
// File: ConnectionOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "ConnectionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Error.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <sstream>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

std::string_view Configuration::TransportToString(Transport transport)
{
    switch (transport) {
        case Transport::Serial: return "ft12";
        case Transport::SerialCemi: return "ft12-cemi";
        case Transport::Usb: return "usb";
        case Transport::BusMonitor: return "tpuart";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ConnectionOptions::ConnectionOptions()
    : m_host()
    , m_port(DefaultPort)
    , m_optLocalHost()
    , m_optLocalPort()
    , m_nat(false)
    , m_serial(false)
    , m_serialCemi(false)
    , m_usb(false)
    , m_busMonitor(false)
    , m_tcp(false)
    , m_udp(false)
    , m_spMedium(Medium::Settings::Create(DefaultMedium))
    , m_optDomain()
    , m_optDeviceAddress()
    , m_optGroupKey()
    , m_optDeviceKey()
    , m_user(UnspecifiedUser)
    , m_optUserKey()
    , m_optKeyringPath()
    , m_optKeyringPassword()
    , m_optInterfaceAddress()
    , m_emulateWriteEnable(false)
{
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::ConnectionOptions::GetHost() const
{
    return m_host;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetHost(std::string_view host)
{
    m_host = host;
}

//----------------------------------------------------------------------------------------------------------------------

std::uint16_t Configuration::ConnectionOptions::GetPort() const
{
    return m_port;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetPort(std::uint16_t port)
{
    m_port = port;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<boost::asio::ip::address> const& Configuration::ConnectionOptions::GetLocalHost() const
{
    return m_optLocalHost;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetLocalHost(boost::asio::ip::address const& address)
{
    m_optLocalHost = address;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint16_t> const& Configuration::ConnectionOptions::GetLocalPort() const
{
    return m_optLocalPort;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetLocalPort(std::uint16_t port)
{
    m_optLocalPort = port;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ConnectionOptions::UseNat() const
{
    return m_nat;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetNat(bool enabled)
{
    m_nat = enabled;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ConnectionOptions::HasTransport(Transport transport) const
{
    switch (transport) {
        case Transport::Serial: return m_serial;
        case Transport::SerialCemi: return m_serialCemi;
        case Transport::Usb: return m_usb;
        case Transport::BusMonitor: return m_busMonitor;
    }
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::EnableTransport(Transport transport)
{
    switch (transport) {
        case Transport::Serial: m_serial = true; break;
        case Transport::SerialCemi: m_serialCemi = true; break;
        case Transport::Usb: m_usb = true; break;
        case Transport::BusMonitor: m_busMonitor = true; break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ConnectionOptions::UseTcp() const
{
    return m_tcp;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetTcp(bool enabled)
{
    m_tcp = enabled;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ConnectionOptions::UseUdp() const
{
    return m_udp;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetUdp(bool enabled)
{
    m_udp = enabled;
}

//----------------------------------------------------------------------------------------------------------------------

Medium::SharedSettings const& Configuration::ConnectionOptions::GetMedium() const
{
    return m_spMedium;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetMedium(Medium::SharedSettings const& spMedium)
{
    if (!spMedium) { throw std::invalid_argument("Connection options require medium settings!"); }
    m_spMedium = spMedium;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::uint64_t> const& Configuration::ConnectionOptions::GetDomain() const
{
    return m_optDomain;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetDomain(std::uint64_t domain)
{
    m_optDomain = domain;
}

//----------------------------------------------------------------------------------------------------------------------

Medium::OptionalIndividualAddress const& Configuration::ConnectionOptions::GetDeviceAddress() const
{
    return m_optDeviceAddress;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetDeviceAddress(Medium::IndividualAddress const& address)
{
    m_optDeviceAddress = address;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecret const& Configuration::ConnectionOptions::GetGroupKey() const
{
    return m_optGroupKey;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetGroupKey(Security::Secret const& key)
{
    m_optGroupKey = key;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecret const& Configuration::ConnectionOptions::GetDeviceKey() const
{
    return m_optDeviceKey;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetDeviceKey(Security::Secret const& key)
{
    m_optDeviceKey = key;
}

//----------------------------------------------------------------------------------------------------------------------

std::uint8_t Configuration::ConnectionOptions::GetUser() const
{
    return m_user;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ConnectionOptions::HasUser() const
{
    return m_user != UnspecifiedUser;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetUser(std::uint8_t user)
{
    if (user > MaximumUser) {
        std::ostringstream oss;
        oss << "tunneling user identifier " << static_cast<std::uint32_t>(user) << " out of range [0..127]";
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }
    m_user = user;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecret const& Configuration::ConnectionOptions::GetUserKey() const
{
    return m_optUserKey;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetUserKey(Security::Secret const& key)
{
    m_optUserKey = key;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> const& Configuration::ConnectionOptions::GetKeyringPath() const
{
    return m_optKeyringPath;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetKeyringPath(std::filesystem::path const& path)
{
    m_optKeyringPath = path;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> const& Configuration::ConnectionOptions::GetKeyringPassword() const
{
    return m_optKeyringPassword;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetKeyringPassword(std::string_view password)
{
    m_optKeyringPassword = std::string{ password };
}

//----------------------------------------------------------------------------------------------------------------------

Medium::OptionalIndividualAddress const& Configuration::ConnectionOptions::GetInterfaceAddress() const
{
    return m_optInterfaceAddress;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetInterfaceAddress(Medium::IndividualAddress const& address)
{
    m_optInterfaceAddress = address;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ConnectionOptions::EmulateWriteEnable() const
{
    return m_emulateWriteEnable;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::ConnectionOptions::SetEmulateWriteEnable(bool enabled)
{
    m_emulateWriteEnable = enabled;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::ConnectionOptions::HasSecureIntent() const
{
    // A keyring password alone only enables the keyring lookup. An ambiguous keyring then falls back to plain tunneling.
    return HasUser() || m_optUserKey.has_value() || m_optDeviceKey.has_value() || m_optInterfaceAddress.has_value();
}

//----------------------------------------------------------------------------------------------------------------------
