//----------------------------------------------------------------------------------------------------------------------
// File: ConnectionOptions.hpp
// Description: The typed record of everything a tool was asked to connect with. The record is filled by the command
// line parser and read by the link factory. The only field changed after parsing is the tunneling user, which the
// credential resolver backfills from the keyring.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Medium/IndividualAddress.hpp"
#include "Components/Medium/Settings.hpp"
#include "Components/Security/Secret.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/ip/address.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

// Note: The non-IP transports in order of precedence. When none is requested the connection uses KNXnet/IP.
enum class Transport : std::uint32_t { Serial, SerialCemi, Usb, BusMonitor };

[[nodiscard]] std::string_view TransportToString(Transport transport);

class ConnectionOptions;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::ConnectionOptions
{
public:
    static constexpr std::uint16_t DefaultPort = 3671;
    static constexpr std::uint8_t UnspecifiedUser = 0;
    static constexpr std::uint8_t MaximumUser = 127;
    static constexpr std::string_view DefaultMedium = "tp1";

    ConnectionOptions();

    [[nodiscard]] std::string const& GetHost() const;
    void SetHost(std::string_view host);

    [[nodiscard]] std::uint16_t GetPort() const;
    void SetPort(std::uint16_t port);

    [[nodiscard]] std::optional<boost::asio::ip::address> const& GetLocalHost() const;
    void SetLocalHost(boost::asio::ip::address const& address);

    [[nodiscard]] std::optional<std::uint16_t> const& GetLocalPort() const;
    void SetLocalPort(std::uint16_t port);

    [[nodiscard]] bool UseNat() const;
    void SetNat(bool enabled);

    [[nodiscard]] bool HasTransport(Transport transport) const;
    void EnableTransport(Transport transport);

    [[nodiscard]] bool UseTcp() const;
    void SetTcp(bool enabled);
    [[nodiscard]] bool UseUdp() const;
    void SetUdp(bool enabled);

    [[nodiscard]] Medium::SharedSettings const& GetMedium() const;
    void SetMedium(Medium::SharedSettings const& spMedium);

    [[nodiscard]] std::optional<std::uint64_t> const& GetDomain() const;
    void SetDomain(std::uint64_t domain);

    [[nodiscard]] Medium::OptionalIndividualAddress const& GetDeviceAddress() const;
    void SetDeviceAddress(Medium::IndividualAddress const& address);

    [[nodiscard]] Security::OptionalSecret const& GetGroupKey() const;
    void SetGroupKey(Security::Secret const& key);

    [[nodiscard]] Security::OptionalSecret const& GetDeviceKey() const;
    void SetDeviceKey(Security::Secret const& key);

    // Note: The tunneling user identifier, zero when unspecified.
    [[nodiscard]] std::uint8_t GetUser() const;
    [[nodiscard]] bool HasUser() const;
    void SetUser(std::uint8_t user);

    [[nodiscard]] Security::OptionalSecret const& GetUserKey() const;
    void SetUserKey(Security::Secret const& key);

    [[nodiscard]] std::optional<std::filesystem::path> const& GetKeyringPath() const;
    void SetKeyringPath(std::filesystem::path const& path);

    [[nodiscard]] std::optional<std::string> const& GetKeyringPassword() const;
    void SetKeyringPassword(std::string_view password);

    [[nodiscard]] Medium::OptionalIndividualAddress const& GetInterfaceAddress() const;
    void SetInterfaceAddress(Medium::IndividualAddress const& address);

    [[nodiscard]] bool EmulateWriteEnable() const;
    void SetEmulateWriteEnable(bool enabled);

    // Note: Whether any option implies the caller expects a KNX IP Secure connection.
    [[nodiscard]] bool HasSecureIntent() const;

private:
    std::string m_host;
    std::uint16_t m_port;
    std::optional<boost::asio::ip::address> m_optLocalHost;
    std::optional<std::uint16_t> m_optLocalPort;
    bool m_nat;

    bool m_serial;
    bool m_serialCemi;
    bool m_usb;
    bool m_busMonitor;
    bool m_tcp;
    bool m_udp;

    Medium::SharedSettings m_spMedium;
    std::optional<std::uint64_t> m_optDomain;
    Medium::OptionalIndividualAddress m_optDeviceAddress;

    Security::OptionalSecret m_optGroupKey;
    Security::OptionalSecret m_optDeviceKey;
    std::uint8_t m_user;
    Security::OptionalSecret m_optUserKey;
    std::optional<std::filesystem::path> m_optKeyringPath;
    std::optional<std::string> m_optKeyringPassword;
    Medium::OptionalIndividualAddress m_optInterfaceAddress;

    bool m_emulateWriteEnable;
};

//----------------------------------------------------------------------------------------------------------------------
