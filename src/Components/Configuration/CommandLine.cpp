//----------------------------------------------------------------------------------------------------------------------
// File: CommandLine.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "CommandLine.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Error.hpp"
#include "Components/Medium/IndividualAddress.hpp"
#include "Components/Medium/Settings.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Security/PasswordHash.hpp"
#include "Components/Security/Secret.hpp"
#include "Utilities/NumberUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

std::string const& GetValue(boost::program_options::option const& option);

template<std::integral IntegerType>
IntegerType DecodeNumber(boost::program_options::option const& option);

std::string AddShortName(std::string_view name, char shortName);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Configuration::CommandLine::CommandLine(bool showGroupKey)
    : m_common("Options")
    , m_secure("KNX IP Secure")
    , m_hidden()
    , m_descriptions()
    , m_positional()
    , m_unrecognized()
{
    SetupDescriptions(showGroupKey);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ConnectionOptions Configuration::CommandLine::Parse(std::vector<std::string> const& arguments)
{
    namespace po = boost::program_options;

    CheckLongOptionForms(arguments);
    m_unrecognized.clear();

    po::parsed_options parsed{ nullptr };
    try {
        parsed = po::command_line_parser(arguments)
            .options(m_descriptions)
            .positional(m_positional)
            .allow_unregistered()
            .run();
    } catch (po::error const& exception) {
        throw Core::Error(Core::Error::Category::Configuration, exception.what());
    }

    ConnectionOptions options;
    for (auto const& option : parsed.options) {
        if (option.unregistered) {
            m_unrecognized.insert(m_unrecognized.end(), option.original_tokens.begin(), option.original_tokens.end());
            continue;
        }

        if (option.string_key == Host) {
            options.SetHost(local::GetValue(option));
            continue;
        }

        if (option.string_key == Arguments) {
            m_unrecognized.insert(m_unrecognized.end(), option.value.begin(), option.value.end());
            continue;
        }

        if (ParseCommonOption(option, options)) { continue; }
        if (ParseSecureOption(option, options)) { continue; }

        m_unrecognized.insert(m_unrecognized.end(), option.original_tokens.begin(), option.original_tokens.end());
    }

    return options;
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> const& Configuration::CommandLine::GetUnrecognized() const
{
    return m_unrecognized;
}

//----------------------------------------------------------------------------------------------------------------------

boost::program_options::options_description const& Configuration::CommandLine::GetCommonDescription() const
{
    return m_common;
}

//----------------------------------------------------------------------------------------------------------------------

boost::program_options::options_description const& Configuration::CommandLine::GetSecureDescription() const
{
    return m_secure;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Configuration::CommandLine::GenerateHelpText() const
{
    std::ostringstream oss;
    oss << m_common << "\n" << m_secure;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::CommandLine::SetupDescriptions(bool showGroupKey)
{
    namespace po = boost::program_options;

    {
        auto AddCommonOption = m_common.add_options();

        std::ostringstream oss;
        oss << "UDP/TCP port on <host> (default " << ConnectionOptions::DefaultPort << ")";
        AddCommonOption(
            local::AddShortName(Port, 'p').c_str(), po::value<std::string>()->value_name("<number>"), oss.str().c_str());

        AddCommonOption(LocalHost.data(), po::value<std::string>()->value_name("<id>"), "local IP/host name");
        AddCommonOption(
            LocalPort.data(), po::value<std::string>()->value_name("<number>"),
            "local UDP port (default system assigned)");
        AddCommonOption(Udp.data(), "use UDP (default for unsecure communication)");
        AddCommonOption(Tcp.data(), "use TCP (default for KNX IP secure)");
        AddCommonOption(local::AddShortName(Nat, 'n').c_str(), "enable Network Address Translation");
        AddCommonOption(local::AddShortName(Serial, 'f').c_str(), "use FT1.2 serial communication");
        AddCommonOption(SerialCemi.data(), "use FT1.2 serial communication with cEMI frames");
        AddCommonOption(local::AddShortName(Usb, 'u').c_str(), "use KNX USB communication");
        AddCommonOption(BusMonitor.data(), "use TP-UART communication");
        AddCommonOption(
            local::AddShortName(KnxMedium, 'm').c_str(), po::value<std::string>()->value_name("<id>"),
            "KNX medium [tp1|p110|knxip|rf] (default tp1)");
        AddCommonOption(
            Domain.data(), po::value<std::string>()->value_name("<address>"),
            "domain address on KNX PL/RF medium (defaults to broadcast domain)");
        AddCommonOption(
            local::AddShortName(DeviceAddress, 'k').c_str(), po::value<std::string>()->value_name("<address>"),
            "KNX device address of the local endpoint");
        AddCommonOption(
            EmulateWriteEnable.data(), "emulate the write-enable query of local device management");
    }

    {
        auto AddSecureOption = m_secure.add_options();
        auto AddHiddenOption = m_hidden.add_options();

        (showGroupKey ? AddSecureOption : AddHiddenOption)(
            GroupKey.data(), po::value<std::string>()->value_name("<key>"),
            "multicast group key (backbone key, 32 hexadecimal digits)");

        AddSecureOption(
            User.data(), po::value<std::string>()->value_name("<id>"), "tunneling user identifier (1..127)");
        AddSecureOption(UserPassword.data(), po::value<std::string>()->value_name("<password>"), "tunneling user password");
        AddSecureOption(
            UserKey.data(), po::value<std::string>()->value_name("<key>"),
            "tunneling user password hash (32 hexadecimal digits)");
        AddSecureOption(
            DevicePassword.data(), po::value<std::string>()->value_name("<password>"), "device authentication password");
        AddSecureOption(
            DeviceKey.data(), po::value<std::string>()->value_name("<key>"),
            "device authentication code (32 hexadecimal digits)");
        AddSecureOption(
            Keyring.data(), po::value<std::string>()->value_name("<path>"),
            "keyring file (defaults to the only *.knxkeys file in the working directory)");
        AddSecureOption(
            KeyringPassword.data(), po::value<std::string>()->value_name("<password>"), "keyring password");
        AddSecureOption(
            Interface.data(), po::value<std::string>()->value_name("<address>"),
            "KNX address of the interface to select from the keyring");
    }

    {
        auto AddHiddenOption = m_hidden.add_options();
        AddHiddenOption(Host.data(), po::value<std::string>());
        AddHiddenOption(Arguments.data(), po::value<std::vector<std::string>>());
    }

    m_descriptions.add(m_common).add(m_secure).add(m_hidden);
    m_positional.add(Host.data(), 1).add(Arguments.data(), -1);
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Long options require two dashes. A long option name given with a single dash would otherwise be read
// as a cluster of short options (i.e. "-port" as "-p ort").
//----------------------------------------------------------------------------------------------------------------------
void Configuration::CommandLine::CheckLongOptionForms(std::vector<std::string> const& arguments) const
{
    bool skipValue = false;
    for (auto const& argument : arguments) {
        if (skipValue) { skipValue = false; continue; }
        if (argument.size() < 2 || argument.front() != '-') { continue; }

        std::string key;
        if (argument.starts_with("--")) {
            if (argument.find('=') != std::string::npos) { continue; }
            key = argument.substr(2);
        } else if (argument.size() == 2) {
            key = argument;
        } else {
            auto const name = argument.substr(1);
            if (auto const pDescription = m_descriptions.find_nothrow(name, false); pDescription) {
                if (pDescription->long_name() == name) {
                    std::ostringstream oss;
                    oss << "use --" << name;
                    throw Core::Error(Core::Error::Category::Configuration, oss.str());
                }
            }
            continue;
        }

        if (auto const pDescription = m_descriptions.find_nothrow(key, true); pDescription) {
            skipValue = pDescription->semantic()->max_tokens() > 0;
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::CommandLine::ParseCommonOption(
    boost::program_options::option const& option, ConnectionOptions& options) const
{
    auto const& key = option.string_key;
    if (key == Port) {
        options.SetPort(local::DecodeNumber<std::uint16_t>(option));
    } else if (key == LocalHost) {
        try {
            options.SetLocalHost(Network::ResolveHost(local::GetValue(option)));
        } catch (Core::Error const& exception) {
            throw Core::Error(Core::Error::Category::Configuration, exception.what());
        }
    } else if (key == LocalPort) {
        options.SetLocalPort(local::DecodeNumber<std::uint16_t>(option));
    } else if (key == Nat) {
        options.SetNat(true);
    } else if (key == Serial) {
        options.EnableTransport(Transport::Serial);
    } else if (key == SerialCemi) {
        options.EnableTransport(Transport::SerialCemi);
    } else if (key == Usb) {
        options.EnableTransport(Transport::Usb);
    } else if (key == BusMonitor) {
        options.EnableTransport(Transport::BusMonitor);
    } else if (key == Tcp) {
        options.SetTcp(true);
    } else if (key == Udp) {
        options.SetUdp(true);
    } else if (key == KnxMedium) {
        options.SetMedium(Medium::Settings::Create(local::GetValue(option)));
    } else if (key == Domain) {
        options.SetDomain(local::DecodeNumber<std::uint64_t>(option));
    } else if (key == DeviceAddress) {
        options.SetDeviceAddress(Medium::IndividualAddress::Parse(local::GetValue(option)));
    } else if (key == EmulateWriteEnable) {
        options.SetEmulateWriteEnable(true);
    } else {
        return false;
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::CommandLine::ParseSecureOption(
    boost::program_options::option const& option, ConnectionOptions& options) const
{
    auto const& key = option.string_key;
    if (key == GroupKey) {
        options.SetGroupKey(Security::DecodeSecret(local::GetValue(option)));
    } else if (key == DeviceKey) {
        options.SetDeviceKey(Security::DecodeSecret(local::GetValue(option)));
    } else if (key == DevicePassword) {
        options.SetDeviceKey(Security::HashDeviceAuthenticationPassword(local::GetValue(option)));
    } else if (key == User) {
        auto const user = local::DecodeNumber<std::int32_t>(option);
        if (user < 0 || user > ConnectionOptions::MaximumUser) {
            std::ostringstream oss;
            oss << "tunneling user identifier " << user << " out of range [0..127]";
            throw Core::Error(Core::Error::Category::Configuration, oss.str());
        }
        options.SetUser(static_cast<std::uint8_t>(user));
    } else if (key == UserKey) {
        options.SetUserKey(Security::DecodeSecret(local::GetValue(option)));
    } else if (key == UserPassword) {
        options.SetUserKey(Security::HashUserPassword(local::GetValue(option)));
    } else if (key == Keyring) {
        options.SetKeyringPath(local::GetValue(option));
    } else if (key == KeyringPassword) {
        options.SetKeyringPassword(local::GetValue(option));
    } else if (key == Interface) {
        options.SetInterfaceAddress(Medium::IndividualAddress::Parse(local::GetValue(option)));
    } else {
        return false;
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& local::GetValue(boost::program_options::option const& option)
{
    if (option.value.empty()) {
        std::ostringstream oss;
        oss << "missing value for --" << option.string_key;
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }
    return option.value.back();
}

//----------------------------------------------------------------------------------------------------------------------

template<std::integral IntegerType>
IntegerType local::DecodeNumber(boost::program_options::option const& option)
{
    auto const& value = GetValue(option);
    auto const optDecoded = NumberUtils::DecodeInteger<IntegerType>(value);
    if (!optDecoded) {
        std::ostringstream oss;
        oss << "invalid value \"" << value << "\" for --" << option.string_key;
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }
    return *optDecoded;
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::AddShortName(std::string_view name, char shortName)
{
    std::string result{ name };
    result.append(",").push_back(shortName);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------
