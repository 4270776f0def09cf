//----------------------------------------------------------------------------------------------------------------------
// File: CommandLine.hpp
// Description: Parses the connection options shared by every KNX tool: the common options selecting the transport and
// the KNX IP Secure options. Tokens the parser does not know are handed back to the caller for tool specific parsing.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "ConnectionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class CommandLine;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::CommandLine
{
public:
    static constexpr std::string_view Host = "host";
    static constexpr std::string_view Arguments = "arguments";

    static constexpr std::string_view Port = "port";
    static constexpr std::string_view LocalHost = "localhost";
    static constexpr std::string_view LocalPort = "localport";
    static constexpr std::string_view Nat = "nat";
    static constexpr std::string_view Serial = "ft12";
    static constexpr std::string_view SerialCemi = "ft12-cemi";
    static constexpr std::string_view Usb = "usb";
    static constexpr std::string_view BusMonitor = "tpuart";
    static constexpr std::string_view Tcp = "tcp";
    static constexpr std::string_view Udp = "udp";
    static constexpr std::string_view KnxMedium = "medium";
    static constexpr std::string_view Domain = "domain";
    static constexpr std::string_view DeviceAddress = "knx-address";
    static constexpr std::string_view EmulateWriteEnable = "emulatewriteenable";

    static constexpr std::string_view GroupKey = "group-key";
    static constexpr std::string_view DeviceKey = "device-key";
    static constexpr std::string_view DevicePassword = "device-pwd";
    static constexpr std::string_view User = "user";
    static constexpr std::string_view UserKey = "user-key";
    static constexpr std::string_view UserPassword = "user-pwd";
    static constexpr std::string_view Keyring = "keyring";
    static constexpr std::string_view KeyringPassword = "keyring-pwd";
    static constexpr std::string_view Interface = "interface";

    explicit CommandLine(bool showGroupKey = true);

    // Note: Parses the arguments (without the program name) into a new option set. Malformed values raise a
    // configuration error.
    [[nodiscard]] ConnectionOptions Parse(std::vector<std::string> const& arguments);

    [[nodiscard]] std::vector<std::string> const& GetUnrecognized() const;

    [[nodiscard]] boost::program_options::options_description const& GetCommonDescription() const;
    [[nodiscard]] boost::program_options::options_description const& GetSecureDescription() const;
    [[nodiscard]] std::string GenerateHelpText() const;

private:
    void SetupDescriptions(bool showGroupKey);
    void CheckLongOptionForms(std::vector<std::string> const& arguments) const;

    [[nodiscard]] bool ParseCommonOption(boost::program_options::option const& option, ConnectionOptions& options) const;
    [[nodiscard]] bool ParseSecureOption(boost::program_options::option const& option, ConnectionOptions& options) const;

    boost::program_options::options_description m_common;
    boost::program_options::options_description m_secure;
    boost::program_options::options_description m_hidden;
    boost::program_options::options_description m_descriptions;
    boost::program_options::positional_options_description m_positional;

    std::vector<std::string> m_unrecognized;
};

//----------------------------------------------------------------------------------------------------------------------
