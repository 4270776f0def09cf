//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description: Command line of the knxlink executable. Wraps the shared connection options with output controls.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/CommandLine.hpp"
#include "Components/Configuration/ConnectionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view ApplicationVersion = "0.1.0";

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view Quiet = "quiet";
    static constexpr std::string_view Management = "management";

    Options();

    [[nodiscard]] ParseCode Parse(std::int32_t argc, char** argv);

    [[nodiscard]] std::string GenerateHelpText(std::string_view program) const;
    [[nodiscard]] std::string GenerateVersionText(std::string_view program) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosityLevel() const;
    [[nodiscard]] bool UseManagement() const;
    [[nodiscard]] Configuration::ConnectionOptions& GetConnectionOptions();

private:
    void SetupDescriptions();
    [[nodiscard]] bool ApplyOutputOptions();

    boost::program_options::options_description m_descriptions;
    boost::program_options::variables_map m_options;
    Configuration::CommandLine m_commandLine;

    spdlog::level::level_enum m_verbosity;
    bool m_management;
    Configuration::ConnectionOptions m_connection;
};

//----------------------------------------------------------------------------------------------------------------------
