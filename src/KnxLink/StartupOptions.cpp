//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description: The executable only reads output and mode switches itself. Everything else is handed to the
// connection command line in the order it was given.
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Core/Error.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t MinimumTerminalWidth = 40;

using VerbosityLevel = std::pair<std::string_view, spdlog::level::level_enum>;
constexpr std::array<VerbosityLevel, 7> VerbosityLevels = {
    VerbosityLevel{ "trace", spdlog::level::trace },
    VerbosityLevel{ "debug", spdlog::level::debug },
    VerbosityLevel{ "info", spdlog::level::info },
    VerbosityLevel{ "warning", spdlog::level::warn },
    VerbosityLevel{ "error", spdlog::level::err },
    VerbosityLevel{ "critical", spdlog::level::critical },
    VerbosityLevel{ "none", spdlog::level::off },
};

std::uint32_t GetTerminalWidth();
std::string GetProgramName(char const* path);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_options()
    , m_commandLine()
    , m_verbosity(spdlog::level::info)
    , m_management(false)
    , m_connection()
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    std::uint32_t const width = local::GetTerminalWidth();
    boost::program_options::options_description general("General Options", width);
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(
        (std::string{ Help } + ",h").c_str(),
        boost::program_options::bool_switch()->default_value(false),
        "Print this help text and exit.");
    AddGeneralOption(
        Version.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Print the version and exit.");

    std::ostringstream levels;
    levels << "Maximum level of console log output, one of [";
    for (bool first = true; auto const& [name, level] : local::VerbosityLevels) {
        levels << (first ? "" : "|") << name;
        first = false;
    }
    levels << "].";
    AddGeneralOption(
        Verbosity.data(),
        boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
        levels.str().c_str());

    AddGeneralOption(
        Quiet.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Disables all output to the console.");

    AddGeneralOption(
        Management.data(),
        boost::program_options::bool_switch()->default_value(false),
        "Draft a local device management connection instead of a network link.");

    m_descriptions.add(general);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char** argv)
{
    namespace po = boost::program_options;

    // The connection options are parsed by the shared command line parser, everything this description does not
    // know is forwarded to it in order.
    po::parsed_options parsed{ nullptr };
    try {
        auto const style = po::command_line_style::default_style & ~po::command_line_style::allow_guessing;
        parsed = po::command_line_parser(argc, argv)
            .options(m_descriptions)
            .style(style)
            .allow_unregistered()
            .run();
        po::store(parsed, m_options);
    } catch (std::exception const& exception) {
        std::cout << "Failed to parse the command line: ";
        std::cout << exception.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    po::notify(m_options);

    std::string const program = local::GetProgramName(argv[0]);
    if (m_options[Help.data()].as<bool>()) {
        std::cout << GenerateHelpText(program) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (m_options[Version.data()].as<bool>()) {
        std::cout << GenerateVersionText(program) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (!ApplyOutputOptions()) { return ParseCode::Malformed; }
    m_management = m_options[Management.data()].as<bool>();

    try {
        m_connection = m_commandLine.Parse(po::collect_unrecognized(parsed.options, po::include_positional));
    } catch (Core::Error const& exception) {
        std::cout << "Invalid connection options: " << exception.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (auto const& unrecognized = m_commandLine.GetUnrecognized(); !unrecognized.empty()) {
        std::cout << "Unrecognized argument \"" << unrecognized.front() << "\"." << std::endl;
        return ParseCode::Malformed;
    }

    if (m_connection.GetHost().empty()) {
        std::cout << "A KNXnet/IP host or a serial or USB device is required." << std::endl;
        return ParseCode::Malformed;
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------
// Note: Must be called after parsing, the output switches are read from the stored variables.
//----------------------------------------------------------------------------------------------------------------------
bool Startup::Options::ApplyOutputOptions()
{
    bool const quiet = m_options[Quiet.data()].as<bool>();
    auto const& verbosity = m_options[Verbosity.data()];
    if (quiet && !verbosity.defaulted()) {
        std::cout << "Conflicting options '" << Verbosity << "' and '" << Quiet << "'." << std::endl;
        return false;
    }

    if (quiet) {
        m_verbosity = spdlog::level::off;
        return true;
    }

    auto const& argument = verbosity.as<std::string>();
    auto const itr = std::ranges::find(local::VerbosityLevels, argument, &local::VerbosityLevel::first);
    if (itr == local::VerbosityLevels.end()) {
        std::cout << "Unrecognized verbosity level \"" << argument << "\"." << std::endl;
        return false;
    }

    m_verbosity = itr->second;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText(std::string_view program) const
{
    std::ostringstream oss;
    oss << "Usage: " << program << " [options] <host|port>\n" << m_descriptions << "\n";
    oss << m_commandLine.GenerateHelpText();
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText(std::string_view program) const
{
    std::ostringstream oss;
    oss << program << " (KNX Link) " << ApplicationVersion;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosityLevel() const
{
    return m_verbosity;
}

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::UseManagement() const
{
    return m_management;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ConnectionOptions& Startup::Options::GetConnectionOptions()
{
    return m_connection;
}

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    struct winsize size = {};
    if (::ioctl(::fileno(stdout), TIOCGWINSZ, &size) != 0 || size.ws_col < MinimumTerminalWidth) {
        return boost::program_options::options_description::m_default_line_length;
    }
    return static_cast<std::uint32_t>(size.ws_col);
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::GetProgramName(char const* path)
{
    if (path == nullptr) { return "knxlink"; }
    return std::filesystem::path(path).stem().string();
}

//----------------------------------------------------------------------------------------------------------------------
