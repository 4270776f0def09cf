//----------------------------------------------------------------------------------------------------------------------
// File: LogUtils.hpp
// Description: Named spdlog loggers for the connection engine. Each component owns one colored tag.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace LogUtils {
//----------------------------------------------------------------------------------------------------------------------

void InitializeLoggers(spdlog::level::level_enum verbosity = spdlog::level::info);

using Logger = std::shared_ptr<spdlog::logger>;

//----------------------------------------------------------------------------------------------------------------------
namespace Name {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "core";
constexpr std::string_view Link = "link";
constexpr std::string_view Network = "network";
constexpr std::string_view Security = "security";

//----------------------------------------------------------------------------------------------------------------------
} // Name namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Pattern {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Prefix = "==";
constexpr std::string_view TagOpen = "[";
constexpr std::string_view TagClose = "]";
constexpr std::string_view TagSeperator = " ";
constexpr std::string_view Date = "[%a, %d %b %Y %T]";
constexpr std::string_view Message = "%^[%l] - %v%$";

std::string Generate(std::string_view name, std::string_view color);

//----------------------------------------------------------------------------------------------------------------------
} // Pattern namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Color {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "\x1b[1;38;2;0;255;175m";
constexpr std::string_view Link = "\x1b[1;38;2;255;175;0m";
constexpr std::string_view Network = "\x1b[1;38;2;0;195;255m";
constexpr std::string_view Security = "\x1b[1;38;2;200;120;255m";

using LevelColor = std::pair<spdlog::level::level_enum, spdlog::string_view_t>;
constexpr std::array<LevelColor, 6> Levels = {
    LevelColor{ spdlog::level::trace, "\x1b[38;2;255;255;255m" },
    LevelColor{ spdlog::level::debug, "\x1b[38;2;45;204;255m" },
    LevelColor{ spdlog::level::info, "\x1b[38;2;26;204;148m" },
    LevelColor{ spdlog::level::warn, "\x1b[38;2;255;214;102m" },
    LevelColor{ spdlog::level::err, "\x1b[38;2;255;56;56m" },
    LevelColor{ spdlog::level::critical, "\x1b[1;38;2;255;56;56m" },
};

constexpr std::string_view Reset = "\x1b[0m";

std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> CreateTrueColorConsole();

//----------------------------------------------------------------------------------------------------------------------
} // Color namespace
} // LogUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline void LogUtils::InitializeLoggers(spdlog::level::level_enum verbosity)
{
    using LoggerDefinition = std::pair<std::string_view, std::string_view>;
    constexpr std::array<LoggerDefinition, 4> definitions = {
        LoggerDefinition{ Name::Core, Color::Core },
        LoggerDefinition{ Name::Link, Color::Link },
        LoggerDefinition{ Name::Network, Color::Network },
        LoggerDefinition{ Name::Security, Color::Security },
    };

    for (auto const& [name, color] : definitions) {
        if (spdlog::get(name.data())) { continue; } // Test executables may initialize the loggers more than once.
        auto spLogger = std::make_shared<spdlog::logger>(name.data(), Color::CreateTrueColorConsole());
        spLogger->set_pattern(Pattern::Generate(name, color));
        spdlog::register_logger(spLogger);
    }

    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string LogUtils::Pattern::Generate(std::string_view name, std::string_view color)
{
    std::ostringstream oss;
    oss << Prefix << TagSeperator << Date << TagSeperator;
    oss << TagOpen << color << name << Color::Reset << TagClose << TagSeperator;
    oss << Message;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> LogUtils::Color::CreateTrueColorConsole()
{
    auto spColorSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    spColorSink->set_color_mode(spdlog::color_mode::automatic);
    for (auto const& [level, color] : Levels) {
        spColorSink->set_color(level, color);
    }

    return spColorSink;
}

//----------------------------------------------------------------------------------------------------------------------
