//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/ConnectionOptions.hpp"
#include "Components/Core/Error.hpp"
#include "Components/Link/Factory.hpp"
#include "Components/Link/Requests.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <csignal>
#include <cstdint>
#include <exception>
#include <stop_token>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace Signal {
//----------------------------------------------------------------------------------------------------------------------

class Watcher;

//----------------------------------------------------------------------------------------------------------------------
} // Signal namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Waits for SIGINT and SIGTERM on its own thread and requests a stop from there. Pending name resolution
// and connection attempts observe the token and abort with an interrupted error. The stop callbacks post to asio
// contexts and must not run inside a signal handler.
//----------------------------------------------------------------------------------------------------------------------
class Signal::Watcher
{
public:
    Watcher()
        : m_source()
        , m_context()
        , m_signals(m_context, SIGINT, SIGTERM)
        , m_worker()
    {
        m_signals.async_wait([this] (boost::system::error_code const& error, [[maybe_unused]] std::int32_t signal) {
            if (!error) { [[maybe_unused]] bool const requested = m_source.request_stop(); }
        });
        m_worker = std::jthread{ [this] () { m_context.run(); } };
    }

    ~Watcher() { m_context.stop(); }

    Watcher(Watcher const&) = delete;
    Watcher& operator=(Watcher const&) = delete;

    [[nodiscard]] std::stop_token GetToken() const { return m_source.get_token(); }

private:
    std::stop_source m_source;
    boost::asio::io_context m_context;
    boost::asio::signal_set m_signals;
    std::jthread m_worker;
};

//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    Signal::Watcher const watcher;

    Startup::Options options;
    switch (options.Parse(argc, argv)) {
        case Startup::ParseCode::Success: break;
        case Startup::ParseCode::ExitRequested: return 0;
        case Startup::ParseCode::Malformed: return 1;
    }

    LogUtils::InitializeLoggers(options.GetVerbosityLevel());
    auto const logger = spdlog::get(LogUtils::Name::Core.data());

    // Transports are supplied by the embedding tools, the factory is only asked for the link it would open.
    Link::Factory const factory{ nullptr, nullptr };
    auto& connection = options.GetConnectionOptions();

    try {
        if (options.UseManagement()) {
            auto const blueprint = factory.DraftManagement(connection, watcher.GetToken());
            logger->info("{}", Link::Describe(blueprint));
        } else {
            auto const blueprint = factory.Draft(connection, watcher.GetToken());
            logger->info("{}", Link::Describe(blueprint));
        }
    } catch (Core::Error const& exception) {
        logger->error("{} error: {}", Core::Error::CategoryToString(exception.GetCategory()), exception.what());
        return 1;
    } catch (std::exception const& exception) {
        logger->critical("An unexpected error occurred: {}", exception.what());
        return 1;
    }

    return 0;
}

//----------------------------------------------------------------------------------------------------------------------
