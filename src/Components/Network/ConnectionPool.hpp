//----------------------------------------------------------------------------------------------------------------------
// File: ConnectionPool.hpp
// Description: Shares TCP connections between the links of a process. Connections are keyed by their remote endpoint,
// a pooled connection is handed out again for as long as it reports being connected. The pool never closes the
// connections it holds.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Address.hpp"
#include "Interfaces/StreamConnection.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network {
//----------------------------------------------------------------------------------------------------------------------

class ConnectionPool;

using SharedConnectionPool = std::shared_ptr<ConnectionPool>;

//----------------------------------------------------------------------------------------------------------------------
} // Network namespace
//----------------------------------------------------------------------------------------------------------------------

class Network::ConnectionPool
{
public:
    using Connector = std::function<SharedStreamConnection(TcpEndpoint const&, TcpEndpoint const&, std::stop_token)>;

    ConnectionPool();
    explicit ConnectionPool(Connector const& connector);

    ConnectionPool(ConnectionPool const&) = delete;
    ConnectionPool& operator=(ConnectionPool const&) = delete;

    // Note: The process-wide instance, created on first use and kept until the process exits.
    [[nodiscard]] static SharedConnectionPool const& Default();

    // Note: One lock guards the whole acquisition, establishing a connection to one endpoint stalls acquisitions for
    // every other endpoint until it completes. A failed or interrupted establishment leaves the pool unchanged.
    [[nodiscard]] SharedStreamConnection Acquire(TcpEndpoint const& local, TcpEndpoint const& remote, std::stop_token token = {});

    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::mutex m_mutex;
    std::map<TcpEndpoint, SharedStreamConnection> m_connections;
    Connector m_connector;
    LogUtils::Logger m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
