//----------------------------------------------------------------------------------------------------------------------
// File: ConnectionPool.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "ConnectionPool.hpp"
#include "TCP/Connection.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

Network::ConnectionPool::ConnectionPool()
    : ConnectionPool(&TCP::Connection::Establish)
{
}

//----------------------------------------------------------------------------------------------------------------------

Network::ConnectionPool::ConnectionPool(Connector const& connector)
    : m_mutex()
    , m_connections()
    , m_connector(connector)
    , m_logger(spdlog::get(LogUtils::Name::Network.data()))
{
    assert(m_logger);
    if (!m_connector) { throw std::invalid_argument("A connection pool requires a connector!"); }
}

//----------------------------------------------------------------------------------------------------------------------

Network::SharedConnectionPool const& Network::ConnectionPool::Default()
{
    static SharedConnectionPool const spConnectionPool = std::make_shared<ConnectionPool>();
    return spConnectionPool;
}

//----------------------------------------------------------------------------------------------------------------------

SharedStreamConnection Network::ConnectionPool::Acquire(
    TcpEndpoint const& local, TcpEndpoint const& remote, std::stop_token token)
{
    std::scoped_lock lock{ m_mutex };

    if (auto const itr = m_connections.find(remote); itr != m_connections.end()) {
        if (itr->second && itr->second->IsConnected()) {
            m_logger->debug("Reusing the pooled connection to {}.", ToString(remote));
            return itr->second;
        }
        m_logger->debug("The pooled connection to {} has been closed, replacing it.", ToString(remote));
    }

    auto spConnection = m_connector(local, remote, token);
    if (!spConnection) { throw std::runtime_error("The connector failed to provide a connection!"); }

    m_logger->debug("Established a connection to {}.", ToString(remote));
    m_connections.insert_or_assign(remote, spConnection);
    return spConnection;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Network::ConnectionPool::Size() const
{
    std::scoped_lock lock{ m_mutex };
    return m_connections.size();
}

//----------------------------------------------------------------------------------------------------------------------
