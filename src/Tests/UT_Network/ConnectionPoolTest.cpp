//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Core/Error.hpp"
#include "Components/Network/ConnectionPool.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionPoolSuite, ReuseConnectionTest)
{
    Network::Test::CountingConnector const connector;
    Network::ConnectionPool pool{ connector };

    auto const spFirst = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint);
    ASSERT_TRUE(spFirst);
    EXPECT_EQ(spFirst->GetRemoteEndpoint(), Network::Test::RemoteEndpoint);

    auto const spSecond = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint);
    EXPECT_EQ(spFirst, spSecond);
    EXPECT_EQ(connector.GetCount(), std::uint32_t{ 1 });
    EXPECT_EQ(pool.Size(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionPoolSuite, DistinctRemotesTest)
{
    Network::Test::CountingConnector const connector;
    Network::ConnectionPool pool{ connector };

    auto const spFirst = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint);
    auto const spSecond = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::OtherRemoteEndpoint);
    EXPECT_NE(spFirst, spSecond);
    EXPECT_EQ(connector.GetCount(), std::uint32_t{ 2 });
    EXPECT_EQ(pool.Size(), std::size_t{ 2 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionPoolSuite, ReplaceClosedConnectionTest)
{
    Network::Test::CountingConnector const connector;
    Network::ConnectionPool pool{ connector };

    auto const spFirst = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint);
    spFirst->Close();

    auto const spSecond = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint);
    EXPECT_NE(spFirst, spSecond);
    EXPECT_TRUE(spSecond->IsConnected());
    EXPECT_EQ(connector.GetCount(), std::uint32_t{ 2 });
    EXPECT_EQ(pool.Size(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionPoolSuite, FailedConnectorTest)
{
    Network::Test::CountingConnector const connector;
    bool fail = false;
    Network::ConnectionPool pool{
        [&] (Network::TcpEndpoint const& local, Network::TcpEndpoint const& remote, std::stop_token token) {
            if (fail) { throw Core::Error(Core::Error::Category::Transport, "failed to connect"); }
            return connector(local, remote, token);
        } };

    auto const spFirst = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint);
    spFirst->Close();

    fail = true;
    EXPECT_THROW(
        [[maybe_unused]] auto const spConnection = pool.Acquire(
            Network::Test::LocalEndpoint, Network::Test::OtherRemoteEndpoint), Core::Error);
    EXPECT_THROW(
        [[maybe_unused]] auto const spConnection = pool.Acquire(
            Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint), Core::Error);
    EXPECT_EQ(pool.Size(), std::size_t{ 1 });

    fail = false;
    auto const spSecond = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint);
    EXPECT_NE(spFirst, spSecond);
    EXPECT_EQ(pool.Size(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionPoolSuite, NullConnectionTest)
{
    Network::ConnectionPool pool{
        [] (Network::TcpEndpoint const&, Network::TcpEndpoint const&, std::stop_token) -> SharedStreamConnection {
            return nullptr;
        } };

    EXPECT_THROW(
        [[maybe_unused]] auto const spConnection = pool.Acquire(
            Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint), std::runtime_error);
    EXPECT_EQ(pool.Size(), std::size_t{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionPoolSuite, MissingConnectorTest)
{
    EXPECT_THROW(Network::ConnectionPool{ Network::ConnectionPool::Connector{} }, std::invalid_argument);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionPoolSuite, ConcurrentAcquireTest)
{
    constexpr std::size_t Threads = 8;

    Network::Test::CountingConnector const connector;
    Network::ConnectionPool pool{ connector };

    std::vector<SharedStreamConnection> connections(Threads);
    {
        std::vector<std::jthread> threads;
        for (std::size_t idx = 0; idx < Threads; ++idx) {
            threads.emplace_back([&pool, &connections, idx] () {
                connections[idx] = pool.Acquire(Network::Test::LocalEndpoint, Network::Test::RemoteEndpoint);
            });
        }
    }

    EXPECT_EQ(connector.GetCount(), std::uint32_t{ 1 });
    for (auto const& spConnection : connections) { EXPECT_EQ(spConnection, connections.front()); }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionPoolSuite, DefaultInstanceTest)
{
    auto const& spFirst = Network::ConnectionPool::Default();
    auto const& spSecond = Network::ConnectionPool::Default();
    ASSERT_TRUE(spFirst);
    EXPECT_EQ(spFirst, spSecond);
}

//----------------------------------------------------------------------------------------------------------------------
