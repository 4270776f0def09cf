//----------------------------------------------------------------------------------------------------------------------
// File: Connection.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Connection.hpp"
#include "AsioUtils.hpp"
#include "Components/Core/Error.hpp"
#include "Components/Network/Address.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <poll.h>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

Network::TCP::Connection::Connection()
    : m_mutex()
    , m_transferMutex()
    , m_context()
    , m_socket(m_context)
    , m_local()
    , m_remote()
{
}

//----------------------------------------------------------------------------------------------------------------------

Network::TCP::Connection::~Connection()
{
    Close();
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Network::TCP::Connection> Network::TCP::Connection::Establish(
    boost::asio::ip::tcp::endpoint const& local, boost::asio::ip::tcp::endpoint const& remote, std::stop_token token)
{
    auto const spConnection = std::make_shared<Connection>();
    spConnection->Connect(local, remote, token);
    return spConnection;
}

//----------------------------------------------------------------------------------------------------------------------
// Description: A connection is alive until the server closes or resets its side. Pending data does not count, a
// server may send a frame and close immediately after. The check never changes the socket's blocking mode.
//----------------------------------------------------------------------------------------------------------------------
bool Network::TCP::Connection::IsConnected() const
{
    std::scoped_lock lock{ m_mutex };
    if (!m_socket.is_open()) { return false; }

    ::pollfd descriptor{ .fd = m_socket.native_handle(), .events = POLLIN | POLLRDHUP, .revents = 0 };
    if (::poll(&descriptor, 1, 0) < 0) { return false; }

    constexpr auto Closed = POLLRDHUP | POLLHUP | POLLERR | POLLNVAL;
    return (descriptor.revents & Closed) == 0;
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::ip::tcp::endpoint Network::TCP::Connection::GetLocalEndpoint() const
{
    std::scoped_lock lock{ m_mutex };
    return m_local;
}

//----------------------------------------------------------------------------------------------------------------------

boost::asio::ip::tcp::endpoint Network::TCP::Connection::GetRemoteEndpoint() const
{
    std::scoped_lock lock{ m_mutex };
    return m_remote;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::TCP::Connection::Send(std::span<std::uint8_t const> data, std::stop_token token)
{
    std::scoped_lock lock{ m_transferMutex };
    if (token.stop_requested()) { throw Core::Error(Core::Error::Category::Interrupted, "send was interrupted"); }

    boost::system::error_code error;
    boost::asio::co_spawn(m_context, [&] () -> boost::asio::awaitable<void> {
        co_await boost::asio::async_write(
            m_socket, boost::asio::buffer(data.data(), data.size()),
            boost::asio::redirect_error(boost::asio::use_awaitable, error));
    }, boost::asio::detached);

    CompleteTransfer(token);

    if (IsInducedError(error)) { throw Core::Error(Core::Error::Category::Interrupted, "send was interrupted"); }
    if (error) { ThrowTransferError("failed to send to", error); }
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Network::TCP::Connection::Receive(std::span<std::uint8_t> buffer, std::stop_token token)
{
    std::scoped_lock lock{ m_transferMutex };
    if (token.stop_requested()) { throw Core::Error(Core::Error::Category::Interrupted, "receive was interrupted"); }

    boost::system::error_code error;
    std::size_t received = 0;
    boost::asio::co_spawn(m_context, [&] () -> boost::asio::awaitable<void> {
        received = co_await m_socket.async_read_some(
            boost::asio::buffer(buffer.data(), buffer.size()),
            boost::asio::redirect_error(boost::asio::use_awaitable, error));
    }, boost::asio::detached);

    CompleteTransfer(token);

    if (IsInducedError(error)) { throw Core::Error(Core::Error::Category::Interrupted, "receive was interrupted"); }
    if (error == boost::asio::error::eof) { return 0; }
    if (error) { ThrowTransferError("failed to receive from", error); }
    return received;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::TCP::Connection::Close()
{
    std::scoped_lock lock{ m_mutex };
    if (!m_socket.is_open()) { return; }

    boost::system::error_code error;
    m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, error);
    m_socket.close(error); // Errors are irrelevant at this point, the socket is released either way.
}

//----------------------------------------------------------------------------------------------------------------------

void Network::TCP::Connection::Connect(
    boost::asio::ip::tcp::endpoint const& local, boost::asio::ip::tcp::endpoint const& remote, std::stop_token token)
{
    auto const ThrowTransportError = [&remote] (std::string_view action, boost::system::error_code const& error) {
        std::ostringstream oss;
        oss << action << " " << Network::ToString(remote) << ": " << error.message();
        throw Core::Error(Core::Error::Category::Transport, oss.str());
    };

    if (token.stop_requested()) {
        throw Core::Error(Core::Error::Category::Interrupted, "connection establishment was interrupted");
    }

    std::scoped_lock lock{ m_mutex };

    boost::system::error_code error;
    m_socket.open(remote.protocol(), error);
    if (error) { ThrowTransportError("failed to open a socket for", error); }

    if (!local.address().is_unspecified() || local.port() != 0) {
        m_socket.bind(local, error);
        if (error) { ThrowTransportError("failed to bind the local endpoint for", error); }
    }

    boost::asio::co_spawn(m_context, [&] () -> boost::asio::awaitable<void> {
        co_await m_socket.async_connect(remote, boost::asio::redirect_error(boost::asio::use_awaitable, error));
    }, boost::asio::detached);

    RunUntilComplete(m_context, token, [this] () {
        boost::system::error_code ignored;
        m_socket.cancel(ignored);
    });

    if (token.stop_requested() || IsInducedError(error)) {
        boost::system::error_code ignored;
        m_socket.close(ignored);
        throw Core::Error(Core::Error::Category::Interrupted, "connection establishment was interrupted");
    }

    if (error) {
        boost::system::error_code ignored;
        m_socket.close(ignored);
        ThrowTransportError("failed to connect to", error);
    }

    m_local = m_socket.local_endpoint(error);
    m_remote = remote;
}

//----------------------------------------------------------------------------------------------------------------------

void Network::TCP::Connection::CompleteTransfer(std::stop_token const& token)
{
    RunUntilComplete(m_context, token, [this] () {
        boost::system::error_code ignored;
        m_socket.cancel(ignored);
    });
}

//----------------------------------------------------------------------------------------------------------------------

void Network::TCP::Connection::ThrowTransferError(std::string_view action, boost::system::error_code const& error) const
{
    std::ostringstream oss;
    oss << action << " " << Network::ToString(GetRemoteEndpoint()) << ": " << error.message();
    throw Core::Error(Core::Error::Category::Transport, oss.str());
}

//----------------------------------------------------------------------------------------------------------------------
