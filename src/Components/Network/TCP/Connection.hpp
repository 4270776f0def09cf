//----------------------------------------------------------------------------------------------------------------------
// File: Connection.hpp
// Description: A TCP connection to a KNXnet/IP server. The connection is established synchronously, a stop request
// aborts the attempt.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Interfaces/StreamConnection.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network::TCP {
//----------------------------------------------------------------------------------------------------------------------

class Connection;

//----------------------------------------------------------------------------------------------------------------------
} // Network::TCP namespace
//----------------------------------------------------------------------------------------------------------------------

class Network::TCP::Connection : public IStreamConnection
{
public:
    Connection();
    ~Connection() override;

    Connection(Connection const&) = delete;
    Connection& operator=(Connection const&) = delete;

    // Note: Binds to the local endpoint unless it is the unspecified address with a system assigned port. Failing to
    // connect raises a transport error, a stop request raises an interrupted error.
    [[nodiscard]] static std::shared_ptr<Connection> Establish(
        boost::asio::ip::tcp::endpoint const& local, boost::asio::ip::tcp::endpoint const& remote, std::stop_token token);

    // IStreamConnection {
    [[nodiscard]] bool IsConnected() const override;
    [[nodiscard]] boost::asio::ip::tcp::endpoint GetLocalEndpoint() const override;
    [[nodiscard]] boost::asio::ip::tcp::endpoint GetRemoteEndpoint() const override;
    void Send(std::span<std::uint8_t const> data, std::stop_token token) override;
    [[nodiscard]] std::size_t Receive(std::span<std::uint8_t> buffer, std::stop_token token) override;
    void Close() override;
    // } IStreamConnection

private:
    void Connect(
        boost::asio::ip::tcp::endpoint const& local, boost::asio::ip::tcp::endpoint const& remote, std::stop_token token);

    void CompleteTransfer(std::stop_token const& token);
    [[noreturn]] void ThrowTransferError(std::string_view action, boost::system::error_code const& error) const;

    mutable std::mutex m_mutex;
    std::mutex m_transferMutex; // Serializes Send and Receive, both drive the connection's context.
    boost::asio::io_context m_context;
    mutable boost::asio::ip::tcp::socket m_socket;
    boost::asio::ip::tcp::endpoint m_local;
    boost::asio::ip::tcp::endpoint m_remote;
};

//----------------------------------------------------------------------------------------------------------------------
