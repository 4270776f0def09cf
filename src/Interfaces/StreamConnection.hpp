//----------------------------------------------------------------------------------------------------------------------
// File: StreamConnection.hpp
// Description: A connected stream socket that can be shared between the links opened over it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/ip/tcp.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <span>
#include <stop_token>
//----------------------------------------------------------------------------------------------------------------------

class IStreamConnection
{
public:
    virtual ~IStreamConnection() = default;

    [[nodiscard]] virtual bool IsConnected() const = 0;
    [[nodiscard]] virtual boost::asio::ip::tcp::endpoint GetLocalEndpoint() const = 0;
    [[nodiscard]] virtual boost::asio::ip::tcp::endpoint GetRemoteEndpoint() const = 0;

    // Note: Both calls block until the transfer completes. A stop request aborts the transfer with an interrupted
    // error. Receive returns zero once the peer has closed its side of the stream.
    virtual void Send(std::span<std::uint8_t const> data, std::stop_token token) = 0;
    [[nodiscard]] virtual std::size_t Receive(std::span<std::uint8_t> buffer, std::stop_token token) = 0;

    virtual void Close() = 0;
};

using SharedStreamConnection = std::shared_ptr<IStreamConnection>;

//----------------------------------------------------------------------------------------------------------------------
