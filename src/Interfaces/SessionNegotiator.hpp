//----------------------------------------------------------------------------------------------------------------------
// File: SessionNegotiator.hpp
// Description: KNX IP Secure sessions established over a shared stream connection. Several sessions, one per
// tunneling user, may run over the same connection.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StreamConnection.hpp"
#include "Components/Security/Secret.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <stop_token>
//----------------------------------------------------------------------------------------------------------------------

class ISecureSession
{
public:
    virtual ~ISecureSession() = default;

    [[nodiscard]] virtual std::uint8_t GetUser() const = 0;
    [[nodiscard]] virtual SharedStreamConnection GetConnection() const = 0;

    virtual void Close() = 0;
};

using SharedSecureSession = std::shared_ptr<ISecureSession>;

//----------------------------------------------------------------------------------------------------------------------

class ISessionNegotiator
{
public:
    virtual ~ISessionNegotiator() = default;

    // Note: Blocks until the session has been authenticated. Implementations are expected to abandon the handshake
    // when a stop is requested through the token.
    [[nodiscard]] virtual SharedSecureSession NewSecureSession(
        SharedStreamConnection const& spConnection,
        std::uint8_t user,
        Security::Secret const& userKey,
        Security::Secret const& deviceAuthentication,
        std::stop_token token) = 0;
};

using SharedSessionNegotiator = std::shared_ptr<ISessionNegotiator>;

//----------------------------------------------------------------------------------------------------------------------
