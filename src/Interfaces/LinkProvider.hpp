//----------------------------------------------------------------------------------------------------------------------
// File: LinkProvider.hpp
// Description: Constructs the concrete transports for drafted link requests. The requests that run over a pooled
// stream connection or an authenticated session receive it alongside the request.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "NetworkLink.hpp"
#include "SessionNegotiator.hpp"
#include "StreamConnection.hpp"
#include "Components/Link/Requests.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <memory>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class ILinkProvider
{
public:
    using CloseHandler = std::function<void(std::string_view reason)>;

    virtual ~ILinkProvider() = default;

    [[nodiscard]] virtual SharedNetworkLink Open(Link::SerialRequest const& request) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(Link::SerialCemiRequest const& request) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(Link::UsbRequest const& request) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(Link::BusMonitorRequest const& request) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(Link::RoutingRequest const& request) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(Link::SecureRoutingRequest const& request) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(Link::TunnelingRequest const& request) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(
        Link::TcpTunnelingRequest const& request, SharedStreamConnection const& spConnection) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(Link::SecureTunnelingRequest const& request) = 0;
    [[nodiscard]] virtual SharedNetworkLink Open(
        Link::SessionTunnelingRequest const& request, SharedSecureSession const& spSession) = 0;

    [[nodiscard]] virtual SharedManagementConnection Open(
        Link::ManagementRequest const& request, CloseHandler const& onClosed) = 0;
    [[nodiscard]] virtual SharedManagementConnection Open(
        Link::TcpManagementRequest const& request,
        SharedStreamConnection const& spConnection,
        CloseHandler const& onClosed) = 0;
    [[nodiscard]] virtual SharedManagementConnection Open(
        Link::SecureManagementRequest const& request, CloseHandler const& onClosed) = 0;
    [[nodiscard]] virtual SharedManagementConnection Open(
        Link::SessionManagementRequest const& request,
        SharedSecureSession const& spSession,
        CloseHandler const& onClosed) = 0;
};

using SharedLinkProvider = std::shared_ptr<ILinkProvider>;

//----------------------------------------------------------------------------------------------------------------------
