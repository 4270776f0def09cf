//----------------------------------------------------------------------------------------------------------------------
// File: Requests.hpp
// Description: The requests handed to a link provider. Each request describes one link variant completely, a drafted
// blueprint holds exactly one of them.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Medium/IndividualAddress.hpp"
#include "Components/Medium/Settings.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Security/Secret.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Link {
//----------------------------------------------------------------------------------------------------------------------

enum class Variant : std::uint32_t {
    Serial,
    SerialCemi,
    Usb,
    BusMonitor,
    Routing,
    SecureRouting,
    Tunneling,
    TcpTunneling,
    SecureTunneling,
    SessionTunneling,
    Management,
    TcpManagement,
    SecureManagement,
    SessionManagement
};

[[nodiscard]] std::string_view VariantToString(Variant variant);

// Note: A serial port is given either by its number or by its device name.
using SerialPort = std::variant<std::int32_t, std::string>;

struct SerialRequest;
struct SerialCemiRequest;
struct UsbRequest;
struct BusMonitorRequest;
struct RoutingRequest;
struct SecureRoutingRequest;
struct TunnelingRequest;
struct TcpTunnelingRequest;
struct SecureTunnelingRequest;
struct SessionTunnelingRequest;

struct ManagementRequest;
struct TcpManagementRequest;
struct SecureManagementRequest;
struct SessionManagementRequest;

//----------------------------------------------------------------------------------------------------------------------
} // Link namespace
//----------------------------------------------------------------------------------------------------------------------

struct Link::SerialRequest
{
    static constexpr Variant Type = Variant::Serial;
    SerialPort port;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::SerialCemiRequest
{
    static constexpr Variant Type = Variant::SerialCemi;
    std::string port;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::UsbRequest
{
    static constexpr Variant Type = Variant::Usb;
    std::string device;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::BusMonitorRequest
{
    static constexpr Variant Type = Variant::BusMonitor;
    std::string port;
    std::vector<Medium::IndividualAddress> acknowledge;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::RoutingRequest
{
    static constexpr Variant Type = Variant::Routing;
    Network::IpAddress local;
    Network::IpAddress group;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::SecureRoutingRequest
{
    static constexpr Variant Type = Variant::SecureRouting;
    static constexpr std::chrono::milliseconds DefaultSyncInterval{ 2000 };

    // Note: Unset when the link should use the system's default multicast interface.
    std::optional<std::string> optNetworkInterface;
    Network::IpAddress group;
    Security::Secret groupKey;
    std::chrono::milliseconds syncInterval;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::TunnelingRequest
{
    static constexpr Variant Type = Variant::Tunneling;
    Network::UdpEndpoint local;
    Network::UdpEndpoint remote;
    bool nat;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::TcpTunnelingRequest
{
    static constexpr Variant Type = Variant::TcpTunneling;
    Network::TcpEndpoint local;
    Network::TcpEndpoint remote;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::SecureTunnelingRequest
{
    static constexpr Variant Type = Variant::SecureTunneling;
    Network::UdpEndpoint local;
    Network::UdpEndpoint remote;
    bool nat;
    std::uint8_t user;
    Security::Secret userKey;
    Security::Secret deviceAuthentication;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::SessionTunnelingRequest
{
    static constexpr Variant Type = Variant::SessionTunneling;
    Network::TcpEndpoint local;
    Network::TcpEndpoint remote;
    std::uint8_t user;
    Security::Secret userKey;
    Security::Secret deviceAuthentication;
    Medium::SharedSettings spMedium;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::ManagementRequest
{
    static constexpr Variant Type = Variant::Management;
    Network::UdpEndpoint local;
    Network::UdpEndpoint remote;
    bool nat;
    bool emulateWriteEnable;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::TcpManagementRequest
{
    static constexpr Variant Type = Variant::TcpManagement;
    Network::TcpEndpoint local;
    Network::TcpEndpoint remote;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::SecureManagementRequest
{
    static constexpr Variant Type = Variant::SecureManagement;
    Network::UdpEndpoint local;
    Network::UdpEndpoint remote;
    bool nat;
    Security::Secret managementKey;
    Security::Secret deviceAuthentication;
};

//----------------------------------------------------------------------------------------------------------------------

struct Link::SessionManagementRequest
{
    static constexpr Variant Type = Variant::SessionManagement;
    // Note: Local device management sessions always run as the management user.
    static constexpr std::uint8_t ManagementUser = 1;

    Network::TcpEndpoint local;
    Network::TcpEndpoint remote;
    std::uint8_t user;
    Security::Secret managementKey;
    Security::Secret deviceAuthentication;
};

//----------------------------------------------------------------------------------------------------------------------
namespace Link {
//----------------------------------------------------------------------------------------------------------------------

using Blueprint = std::variant<
    SerialRequest, SerialCemiRequest, UsbRequest, BusMonitorRequest, RoutingRequest, SecureRoutingRequest,
    TunnelingRequest, TcpTunnelingRequest, SecureTunnelingRequest, SessionTunnelingRequest>;

using ManagementBlueprint = std::variant<
    ManagementRequest, TcpManagementRequest, SecureManagementRequest, SessionManagementRequest>;

// Note: A one line summary of the drafted request. Key material is never part of the summary.
[[nodiscard]] std::string Describe(Blueprint const& blueprint);
[[nodiscard]] std::string Describe(ManagementBlueprint const& blueprint);

template<typename BlueprintType>
[[nodiscard]] Variant GetVariant(BlueprintType const& blueprint)
{
    return std::visit([] (auto const& request) -> Variant {
        return std::remove_cvref_t<decltype(request)>::Type;
    }, blueprint);
}

//----------------------------------------------------------------------------------------------------------------------
} // Link namespace
//----------------------------------------------------------------------------------------------------------------------
