//----------------------------------------------------------------------------------------------------------------------
// File: Requests.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Requests.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

template<typename RequestType>
std::string DescribeRequest(RequestType const& request);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string_view Link::VariantToString(Variant variant)
{
    switch (variant) {
        case Variant::Serial: return "FT1.2 serial";
        case Variant::SerialCemi: return "FT1.2 serial (cEMI)";
        case Variant::Usb: return "USB";
        case Variant::BusMonitor: return "TP-UART";
        case Variant::Routing: return "KNXnet/IP routing";
        case Variant::SecureRouting: return "KNX IP Secure routing";
        case Variant::Tunneling: return "KNXnet/IP tunneling";
        case Variant::TcpTunneling: return "KNXnet/IP tunneling (TCP)";
        case Variant::SecureTunneling: return "KNX IP Secure tunneling (UDP)";
        case Variant::SessionTunneling: return "KNX IP Secure tunneling (TCP session)";
        case Variant::Management: return "local device management";
        case Variant::TcpManagement: return "local device management (TCP)";
        case Variant::SecureManagement: return "KNX IP Secure local device management (UDP)";
        case Variant::SessionManagement: return "KNX IP Secure local device management (TCP session)";
        default: break;
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

std::string Link::Describe(Blueprint const& blueprint)
{
    return std::visit([] (auto const& request) { return local::DescribeRequest(request); }, blueprint);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Link::Describe(ManagementBlueprint const& blueprint)
{
    return std::visit([] (auto const& request) { return local::DescribeRequest(request); }, blueprint);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename RequestType>
std::string local::DescribeRequest(RequestType const& request)
{
    std::ostringstream oss;
    oss << Link::VariantToString(RequestType::Type);

    if constexpr (requires { request.remote; }) {
        oss << " from " << Network::ToString(request.local) << " to " << Network::ToString(request.remote);
    } else if constexpr (requires { request.group; }) {
        oss << " on " << Network::ToString(request.group);
        if constexpr (requires { request.optNetworkInterface; }) {
            oss << " (" << request.optNetworkInterface.value_or("default interface") << ")";
        }
    } else if constexpr (requires { request.device; }) {
        oss << " device " << request.device;
    } else if constexpr (std::is_same_v<RequestType, Link::SerialRequest>) {
        std::visit(VariantVisitor{
            [&oss] (std::int32_t number) { oss << " port " << number; },
            [&oss] (std::string const& name) { oss << " port " << name; }
        }, request.port);
    } else {
        oss << " port " << request.port;
    }

    if constexpr (requires { request.nat; }) {
        if (request.nat) { oss << ", NAT"; }
    }

    if constexpr (requires { request.user; }) {
        oss << ", user " << static_cast<std::uint32_t>(request.user);
    }

    if constexpr (requires { request.deviceAuthentication; }) {
        oss << (request.deviceAuthentication.IsEmpty() ? ", no" : ", with") << " device authentication";
    }

    if constexpr (requires { request.syncInterval; }) {
        oss << ", sync interval " << request.syncInterval.count() << " ms";
    }

    if constexpr (requires { request.spMedium; }) {
        if (request.spMedium) {
            oss << ", " << request.spMedium->GetMediumString();
            oss << " " << request.spMedium->GetDeviceAddress().ToString();
        }
    }

    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------
