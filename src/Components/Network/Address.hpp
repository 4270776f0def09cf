//----------------------------------------------------------------------------------------------------------------------
// File: Address.hpp
// Description: IP address helpers for KNXnet/IP links: host name resolution, the local endpoint a link binds to and
// the lookup of the network interface owning a local address.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Network {
//----------------------------------------------------------------------------------------------------------------------

using IpAddress = boost::asio::ip::address;
using OptionalIpAddress = std::optional<IpAddress>;
using TcpEndpoint = boost::asio::ip::tcp::endpoint;
using UdpEndpoint = boost::asio::ip::udp::endpoint;

// Note: Accepts a numeric address or a host name. An unresolvable host raises a resolution error, a stop request
// raises an interrupted error.
[[nodiscard]] IpAddress ResolveHost(std::string_view host, std::stop_token token = {});

// Note: Defaults to the unspecified IPv4 address and a system assigned port.
[[nodiscard]] TcpEndpoint CreateLocalEndpoint(
    OptionalIpAddress const& optAddress, std::optional<std::uint16_t> const& optPort);

// Note: The name of the network interface the address is assigned to, if any.
[[nodiscard]] std::optional<std::string> FindInterface(IpAddress const& address);

[[nodiscard]] std::string ToString(IpAddress const& address);

template<typename EndpointType>
[[nodiscard]] std::string ToString(EndpointType const& endpoint);

//----------------------------------------------------------------------------------------------------------------------
} // Network namespace
//----------------------------------------------------------------------------------------------------------------------

template<typename EndpointType>
std::string Network::ToString(EndpointType const& endpoint)
{
    auto const& address = endpoint.address();
    std::string result = (address.is_v6()) ? "[" + ToString(address) + "]" : ToString(address);
    result.append(":").append(std::to_string(endpoint.port()));
    return result;
}

//----------------------------------------------------------------------------------------------------------------------
