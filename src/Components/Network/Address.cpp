//----------------------------------------------------------------------------------------------------------------------
// File: Address.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Address.hpp"
#include "TCP/AsioUtils.hpp"
#include "Components/Core/Error.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstring>
#include <memory>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using InterfaceList = std::unique_ptr<ifaddrs, decltype(&freeifaddrs)>;

[[nodiscard]] bool IsAssignedAddress(sockaddr const& socket, Network::IpAddress const& address);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Network::IpAddress Network::ResolveHost(std::string_view host, std::stop_token token)
{
    boost::system::error_code error;
    auto const address = boost::asio::ip::make_address(host, error);
    if (!error) { return address; }

    if (token.stop_requested()) {
        throw Core::Error(Core::Error::Category::Interrupted, "host resolution was interrupted");
    }

    boost::asio::io_context context;
    boost::asio::ip::tcp::resolver resolver{ context };
    boost::asio::ip::tcp::resolver::results_type resolved;

    error.clear();
    boost::asio::co_spawn(context, [&] () -> boost::asio::awaitable<void> {
        resolved = co_await resolver.async_resolve(
            std::string{ host }, "", boost::asio::redirect_error(boost::asio::use_awaitable, error));
    }, boost::asio::detached);

    TCP::RunUntilComplete(context, token, [&resolver] () { resolver.cancel(); });

    if (token.stop_requested() || TCP::IsInducedError(error)) {
        throw Core::Error(Core::Error::Category::Interrupted, "host resolution was interrupted");
    }

    if (error || resolved.empty()) {
        std::ostringstream oss;
        oss << "failed to read IP host " << host;
        throw Core::Error(Core::Error::Category::Resolution, oss.str());
    }

    return resolved.begin()->endpoint().address();
}

//----------------------------------------------------------------------------------------------------------------------

Network::TcpEndpoint Network::CreateLocalEndpoint(
    OptionalIpAddress const& optAddress, std::optional<std::uint16_t> const& optPort)
{
    auto const address = optAddress.value_or(boost::asio::ip::address_v4::any());
    return TcpEndpoint{ address, optPort.value_or(0) };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Network::FindInterface(IpAddress const& address)
{
    ifaddrs* pNetworkAddresses = nullptr;
    if (getifaddrs(&pNetworkAddresses) != 0) {
        std::ostringstream oss;
        oss << "getting network interface of " << ToString(address);
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }

    local::InterfaceList const upNetworkAddresses{ pNetworkAddresses, &freeifaddrs };
    for (auto pAddress = upNetworkAddresses.get(); pAddress; pAddress = pAddress->ifa_next) {
        if (pAddress->ifa_addr && local::IsAssignedAddress(*pAddress->ifa_addr, address)) {
            return std::string{ pAddress->ifa_name };
        }
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::string Network::ToString(IpAddress const& address)
{
    return address.to_string();
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsAssignedAddress(sockaddr const& socket, Network::IpAddress const& address)
{
    if (socket.sa_family == AF_INET && address.is_v4()) {
        auto const& ipv4 = reinterpret_cast<sockaddr_in const&>(socket);
        auto const bytes = address.to_v4().to_bytes();
        return std::memcmp(&ipv4.sin_addr, bytes.data(), bytes.size()) == 0;
    }

    if (socket.sa_family == AF_INET6 && address.is_v6()) {
        auto const& ipv6 = reinterpret_cast<sockaddr_in6 const&>(socket);
        auto const bytes = address.to_v6().to_bytes();
        return std::memcmp(&ipv6.sin6_addr, bytes.data(), bytes.size()) == 0;
    }

    return false;
}

//----------------------------------------------------------------------------------------------------------------------
