//----------------------------------------------------------------------------------------------------------------------
// File: Factory.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Factory.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/ConnectionOptions.hpp"
#include "Components/Core/Error.hpp"
#include "Components/Medium/DomainAddress.hpp"
#include "Components/Medium/Settings.hpp"
#include "Utilities/VariantVisitor.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <charconv>
#include <sstream>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

void ApplyDeviceAddress(Configuration::ConnectionOptions const& options);

[[nodiscard]] Network::UdpEndpoint ToDatagramEndpoint(Network::TcpEndpoint const& endpoint);

[[noreturn]] void ThrowMissingCredential(std::string_view role, Configuration::ConnectionOptions const& options);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Link::Factory::Factory(
    SharedLinkProvider const& spProvider,
    SharedSessionNegotiator const& spNegotiator,
    Network::SharedConnectionPool const& spConnectionPool,
    Security::SharedContext const& spContext,
    NameResolver const& resolver)
    : m_spProvider(spProvider)
    , m_spNegotiator(spNegotiator)
    , m_spConnectionPool(spConnectionPool)
    , m_spContext(spContext)
    , m_resolver(resolver)
    , m_keyringLookup(spContext)
    , m_credentials(spContext)
    , m_logger(spdlog::get(LogUtils::Name::Link.data()))
{
    assert(m_logger);
    if (!m_spConnectionPool) { throw std::invalid_argument("A link factory requires a connection pool!"); }
    if (!m_resolver) { throw std::invalid_argument("A link factory requires a name resolver!"); }
}

//----------------------------------------------------------------------------------------------------------------------

std::span<Link::Factory::Route const> Link::Factory::GetRoutes()
{
    using Configuration::ConnectionOptions;
    using Configuration::Transport;

    static std::array<Route, 5> const routes = {
        Route{
            "Serial",
            [] (ConnectionOptions const& options) { return options.HasTransport(Transport::Serial); },
            &Factory::DraftSerial },
        Route{
            "SerialCemi",
            [] (ConnectionOptions const& options) { return options.HasTransport(Transport::SerialCemi); },
            &Factory::DraftSerialCemi },
        Route{
            "Usb",
            [] (ConnectionOptions const& options) { return options.HasTransport(Transport::Usb); },
            &Factory::DraftUsb },
        Route{
            "BusMonitor",
            [] (ConnectionOptions const& options) { return options.HasTransport(Transport::BusMonitor); },
            &Factory::DraftBusMonitor },
        Route{
            "Ip",
            [] (ConnectionOptions const&) { return true; },
            &Factory::DraftIp },
    };

    return routes;
}

//----------------------------------------------------------------------------------------------------------------------

Link::Factory::Route const& Link::Factory::Select(Configuration::ConnectionOptions const& options)
{
    auto const routes = GetRoutes();
    for (auto const& route : routes) {
        if (route.guard(options)) { return route; }
    }
    return routes.back();
}

//----------------------------------------------------------------------------------------------------------------------

Link::Blueprint Link::Factory::Draft(Configuration::ConnectionOptions& options, std::stop_token token) const
{
    m_keyringLookup.Run(options);
    Medium::ApplyDomainAddress(options.GetDomain(), *options.GetMedium());

    auto const& route = Select(options);
    m_logger->debug("Selected the {} route for \"{}\".", route.name, options.GetHost());

    auto blueprint = std::invoke(route.drafter, this, options, token);
    m_logger->debug("Drafted a {} link.", VariantToString(GetVariant(blueprint)));
    return blueprint;
}

//----------------------------------------------------------------------------------------------------------------------

SharedNetworkLink Link::Factory::Build(Blueprint const& blueprint, std::stop_token token) const
{
    if (!m_spProvider) { throw std::runtime_error("A link factory without a link provider can only draft links!"); }

    auto const spLink = std::visit(VariantVisitor{
        [&] (TcpTunnelingRequest const& request) -> SharedNetworkLink {
            auto const spConnection = AcquireConnection(request.local, request.remote, token);
            return m_spProvider->Open(request, spConnection);
        },
        [&] (SessionTunnelingRequest const& request) -> SharedNetworkLink {
            auto const spSession = NegotiateSession(
                request.local, request.remote, request.user, request.userKey, request.deviceAuthentication, token);
            return m_spProvider->Open(request, spSession);
        },
        [&] (auto const& request) -> SharedNetworkLink { return m_spProvider->Open(request); }
    }, blueprint);

    auto const variant = VariantToString(GetVariant(blueprint));
    if (!spLink) {
        std::ostringstream oss;
        oss << "The link provider failed to open a " << variant << " link!";
        throw std::runtime_error(oss.str());
    }

    m_logger->info("Opened a {} link ({}).", variant, spLink->GetName());
    return spLink;
}

//----------------------------------------------------------------------------------------------------------------------

SharedNetworkLink Link::Factory::CreateNetworkLink(
    Configuration::ConnectionOptions& options, std::stop_token token) const
{
    return Build(Draft(options, token), token);
}

//----------------------------------------------------------------------------------------------------------------------

Link::ManagementBlueprint Link::Factory::DraftManagement(
    Configuration::ConnectionOptions& options, std::stop_token token) const
{
    m_keyringLookup.Run(options);

    auto const localEndpoint = Network::CreateLocalEndpoint(options.GetLocalHost(), options.GetLocalPort());
    Network::TcpEndpoint const remoteEndpoint{ m_resolver(options.GetHost(), token), options.GetPort() };

    auto const blueprint = [&] () -> ManagementBlueprint {
        if (auto const optManagementKey = m_credentials.ResolveManagementKey(options); optManagementKey) {
            auto const deviceAuthentication = m_credentials.ResolveDeviceAuthentication(options);
            if (options.UseUdp()) {
                return SecureManagementRequest{
                    .local = local::ToDatagramEndpoint(localEndpoint),
                    .remote = local::ToDatagramEndpoint(remoteEndpoint),
                    .nat = options.UseNat(),
                    .managementKey = *optManagementKey,
                    .deviceAuthentication = deviceAuthentication };
            }

            return SessionManagementRequest{
                .local = localEndpoint,
                .remote = remoteEndpoint,
                .user = SessionManagementRequest::ManagementUser,
                .managementKey = *optManagementKey,
                .deviceAuthentication = deviceAuthentication };
        }

        if (options.HasSecureIntent()) { local::ThrowMissingCredential("management key", options); }

        if (options.UseTcp()) { return TcpManagementRequest{ .local = localEndpoint, .remote = remoteEndpoint }; }

        return ManagementRequest{
            .local = local::ToDatagramEndpoint(localEndpoint),
            .remote = local::ToDatagramEndpoint(remoteEndpoint),
            .nat = options.UseNat(),
            .emulateWriteEnable = options.EmulateWriteEnable() };
    }();

    m_logger->debug(
        "Drafted a {} connection to {}.", VariantToString(GetVariant(blueprint)), Network::ToString(remoteEndpoint));
    return blueprint;
}

//----------------------------------------------------------------------------------------------------------------------

SharedManagementConnection Link::Factory::BuildManagement(
    ManagementBlueprint const& blueprint, ILinkProvider::CloseHandler const& onClosed, std::stop_token token) const
{
    if (!m_spProvider) { throw std::runtime_error("A link factory without a link provider can only draft links!"); }

    auto const spConnection = std::visit(VariantVisitor{
        [&] (TcpManagementRequest const& request) -> SharedManagementConnection {
            auto const spStream = AcquireConnection(request.local, request.remote, token);
            return m_spProvider->Open(request, spStream, onClosed);
        },
        [&] (SessionManagementRequest const& request) -> SharedManagementConnection {
            auto const spSession = NegotiateSession(
                request.local, request.remote, request.user, request.managementKey, request.deviceAuthentication,
                token);
            return m_spProvider->Open(request, spSession, onClosed);
        },
        [&] (auto const& request) -> SharedManagementConnection { return m_spProvider->Open(request, onClosed); }
    }, blueprint);

    auto const variant = VariantToString(GetVariant(blueprint));
    if (!spConnection) {
        std::ostringstream oss;
        oss << "The link provider failed to open a " << variant << " connection!";
        throw std::runtime_error(oss.str());
    }

    m_logger->info("Opened a {} connection ({}).", variant, spConnection->GetName());
    return spConnection;
}

//----------------------------------------------------------------------------------------------------------------------

SharedManagementConnection Link::Factory::CreateManagementConnection(
    Configuration::ConnectionOptions& options, ILinkProvider::CloseHandler const& onClosed, std::stop_token token) const
{
    return BuildManagement(DraftManagement(options, token), onClosed, token);
}

//----------------------------------------------------------------------------------------------------------------------

SharedStreamConnection Link::Factory::AcquireConnection(
    Network::TcpEndpoint const& localEndpoint, Network::TcpEndpoint const& remoteEndpoint, std::stop_token token) const
{
    return m_spConnectionPool->Acquire(localEndpoint, remoteEndpoint, token);
}

//----------------------------------------------------------------------------------------------------------------------

Link::Blueprint Link::Factory::DraftSerial(Configuration::ConnectionOptions& options, std::stop_token) const
{
    auto const& host = options.GetHost();

    // The host names the serial port by number when it is a plain decimal, otherwise by device name.
    SerialPort port = host;
    std::int32_t number = 0;
    auto const [end, error] = std::from_chars(host.data(), host.data() + host.size(), number);
    if (!host.empty() && error == std::errc{} && end == host.data() + host.size()) { port = number; }

    return SerialRequest{ .port = port, .spMedium = options.GetMedium() };
}

//----------------------------------------------------------------------------------------------------------------------

Link::Blueprint Link::Factory::DraftSerialCemi(Configuration::ConnectionOptions& options, std::stop_token) const
{
    return SerialCemiRequest{ .port = options.GetHost(), .spMedium = options.GetMedium() };
}

//----------------------------------------------------------------------------------------------------------------------

Link::Blueprint Link::Factory::DraftUsb(Configuration::ConnectionOptions& options, std::stop_token) const
{
    return UsbRequest{ .device = options.GetHost(), .spMedium = options.GetMedium() };
}

//----------------------------------------------------------------------------------------------------------------------

Link::Blueprint Link::Factory::DraftBusMonitor(Configuration::ConnectionOptions& options, std::stop_token) const
{
    local::ApplyDeviceAddress(options);
    return BusMonitorRequest{ .port = options.GetHost(), .acknowledge = {}, .spMedium = options.GetMedium() };
}

//----------------------------------------------------------------------------------------------------------------------

Link::Blueprint Link::Factory::DraftIp(Configuration::ConnectionOptions& options, std::stop_token token) const
{
    local::ApplyDeviceAddress(options);

    auto const localEndpoint = Network::CreateLocalEndpoint(options.GetLocalHost(), options.GetLocalPort());
    auto const address = m_resolver(options.GetHost(), token);
    if (address.is_multicast()) { return DraftRouting(options, localEndpoint, address); }

    return DraftTunneling(options, localEndpoint, Network::TcpEndpoint{ address, options.GetPort() });
}

//----------------------------------------------------------------------------------------------------------------------

Link::Blueprint Link::Factory::DraftRouting(
    Configuration::ConnectionOptions const& options,
    Network::TcpEndpoint const& localEndpoint,
    Network::IpAddress const& group) const
{
    auto const& spMedium = options.GetMedium();
    if (spMedium->GetDeviceAddress() == Medium::Settings::BackboneRouter) {
        spMedium->SetDeviceAddress(Medium::Settings::UnregisteredDevice);
    }

    auto const& optGroupKey = options.GetGroupKey();
    if (!optGroupKey) {
        return RoutingRequest{ .local = localEndpoint.address(), .group = group, .spMedium = spMedium };
    }

    auto const& address = localEndpoint.address();
    auto optNetworkInterface = Network::FindInterface(address);
    if (!optNetworkInterface && !address.is_unspecified()) {
        std::ostringstream oss;
        oss << Network::ToString(address) << " is not assigned to a network interface";
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }

    return SecureRoutingRequest{
        .optNetworkInterface = optNetworkInterface,
        .group = group,
        .groupKey = *optGroupKey,
        .syncInterval = SecureRoutingRequest::DefaultSyncInterval,
        .spMedium = spMedium };
}

//----------------------------------------------------------------------------------------------------------------------

Link::Blueprint Link::Factory::DraftTunneling(
    Configuration::ConnectionOptions& options,
    Network::TcpEndpoint const& localEndpoint,
    Network::TcpEndpoint const& remoteEndpoint) const
{
    auto const& spMedium = options.GetMedium();

    if (auto const optUserKey = m_credentials.ResolveUserKey(options); optUserKey) {
        auto const deviceAuthentication = m_credentials.ResolveDeviceAuthentication(options);
        auto const user = options.GetUser();

        if (options.UseUdp()) {
            return SecureTunnelingRequest{
                .local = local::ToDatagramEndpoint(localEndpoint),
                .remote = local::ToDatagramEndpoint(remoteEndpoint),
                .nat = options.UseNat(),
                .user = user,
                .userKey = *optUserKey,
                .deviceAuthentication = deviceAuthentication,
                .spMedium = spMedium };
        }

        return SessionTunnelingRequest{
            .local = localEndpoint,
            .remote = remoteEndpoint,
            .user = user,
            .userKey = *optUserKey,
            .deviceAuthentication = deviceAuthentication,
            .spMedium = spMedium };
    }

    if (options.HasSecureIntent()) { local::ThrowMissingCredential("tunneling user key", options); }

    if (options.UseTcp()) {
        return TcpTunnelingRequest{ .local = localEndpoint, .remote = remoteEndpoint, .spMedium = spMedium };
    }

    return TunnelingRequest{
        .local = local::ToDatagramEndpoint(localEndpoint),
        .remote = local::ToDatagramEndpoint(remoteEndpoint),
        .nat = options.UseNat(),
        .spMedium = spMedium };
}

//----------------------------------------------------------------------------------------------------------------------

SharedSecureSession Link::Factory::NegotiateSession(
    Network::TcpEndpoint const& localEndpoint,
    Network::TcpEndpoint const& remoteEndpoint,
    std::uint8_t user,
    Security::Secret const& userKey,
    Security::Secret const& deviceAuthentication,
    std::stop_token token) const
{
    if (!m_spNegotiator) { throw std::runtime_error("A link factory requires a negotiator for secure sessions!"); }

    auto const spConnection = AcquireConnection(localEndpoint, remoteEndpoint, token);
    m_logger->debug(
        "Negotiating a secure session for user {} with {}.",
        static_cast<std::uint32_t>(user), Network::ToString(remoteEndpoint));

    auto spSession = m_spNegotiator->NewSecureSession(spConnection, user, userKey, deviceAuthentication, token);
    if (!spSession) {
        std::ostringstream oss;
        oss << "failed to establish a secure session with " << Network::ToString(remoteEndpoint);
        throw Core::Error(Core::Error::Category::Transport, oss.str());
    }

    return spSession;
}

//----------------------------------------------------------------------------------------------------------------------

void local::ApplyDeviceAddress(Configuration::ConnectionOptions const& options)
{
    if (auto const& optDeviceAddress = options.GetDeviceAddress(); optDeviceAddress) {
        options.GetMedium()->SetDeviceAddress(*optDeviceAddress);
    }
}

//----------------------------------------------------------------------------------------------------------------------

Network::UdpEndpoint local::ToDatagramEndpoint(Network::TcpEndpoint const& endpoint)
{
    return Network::UdpEndpoint{ endpoint.address(), endpoint.port() };
}

//----------------------------------------------------------------------------------------------------------------------

void local::ThrowMissingCredential(std::string_view role, Configuration::ConnectionOptions const& options)
{
    std::ostringstream oss;
    oss << "missing secure credential, no " << role << " available for the secure connection to " << options.GetHost();
    throw Core::Error(Core::Error::Category::MissingCredential, oss.str());
}

//----------------------------------------------------------------------------------------------------------------------
