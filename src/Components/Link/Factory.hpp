//----------------------------------------------------------------------------------------------------------------------
// File: Factory.hpp
// Description: Decides which link a set of connection options asks for and opens it. Drafting evaluates the ordered
// route table and produces a blueprint holding the request for exactly one link variant. Building hands the request
// to the link provider, acquiring the pooled TCP connection and secure session first when the variant needs them.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Requests.hpp"
#include "Components/Network/Address.hpp"
#include "Components/Network/ConnectionPool.hpp"
#include "Components/Security/Context.hpp"
#include "Components/Security/CredentialResolver.hpp"
#include "Components/Security/KeyringLookup.hpp"
#include "Interfaces/LinkProvider.hpp"
#include "Interfaces/NetworkLink.hpp"
#include "Interfaces/SessionNegotiator.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <functional>
#include <span>
#include <stop_token>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace Configuration { class ConnectionOptions; }

//----------------------------------------------------------------------------------------------------------------------
namespace Link {
//----------------------------------------------------------------------------------------------------------------------

class Factory;

//----------------------------------------------------------------------------------------------------------------------
} // Link namespace
//----------------------------------------------------------------------------------------------------------------------

class Link::Factory
{
public:
    using NameResolver = std::function<Network::IpAddress(std::string_view, std::stop_token)>;

    struct Route
    {
        using Guard = bool(*)(Configuration::ConnectionOptions const&);
        using Drafter = Blueprint(Factory::*)(Configuration::ConnectionOptions&, std::stop_token) const;

        std::string_view name;
        Guard guard;
        Drafter drafter;
    };

    // Note: A factory without a link provider or session negotiator may still draft blueprints. Building a link
    // requires the provider, building a session based link requires the negotiator as well.
    Factory(
        SharedLinkProvider const& spProvider,
        SharedSessionNegotiator const& spNegotiator,
        Network::SharedConnectionPool const& spConnectionPool = Network::ConnectionPool::Default(),
        Security::SharedContext const& spContext = Security::Context::Default(),
        NameResolver const& resolver = &Network::ResolveHost);

    // Note: The routes in order of precedence, the first route whose guard accepts the options is taken. The last route
    // accepts any options.
    [[nodiscard]] static std::span<Route const> GetRoutes();
    [[nodiscard]] static Route const& Select(Configuration::ConnectionOptions const& options);

    [[nodiscard]] Blueprint Draft(Configuration::ConnectionOptions& options, std::stop_token token = {}) const;
    [[nodiscard]] SharedNetworkLink Build(Blueprint const& blueprint, std::stop_token token = {}) const;
    [[nodiscard]] SharedNetworkLink CreateNetworkLink(
        Configuration::ConnectionOptions& options, std::stop_token token = {}) const;

    [[nodiscard]] ManagementBlueprint DraftManagement(
        Configuration::ConnectionOptions& options, std::stop_token token = {}) const;
    [[nodiscard]] SharedManagementConnection BuildManagement(
        ManagementBlueprint const& blueprint,
        ILinkProvider::CloseHandler const& onClosed,
        std::stop_token token = {}) const;
    [[nodiscard]] SharedManagementConnection CreateManagementConnection(
        Configuration::ConnectionOptions& options,
        ILinkProvider::CloseHandler const& onClosed,
        std::stop_token token = {}) const;

    [[nodiscard]] SharedStreamConnection AcquireConnection(
        Network::TcpEndpoint const& local, Network::TcpEndpoint const& remote, std::stop_token token = {}) const;

private:
    [[nodiscard]] Blueprint DraftSerial(Configuration::ConnectionOptions& options, std::stop_token token) const;
    [[nodiscard]] Blueprint DraftSerialCemi(Configuration::ConnectionOptions& options, std::stop_token token) const;
    [[nodiscard]] Blueprint DraftUsb(Configuration::ConnectionOptions& options, std::stop_token token) const;
    [[nodiscard]] Blueprint DraftBusMonitor(Configuration::ConnectionOptions& options, std::stop_token token) const;
    [[nodiscard]] Blueprint DraftIp(Configuration::ConnectionOptions& options, std::stop_token token) const;

    [[nodiscard]] Blueprint DraftRouting(
        Configuration::ConnectionOptions const& options,
        Network::TcpEndpoint const& local,
        Network::IpAddress const& group) const;
    [[nodiscard]] Blueprint DraftTunneling(
        Configuration::ConnectionOptions& options,
        Network::TcpEndpoint const& local,
        Network::TcpEndpoint const& remote) const;

    [[nodiscard]] SharedSecureSession NegotiateSession(
        Network::TcpEndpoint const& local,
        Network::TcpEndpoint const& remote,
        std::uint8_t user,
        Security::Secret const& userKey,
        Security::Secret const& deviceAuthentication,
        std::stop_token token) const;

    SharedLinkProvider m_spProvider;
    SharedSessionNegotiator m_spNegotiator;
    Network::SharedConnectionPool m_spConnectionPool;
    Security::SharedContext m_spContext;
    NameResolver m_resolver;
    Security::KeyringLookup m_keyringLookup;
    Security::CredentialResolver m_credentials;
    LogUtils::Logger m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
