//----------------------------------------------------------------------------------------------------------------------
// File: CredentialResolver.hpp
// Description: Finds the key material for a KNX IP Secure connection. Each role is resolved from the first source
// that provides it: a key or password given in the options, then the keyring installed in the security context.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Context.hpp"
#include "Keyring.hpp"
#include "Secret.hpp"
#include "Components/Medium/IndividualAddress.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

namespace Configuration { class ConnectionOptions; }

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class CredentialResolver;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::CredentialResolver
{
public:
    explicit CredentialResolver(SharedContext const& spContext);

    // Note: Resolves the tunneling user key. When the key comes from the keyring and no user was requested, the user
    // of the matching interface record is written back into the options.
    [[nodiscard]] OptionalSecret ResolveUserKey(Configuration::ConnectionOptions& options) const;

    [[nodiscard]] OptionalSecret ResolveManagementKey(Configuration::ConnectionOptions const& options) const;

    // Note: Never absent, an empty secret means the connection runs without device authentication.
    [[nodiscard]] Secret ResolveDeviceAuthentication(Configuration::ConnectionOptions const& options) const;

    // Note: The keyring host an interface address refers to. The explicit address is used when the keyring knows it,
    // otherwise the keyring's only interface host. Several hosts without a usable explicit address are ambiguous.
    [[nodiscard]] static Medium::OptionalIndividualAddress ResolveInterfaceHost(
        Keyring const& keyring, Medium::OptionalIndividualAddress const& optInterface);

private:
    [[nodiscard]] std::optional<Keyring::Device> FindDevice(
        Context::Installation const& installation, Configuration::ConnectionOptions const& options) const;

    SharedContext m_spContext;
    LogUtils::Logger m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
