//----------------------------------------------------------------------------------------------------------------------
// File: CredentialResolver.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "CredentialResolver.hpp"
#include "PasswordHash.hpp"
#include "SecurityUtils.hpp"
#include "Components/Configuration/ConnectionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <stdexcept>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

using Hasher = Security::Secret(*)(std::string_view);

Security::Secret DecryptAndHash(
    Security::Context::Installation const& installation, Security::Buffer const& encrypted, Hasher hasher);

Security::Keyring::Interface const* MatchInterface(
    std::vector<Security::Keyring::Interface> const& records,
    std::uint8_t user,
    Medium::OptionalIndividualAddress const& optInterface);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::CredentialResolver::CredentialResolver(SharedContext const& spContext)
    : m_spContext(spContext)
    , m_logger(spdlog::get(LogUtils::Name::Security.data()))
{
    assert(m_logger);
    if (!m_spContext) { throw std::invalid_argument("A credential resolver requires a security context!"); }
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecret Security::CredentialResolver::ResolveUserKey(Configuration::ConnectionOptions& options) const
{
    if (auto const& optUserKey = options.GetUserKey(); optUserKey) {
        m_logger->debug("Using the user key provided in the connection options.");
        return optUserKey;
    }

    auto const optInstallation = m_spContext->GetInstallation();
    if (!optInstallation) { return {}; }

    auto const& keyring = *optInstallation->spKeyring;
    auto const& optInterface = options.GetInterfaceAddress();
    auto const optHost = ResolveInterfaceHost(keyring, optInterface);
    if (!optHost) { return {}; }

    auto const& records = keyring.Interfaces().at(*optHost);
    auto const pRecord = local::MatchInterface(records, options.GetUser(), optInterface);
    if (!pRecord) {
        m_logger->debug("No keyring interface of {} matches the requested user.", optHost->ToString());
        return {};
    }

    if (!options.HasUser()) { options.SetUser(pRecord->user); }

    if (!pRecord->password) { return {}; }

    m_logger->debug(
        "Using the keyring password of user {} on interface {}.",
        static_cast<std::uint32_t>(pRecord->user), pRecord->address.ToString());
    return local::DecryptAndHash(*optInstallation, *pRecord->password, &HashUserPassword);
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalSecret Security::CredentialResolver::ResolveManagementKey(
    Configuration::ConnectionOptions const& options) const
{
    if (auto const& optUserKey = options.GetUserKey(); optUserKey) {
        m_logger->debug("Using the management key provided in the connection options.");
        return optUserKey;
    }

    auto const optInstallation = m_spContext->GetInstallation();
    if (!optInstallation) { return {}; }

    auto const optDevice = FindDevice(*optInstallation, options);
    if (!optDevice || !optDevice->password) { return {}; }

    m_logger->debug("Using the keyring management password of device {}.", optDevice->address.ToString());
    return local::DecryptAndHash(*optInstallation, *optDevice->password, &HashUserPassword);
}

//----------------------------------------------------------------------------------------------------------------------

Security::Secret Security::CredentialResolver::ResolveDeviceAuthentication(
    Configuration::ConnectionOptions const& options) const
{
    if (auto const& optDeviceKey = options.GetDeviceKey(); optDeviceKey) {
        m_logger->debug("Using the device authentication code provided in the connection options.");
        return *optDeviceKey;
    }

    if (auto const optInstallation = m_spContext->GetInstallation(); optInstallation) {
        auto const optDevice = FindDevice(*optInstallation, options);
        if (optDevice && optDevice->authentication) {
            m_logger->debug("Using the keyring authentication code of device {}.", optDevice->address.ToString());
            return local::DecryptAndHash(
                *optInstallation, *optDevice->authentication, &HashDeviceAuthenticationPassword);
        }
    }

    m_logger->debug("No device authentication code is available.");
    return Secret{};
}

//----------------------------------------------------------------------------------------------------------------------

Medium::OptionalIndividualAddress Security::CredentialResolver::ResolveInterfaceHost(
    Keyring const& keyring, Medium::OptionalIndividualAddress const& optInterface)
{
    auto const& interfaces = keyring.Interfaces();
    if (optInterface && interfaces.contains(*optInterface)) { return optInterface; }
    if (interfaces.size() != 1) { return {}; }
    return interfaces.begin()->first;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Security::Keyring::Device> Security::CredentialResolver::FindDevice(
    Context::Installation const& installation, Configuration::ConnectionOptions const& options) const
{
    auto const& keyring = *installation.spKeyring;
    auto const optHost = ResolveInterfaceHost(keyring, options.GetInterfaceAddress());
    if (!optHost) {
        m_logger->debug("Unable to determine which keyring interface host to use.");
        return {};
    }

    auto const& devices = keyring.Devices();
    if (auto const itr = devices.find(*optHost); itr != devices.end()) { return itr->second; }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------

Security::Secret local::DecryptAndHash(
    Security::Context::Installation const& installation, Security::Buffer const& encrypted, Hasher hasher)
{
    auto password = installation.spKeyring->DecryptPassword(encrypted, installation.passphrase);
    auto secret = hasher(password);
    Security::EraseMemory(password.data(), password.size());
    return secret;
}

//----------------------------------------------------------------------------------------------------------------------
// Description: A requested user matches on its identifier or on the tunneling address named by the options. Without
// a requested user the record with the named tunneling address is preferred, otherwise the first record is taken.
//----------------------------------------------------------------------------------------------------------------------
Security::Keyring::Interface const* local::MatchInterface(
    std::vector<Security::Keyring::Interface> const& records,
    std::uint8_t user,
    Medium::OptionalIndividualAddress const& optInterface)
{
    auto const matchesAddress = [&optInterface] (Security::Keyring::Interface const& record) {
        return optInterface && record.address == *optInterface;
    };

    for (auto const& record : records) {
        if (user != 0 && record.user == user) { return &record; }
        if (matchesAddress(record)) { return &record; }
    }

    if (user == 0 && !records.empty()) { return &records.front(); }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------
