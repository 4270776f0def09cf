//----------------------------------------------------------------------------------------------------------------------
// File: KeyringLookup.hpp
// Description: Installs a keyring into the security context when the options carry a keyring password. The keyring is
// the one named on the command line, otherwise the only ".knxkeys" file in the working directory.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Context.hpp"
#include "Keyring.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <functional>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

namespace Configuration { class ConnectionOptions; }

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class KeyringLookup;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::KeyringLookup
{
public:
    using Loader = std::function<SharedKeyring(std::filesystem::path const&)>;

    // Note: An empty directory means the process working directory at the time of the lookup.
    explicit KeyringLookup(
        SharedContext const& spContext, Loader const& loader = &Keyring::Load, std::filesystem::path const& directory = {});

    // Note: Returns whether a keyring has been installed by this call.
    bool Run(Configuration::ConnectionOptions const& options) const;

    [[nodiscard]] std::optional<std::filesystem::path> FindCandidate(Configuration::ConnectionOptions const& options) const;

private:
    [[nodiscard]] std::optional<std::filesystem::path> SearchDirectory() const;

    SharedContext m_spContext;
    Loader m_loader;
    std::filesystem::path m_directory;
    LogUtils::Logger m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
