//----------------------------------------------------------------------------------------------------------------------
// File: Context.hpp
// Description: The security installation shared by every link opened in the process. At most one keyring is active
// at a time, installing another replaces it. The keyring passphrase is kept alongside so keyring passwords can be
// decrypted on demand.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Keyring.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class Context;

using SharedContext = std::shared_ptr<Context>;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::Context
{
public:
    struct Installation {
        SharedKeyring spKeyring;
        std::string passphrase;
    };

    Context() = default;
    ~Context();

    Context(Context const&) = delete;
    Context& operator=(Context const&) = delete;

    // Note: The process-wide instance, created on first use and kept until the process exits.
    [[nodiscard]] static SharedContext const& Default();

    void UseKeyring(SharedKeyring const& spKeyring, std::string_view passphrase);
    [[nodiscard]] std::optional<Installation> GetInstallation() const;
    [[nodiscard]] bool HasKeyring() const;

private:
    mutable std::mutex m_mutex;
    std::optional<Installation> m_optInstallation;
};

//----------------------------------------------------------------------------------------------------------------------
