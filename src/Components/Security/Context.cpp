//----------------------------------------------------------------------------------------------------------------------
// File: Context.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Context.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

Security::Context::~Context()
{
    if (m_optInstallation) {
        auto& passphrase = m_optInstallation->passphrase;
        EraseMemory(passphrase.data(), passphrase.size());
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::SharedContext const& Security::Context::Default()
{
    static SharedContext const spContext = std::make_shared<Context>();
    return spContext;
}

//----------------------------------------------------------------------------------------------------------------------

void Security::Context::UseKeyring(SharedKeyring const& spKeyring, std::string_view passphrase)
{
    if (!spKeyring) { throw std::invalid_argument("A security context requires a keyring to install!"); }

    std::scoped_lock lock{ m_mutex };
    if (m_optInstallation) {
        auto& previous = m_optInstallation->passphrase;
        EraseMemory(previous.data(), previous.size());
    }
    m_optInstallation = Installation{ spKeyring, std::string{ passphrase } };
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Security::Context::Installation> Security::Context::GetInstallation() const
{
    std::scoped_lock lock{ m_mutex };
    return m_optInstallation;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::Context::HasKeyring() const
{
    std::scoped_lock lock{ m_mutex };
    return m_optInstallation.has_value();
}

//----------------------------------------------------------------------------------------------------------------------
