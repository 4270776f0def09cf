//----------------------------------------------------------------------------------------------------------------------
// File: KeyringLookup.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "KeyringLookup.hpp"
#include "Components/Configuration/ConnectionOptions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <stdexcept>
#include <system_error>
//----------------------------------------------------------------------------------------------------------------------

Security::KeyringLookup::KeyringLookup(
    SharedContext const& spContext, Loader const& loader, std::filesystem::path const& directory)
    : m_spContext(spContext)
    , m_loader(loader)
    , m_directory(directory)
    , m_logger(spdlog::get(LogUtils::Name::Security.data()))
{
    assert(m_logger);
    if (!m_spContext) { throw std::invalid_argument("A keyring lookup requires a security context!"); }
    if (!m_loader) { throw std::invalid_argument("A keyring lookup requires a keyring loader!"); }
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::KeyringLookup::Run(Configuration::ConnectionOptions const& options) const
{
    auto const& optPassword = options.GetKeyringPassword();
    if (!optPassword) { return false; }

    auto const optCandidate = FindCandidate(options);
    if (!optCandidate) {
        m_logger->debug("A keyring password was provided, but no keyring could be found.");
        return false;
    }

    auto const spKeyring = m_loader(*optCandidate);
    if (!spKeyring) { return false; }

    m_spContext->UseKeyring(spKeyring, *optPassword);
    m_logger->info(
        "Using keyring {} with {} interface hosts and {} devices.",
        optCandidate->string(), spKeyring->Interfaces().size(), spKeyring->Devices().size());

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> Security::KeyringLookup::FindCandidate(
    Configuration::ConnectionOptions const& options) const
{
    if (auto const& optPath = options.GetKeyringPath(); optPath) { return *optPath; }
    return SearchDirectory();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> Security::KeyringLookup::SearchDirectory() const
{
    std::error_code error;
    auto const directory = (m_directory.empty()) ? std::filesystem::current_path(error) : m_directory;
    if (error) { return {}; }

    std::filesystem::directory_iterator itr{ directory, error };
    if (error) {
        m_logger->debug("Unable to search {} for a keyring: {}.", directory.string(), error.message());
        return {};
    }

    std::optional<std::filesystem::path> optFound;
    for (auto const end = std::filesystem::directory_iterator{}; itr != end; itr.increment(error)) {
        if (error) { return {}; }

        // Note: A file named only by the extension has no extension in std::filesystem terms.
        auto const& path = itr->path();
        auto const filename = path.filename().string();
        if (!filename.ends_with(Keyring::Extension) || !itr->is_regular_file(error)) { continue; }

        if (optFound) {
            m_logger->warn(
                "Found multiple keyrings in {}, use --keyring to select one.", directory.string());
            return {};
        }
        optFound = path;
    }

    return optFound;
}

//----------------------------------------------------------------------------------------------------------------------
