//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Configuration/ConnectionOptions.hpp"
#include "Components/Core/Error.hpp"
#include "Components/Security/Context.hpp"
#include "Components/Security/KeyringLookup.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path WriteKeyring(std::filesystem::path const& path);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, NoPasswordTest)
{
    Security::Test::TemporaryDirectory const directory;
    local::WriteKeyring(directory.GetPath() / "project.knxkeys");

    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{ spContext, &Security::Keyring::Load, directory.GetPath() };

    Configuration::ConnectionOptions const options;
    EXPECT_FALSE(lookup.Run(options));
    EXPECT_FALSE(spContext->HasKeyring());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, NoKeyringTest)
{
    Security::Test::TemporaryDirectory const directory;
    Security::Test::WriteFile(directory.GetPath() / "notes.txt", "not a keyring");

    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{ spContext, &Security::Keyring::Load, directory.GetPath() };

    Configuration::ConnectionOptions options;
    options.SetKeyringPassword(Security::Test::Passphrase);
    EXPECT_FALSE(lookup.FindCandidate(options));
    EXPECT_FALSE(lookup.Run(options));
    EXPECT_FALSE(spContext->HasKeyring());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, SingleKeyringInDirectoryTest)
{
    Security::Test::TemporaryDirectory const directory;
    auto const path = local::WriteKeyring(directory.GetPath() / "project.knxkeys");

    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{ spContext, &Security::Keyring::Load, directory.GetPath() };

    Configuration::ConnectionOptions options;
    options.SetKeyringPassword(Security::Test::Passphrase);
    EXPECT_EQ(lookup.FindCandidate(options), path);
    EXPECT_TRUE(lookup.Run(options));

    auto const optInstallation = spContext->GetInstallation();
    ASSERT_TRUE(optInstallation);
    ASSERT_TRUE(optInstallation->spKeyring);
    EXPECT_EQ(optInstallation->spKeyring->GetPath(), path);
    EXPECT_EQ(optInstallation->passphrase, Security::Test::Passphrase);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, UnnamedKeyringInDirectoryTest)
{
    Security::Test::TemporaryDirectory const directory;
    Security::Test::WriteFile(directory.GetPath() / "project.knxkeys.bak", "not a keyring");
    auto const path = local::WriteKeyring(directory.GetPath() / ".knxkeys");

    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{ spContext, &Security::Keyring::Load, directory.GetPath() };

    Configuration::ConnectionOptions options;
    options.SetKeyringPassword(Security::Test::Passphrase);
    EXPECT_EQ(lookup.FindCandidate(options), path);
    EXPECT_TRUE(lookup.Run(options));
    EXPECT_TRUE(spContext->HasKeyring());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, SeveralKeyringsInDirectoryTest)
{
    Security::Test::TemporaryDirectory const directory;
    local::WriteKeyring(directory.GetPath() / "first.knxkeys");
    local::WriteKeyring(directory.GetPath() / "second.knxkeys");

    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{ spContext, &Security::Keyring::Load, directory.GetPath() };

    Configuration::ConnectionOptions options;
    options.SetKeyringPassword(Security::Test::Passphrase);
    EXPECT_FALSE(lookup.FindCandidate(options));
    EXPECT_FALSE(lookup.Run(options));
    EXPECT_FALSE(spContext->HasKeyring());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, ExplicitPathTest)
{
    Security::Test::TemporaryDirectory const directory;
    local::WriteKeyring(directory.GetPath() / "first.knxkeys");
    local::WriteKeyring(directory.GetPath() / "second.knxkeys");
    auto const path = local::WriteKeyring(directory.GetPath() / "selected.xml");

    std::uint32_t loads = 0;
    auto const loader = [&loads] (std::filesystem::path const& candidate) {
        ++loads;
        return Security::Keyring::Load(candidate);
    };

    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{ spContext, loader, directory.GetPath() };

    Configuration::ConnectionOptions options;
    options.SetKeyringPath(path);
    options.SetKeyringPassword(Security::Test::Passphrase);
    EXPECT_TRUE(lookup.Run(options));
    EXPECT_EQ(loads, std::uint32_t{ 1 });

    auto const optInstallation = spContext->GetInstallation();
    ASSERT_TRUE(optInstallation);
    EXPECT_EQ(optInstallation->spKeyring->GetPath(), path);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, ReplaceInstalledKeyringTest)
{
    Security::Test::TemporaryDirectory const directory;
    auto const first = local::WriteKeyring(directory.GetPath() / "first.knxkeys");
    auto const second = local::WriteKeyring(directory.GetPath() / "second.knxkeys");

    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{ spContext, &Security::Keyring::Load, directory.GetPath() };

    Configuration::ConnectionOptions options;
    options.SetKeyringPassword(Security::Test::Passphrase);
    options.SetKeyringPath(first);
    EXPECT_TRUE(lookup.Run(options));

    options.SetKeyringPath(second);
    options.SetKeyringPassword("another passphrase");
    EXPECT_TRUE(lookup.Run(options));

    auto const optInstallation = spContext->GetInstallation();
    ASSERT_TRUE(optInstallation);
    EXPECT_EQ(optInstallation->spKeyring->GetPath(), second);
    EXPECT_EQ(optInstallation->passphrase, "another passphrase");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, MissingDirectoryTest)
{
    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{
        spContext, &Security::Keyring::Load, std::filesystem::temp_directory_path() / "knxlink-missing-directory" };

    Configuration::ConnectionOptions options;
    options.SetKeyringPassword(Security::Test::Passphrase);
    EXPECT_FALSE(lookup.Run(options));
    EXPECT_FALSE(spContext->HasKeyring());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(KeyringLookupSuite, MalformedKeyringTest)
{
    Security::Test::TemporaryDirectory const directory;
    Security::Test::WriteFile(directory.GetPath() / "broken.knxkeys", "<Keyring>");

    auto const spContext = std::make_shared<Security::Context>();
    Security::KeyringLookup const lookup{ spContext, &Security::Keyring::Load, directory.GetPath() };

    Configuration::ConnectionOptions options;
    options.SetKeyringPassword(Security::Test::Passphrase);
    EXPECT_THROW(lookup.Run(options), Core::Error);
    EXPECT_FALSE(spContext->HasKeyring());
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path local::WriteKeyring(std::filesystem::path const& path)
{
    return Security::Test::WriteFile(
        path, Security::Test::GenerateKeyringXml({ { "1.1.0", "1.1.10", 1, "tunnel" } }, {}));
}

//----------------------------------------------------------------------------------------------------------------------
