//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Configuration/ConnectionOptions.hpp"
#include "Components/Security/Context.hpp"
#include "Components/Security/CredentialResolver.hpp"
#include "Components/Security/PasswordHash.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Security::SharedContext CreateContext(
    std::vector<Security::Test::InterfaceEntry> const& interfaces,
    std::vector<Security::Test::DeviceEntry> const& devices = {});

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

auto const UserKey = Security::DecodeSecret("000102030405060708090a0b0c0d0e0f");
auto const DeviceKey = Security::DecodeSecret("f0e0d0c0b0a090807060504030201000");

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class CredentialResolverSuite : public testing::Test
{
protected:
    Configuration::ConnectionOptions m_options;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, OptionUserKeyTakesPrecedenceTest)
{
    auto const spContext = local::CreateContext({ { "", "1.1.10", 2, "keyring-pwd" } });
    Security::CredentialResolver const resolver{ spContext };

    m_options.SetUserKey(test::UserKey);
    auto const optUserKey = resolver.ResolveUserKey(m_options);
    ASSERT_TRUE(optUserKey);
    EXPECT_EQ(*optUserKey, test::UserKey);
    EXPECT_FALSE(m_options.HasUser());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, UserPasswordHashTest)
{
    Security::CredentialResolver const resolver{ std::make_shared<Security::Context>() };

    m_options.SetUser(4);
    m_options.SetUserKey(Security::HashUserPassword("secret"));
    auto const optUserKey = resolver.ResolveUserKey(m_options);
    ASSERT_TRUE(optUserKey);
    EXPECT_EQ(*optUserKey, Security::HashUserPassword("secret"));
    EXPECT_EQ(m_options.GetUser(), std::uint8_t{ 4 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, NoSourceTest)
{
    Security::CredentialResolver const resolver{ std::make_shared<Security::Context>() };

    EXPECT_FALSE(resolver.ResolveUserKey(m_options));
    EXPECT_FALSE(resolver.ResolveManagementKey(m_options));
    EXPECT_TRUE(resolver.ResolveDeviceAuthentication(m_options).IsEmpty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, SoleInterfaceBackfillsUserTest)
{
    auto const spContext = local::CreateContext({ { "1.1.0", "1.1.10", 3, "tunnel-pwd" } });
    Security::CredentialResolver const resolver{ spContext };

    ASSERT_FALSE(m_options.HasUser());
    auto const optUserKey = resolver.ResolveUserKey(m_options);
    ASSERT_TRUE(optUserKey);
    EXPECT_EQ(*optUserKey, Security::HashUserPassword("tunnel-pwd"));
    EXPECT_EQ(m_options.GetUser(), std::uint8_t{ 3 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, RequestedUserTest)
{
    auto const spContext = local::CreateContext({
        { "1.1.0", "1.1.10", 2, "first-pwd" },
        { "1.1.0", "1.1.11", 3, "second-pwd" } });
    Security::CredentialResolver const resolver{ spContext };

    m_options.SetUser(3);
    auto const optUserKey = resolver.ResolveUserKey(m_options);
    ASSERT_TRUE(optUserKey);
    EXPECT_EQ(*optUserKey, Security::HashUserPassword("second-pwd"));
    EXPECT_EQ(m_options.GetUser(), std::uint8_t{ 3 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, UnknownUserTest)
{
    auto const spContext = local::CreateContext({ { "1.1.0", "1.1.10", 2, "tunnel-pwd" } });
    Security::CredentialResolver const resolver{ spContext };

    m_options.SetUser(9);
    EXPECT_FALSE(resolver.ResolveUserKey(m_options));
    EXPECT_EQ(m_options.GetUser(), std::uint8_t{ 9 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, AmbiguousHostsTest)
{
    auto const spContext = local::CreateContext({
        { "1.1.0", "1.1.10", 2, "first-pwd" },
        { "1.2.0", "1.2.10", 2, "second-pwd" } });
    Security::CredentialResolver const resolver{ spContext };

    EXPECT_FALSE(resolver.ResolveUserKey(m_options));
    EXPECT_FALSE(m_options.HasUser());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, ExplicitInterfaceTest)
{
    auto const spContext = local::CreateContext({
        { "1.1.0", "1.1.10", 2, "first-pwd" },
        { "1.2.0", "1.2.10", 5, "second-pwd" } });
    Security::CredentialResolver const resolver{ spContext };

    m_options.SetInterfaceAddress(Medium::IndividualAddress::Parse("1.2.0"));
    auto const optUserKey = resolver.ResolveUserKey(m_options);
    ASSERT_TRUE(optUserKey);
    EXPECT_EQ(*optUserKey, Security::HashUserPassword("second-pwd"));
    EXPECT_EQ(m_options.GetUser(), std::uint8_t{ 5 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, InterfaceWithoutPasswordTest)
{
    auto const spContext = local::CreateContext({ { "1.1.0", "1.1.10", 6, "" } });
    Security::CredentialResolver const resolver{ spContext };

    EXPECT_FALSE(resolver.ResolveUserKey(m_options));
    EXPECT_EQ(m_options.GetUser(), std::uint8_t{ 6 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, ManagementKeyTest)
{
    auto const spContext = local::CreateContext(
        { { "1.1.0", "1.1.10", 2, "tunnel-pwd" } }, { { "1.1.0", "mgmt-pwd", "auth-pwd" } });
    Security::CredentialResolver const resolver{ spContext };

    auto const optManagementKey = resolver.ResolveManagementKey(m_options);
    ASSERT_TRUE(optManagementKey);
    EXPECT_EQ(*optManagementKey, Security::HashUserPassword("mgmt-pwd"));

    m_options.SetUserKey(test::UserKey);
    auto const optOptionKey = resolver.ResolveManagementKey(m_options);
    ASSERT_TRUE(optOptionKey);
    EXPECT_EQ(*optOptionKey, test::UserKey);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, DeviceAuthenticationTest)
{
    auto const spContext = local::CreateContext(
        { { "1.1.0", "1.1.10", 2, "tunnel-pwd" } }, { { "1.1.0", "mgmt-pwd", "auth-pwd" } });
    Security::CredentialResolver const resolver{ spContext };

    auto const fromKeyring = resolver.ResolveDeviceAuthentication(m_options);
    EXPECT_EQ(fromKeyring, Security::HashDeviceAuthenticationPassword("auth-pwd"));
    EXPECT_NE(fromKeyring, Security::HashUserPassword("auth-pwd"));

    m_options.SetDeviceKey(test::DeviceKey);
    EXPECT_EQ(resolver.ResolveDeviceAuthentication(m_options), test::DeviceKey);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(CredentialResolverSuite, DeviceWithoutAuthenticationTest)
{
    auto const spContext = local::CreateContext(
        { { "1.1.0", "1.1.10", 2, "tunnel-pwd" } }, { { "1.1.0", "mgmt-pwd", "" } });
    Security::CredentialResolver const resolver{ spContext };

    EXPECT_TRUE(resolver.ResolveDeviceAuthentication(m_options).IsEmpty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CredentialResolverHostSuite, ResolveInterfaceHostTest)
{
    auto const spSingle = Security::Test::CreateKeyring({ { "1.1.0", "1.1.10", 2, "" } });
    auto const host = Medium::IndividualAddress::Parse("1.1.0");
    auto const unknown = Medium::IndividualAddress::Parse("7.7.7");

    EXPECT_EQ(Security::CredentialResolver::ResolveInterfaceHost(*spSingle, {}), host);
    EXPECT_EQ(Security::CredentialResolver::ResolveInterfaceHost(*spSingle, unknown), host);

    auto const spSeveral = Security::Test::CreateKeyring({
        { "1.1.0", "1.1.10", 2, "" },
        { "1.2.0", "1.2.10", 2, "" } });
    auto const second = Medium::IndividualAddress::Parse("1.2.0");

    EXPECT_FALSE(Security::CredentialResolver::ResolveInterfaceHost(*spSeveral, {}));
    EXPECT_FALSE(Security::CredentialResolver::ResolveInterfaceHost(*spSeveral, unknown));
    EXPECT_EQ(Security::CredentialResolver::ResolveInterfaceHost(*spSeveral, second), second);

    auto const spEmpty = Security::Test::CreateKeyring({});
    EXPECT_FALSE(Security::CredentialResolver::ResolveInterfaceHost(*spEmpty, {}));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CredentialResolverHostSuite, NullContextTest)
{
    EXPECT_THROW(Security::CredentialResolver{ nullptr }, std::invalid_argument);
}

//----------------------------------------------------------------------------------------------------------------------

Security::SharedContext local::CreateContext(
    std::vector<Security::Test::InterfaceEntry> const& interfaces,
    std::vector<Security::Test::DeviceEntry> const& devices)
{
    auto const spContext = std::make_shared<Security::Context>();
    spContext->UseKeyring(Security::Test::CreateKeyring(interfaces, devices), Security::Test::Passphrase);
    return spContext;
}

//----------------------------------------------------------------------------------------------------------------------
