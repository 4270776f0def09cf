//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/ConnectionOptions.hpp"
#include "Components/Core/Error.hpp"
#include "Components/Medium/Settings.hpp"
#include "Components/Security/Secret.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

auto const Key = Security::DecodeSecret("00112233445566778899aabbccddeeff");

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionOptionsSuite, DefaultsTest)
{
    Configuration::ConnectionOptions const options;
    EXPECT_TRUE(options.GetHost().empty());
    EXPECT_EQ(options.GetPort(), Configuration::ConnectionOptions::DefaultPort);
    EXPECT_FALSE(options.GetLocalHost());
    EXPECT_FALSE(options.GetLocalPort());
    EXPECT_FALSE(options.UseNat());
    EXPECT_FALSE(options.UseTcp());
    EXPECT_FALSE(options.UseUdp());
    EXPECT_FALSE(options.HasTransport(Configuration::Transport::Serial));
    EXPECT_FALSE(options.HasTransport(Configuration::Transport::SerialCemi));
    EXPECT_FALSE(options.HasTransport(Configuration::Transport::Usb));
    EXPECT_FALSE(options.HasTransport(Configuration::Transport::BusMonitor));

    ASSERT_TRUE(options.GetMedium());
    EXPECT_EQ(options.GetMedium()->GetMedium(), Medium::Type::TP1);
    EXPECT_FALSE(options.GetDomain());
    EXPECT_FALSE(options.GetDeviceAddress());

    EXPECT_FALSE(options.GetGroupKey());
    EXPECT_FALSE(options.GetDeviceKey());
    EXPECT_FALSE(options.GetUserKey());
    EXPECT_EQ(options.GetUser(), Configuration::ConnectionOptions::UnspecifiedUser);
    EXPECT_FALSE(options.HasUser());
    EXPECT_FALSE(options.GetKeyringPath());
    EXPECT_FALSE(options.GetKeyringPassword());
    EXPECT_FALSE(options.GetInterfaceAddress());
    EXPECT_FALSE(options.EmulateWriteEnable());
    EXPECT_FALSE(options.HasSecureIntent());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionOptionsSuite, TransportTest)
{
    Configuration::ConnectionOptions options;
    options.EnableTransport(Configuration::Transport::Usb);
    EXPECT_TRUE(options.HasTransport(Configuration::Transport::Usb));
    EXPECT_FALSE(options.HasTransport(Configuration::Transport::Serial));

    EXPECT_EQ(Configuration::TransportToString(Configuration::Transport::Serial), "ft12");
    EXPECT_EQ(Configuration::TransportToString(Configuration::Transport::BusMonitor), "tpuart");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionOptionsSuite, UserTest)
{
    Configuration::ConnectionOptions options;
    options.SetUser(127);
    EXPECT_TRUE(options.HasUser());
    EXPECT_EQ(options.GetUser(), std::uint8_t{ 127 });

    EXPECT_THROW(options.SetUser(128), Core::Error);
    EXPECT_EQ(options.GetUser(), std::uint8_t{ 127 });

    options.SetUser(0);
    EXPECT_FALSE(options.HasUser());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionOptionsSuite, SecureIntentTest)
{
    {
        Configuration::ConnectionOptions options;
        options.SetUser(2);
        EXPECT_TRUE(options.HasSecureIntent());
    }
    {
        Configuration::ConnectionOptions options;
        options.SetUserKey(test::Key);
        EXPECT_TRUE(options.HasSecureIntent());
    }
    {
        Configuration::ConnectionOptions options;
        options.SetDeviceKey(test::Key);
        EXPECT_TRUE(options.HasSecureIntent());
    }
    {
        Configuration::ConnectionOptions options;
        options.SetInterfaceAddress(Medium::IndividualAddress{ 1, 1, 0 });
        EXPECT_TRUE(options.HasSecureIntent());
    }
    {
        // A group key only secures multicast communication, a keyring only supplies credentials when it is unambiguous.
        Configuration::ConnectionOptions options;
        options.SetGroupKey(test::Key);
        options.SetKeyringPath("project.knxkeys");
        options.SetKeyringPassword("pwd");
        EXPECT_FALSE(options.HasSecureIntent());
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConnectionOptionsSuite, MediumTest)
{
    Configuration::ConnectionOptions options;
    auto const spMedium = Medium::Settings::Create(Medium::Type::RF);
    options.SetMedium(spMedium);
    EXPECT_EQ(options.GetMedium(), spMedium);
    EXPECT_THROW(options.SetMedium(nullptr), std::invalid_argument);
    EXPECT_EQ(options.GetMedium(), spMedium);
}

//----------------------------------------------------------------------------------------------------------------------
