//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Error.hpp"
#include "Components/Security/Secret.hpp"
#include "Components/Security/SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

void ExpectConfigurationError(std::string_view hex);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Hex = "000102030405060708090a0b0c0d0e0f";
Security::Buffer const Bytes = {
    0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f };

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(SecretSuite, DecodeEmptyTest)
{
    auto const secret = Security::DecodeSecret("");
    EXPECT_TRUE(secret.IsEmpty());
    EXPECT_EQ(secret.GetSize(), std::size_t{ 0 });
    EXPECT_EQ(secret, Security::Secret{});
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecretSuite, DecodeKeyTest)
{
    auto const secret = Security::DecodeSecret(test::Hex);
    EXPECT_FALSE(secret.IsEmpty());
    ASSERT_EQ(secret.GetSize(), Security::Secret::Size);

    auto const data = secret.GetData();
    EXPECT_TRUE(std::equal(data.begin(), data.end(), test::Bytes.begin(), test::Bytes.end()));
    EXPECT_EQ(secret, Security::Secret{ test::Bytes });

    auto const uppercase = Security::DecodeSecret("000102030405060708090A0B0C0D0E0F");
    EXPECT_EQ(uppercase, secret);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecretSuite, DecodeWrongLengthTest)
{
    local::ExpectConfigurationError("00");
    local::ExpectConfigurationError("000102030405060708090a0b0c0d0e");
    local::ExpectConfigurationError("000102030405060708090a0b0c0d0e0f1");
    local::ExpectConfigurationError("000102030405060708090a0b0c0d0e0f10");
    local::ExpectConfigurationError("000102030405060708090a0b0c0d0e0f000102030405060708090a0b0c0d0e0f");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecretSuite, DecodeNonHexadecimalTest)
{
    local::ExpectConfigurationError("000102030405060708090a0b0c0d0e0g");
    local::ExpectConfigurationError("zz0102030405060708090a0b0c0d0e0f");
    local::ExpectConfigurationError("                                ");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(SecretSuite, ConstructWrongSizeTest)
{
    Security::Buffer const shortened(test::Bytes.begin(), test::Bytes.end() - 1);
    EXPECT_THROW(Security::Secret{ shortened }, Core::Error);
    EXPECT_NO_THROW(Security::Secret{ Security::Buffer{} });
}

//----------------------------------------------------------------------------------------------------------------------

void local::ExpectConfigurationError(std::string_view hex)
{
    try {
        [[maybe_unused]] auto const secret = Security::DecodeSecret(hex);
        ADD_FAILURE() << "decoding \"" << hex << "\" should fail";
    } catch (Core::Error const& exception) {
        EXPECT_EQ(exception.GetCategory(), Core::Error::Category::Configuration);
    }
}

//----------------------------------------------------------------------------------------------------------------------
