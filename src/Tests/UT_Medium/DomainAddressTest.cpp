//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Error.hpp"
#include "Components/Medium/DomainAddress.hpp"
#include "Components/Medium/Settings.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

TEST(DomainAddressSuite, PowerlineEncodingTest)
{
    EXPECT_EQ(Medium::EncodeDomainAddress(0x1234, Medium::Type::PL110), (Medium::DomainAddress{ 0x12, 0x34 }));
    EXPECT_EQ(Medium::EncodeDomainAddress(0x00, Medium::Type::PL110), (Medium::DomainAddress{ 0x00, 0x00 }));

    // Only the low order bytes of a wider value are kept.
    EXPECT_EQ(Medium::EncodeDomainAddress(0xAABBCCDD, Medium::Type::PL110), (Medium::DomainAddress{ 0xCC, 0xDD }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(DomainAddressSuite, RadioFrequencyEncodingTest)
{
    EXPECT_EQ(
        Medium::EncodeDomainAddress(0x0102030405, Medium::Type::RF),
        (Medium::DomainAddress{ 0x00, 0x01, 0x02, 0x03, 0x04, 0x05 }));
    EXPECT_EQ(
        Medium::EncodeDomainAddress(0x1122334455667788, Medium::Type::RF),
        (Medium::DomainAddress{ 0x33, 0x44, 0x55, 0x66, 0x77, 0x88 }));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(DomainAddressSuite, UnsupportedMediumTest)
{
    for (auto const type : { Medium::Type::TP1, Medium::Type::KnxIp }) {
        try {
            [[maybe_unused]] auto const domain = Medium::EncodeDomainAddress(0x01, type);
            FAIL();
        } catch (Core::Error const& error) {
            EXPECT_EQ(error.GetCategory(), Core::Error::Category::Configuration);
            std::string const message = error.what();
            EXPECT_NE(message.find("don't use domain addresses"), std::string::npos);
            EXPECT_NE(message.find("--medium"), std::string::npos);
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(DomainAddressSuite, ApplyDomainAddressTest)
{
    Medium::Settings radio{ Medium::Type::RF };
    Medium::ApplyDomainAddress(0x0A0B0C, radio);
    EXPECT_EQ(radio.GetDomainAddress(), (Medium::DomainAddress{ 0x00, 0x00, 0x00, 0x0A, 0x0B, 0x0C }));

    Medium::Settings twisted{ Medium::Type::TP1 };
    EXPECT_NO_THROW(Medium::ApplyDomainAddress(std::nullopt, twisted));
    EXPECT_TRUE(twisted.GetDomainAddress().empty());
    EXPECT_THROW(Medium::ApplyDomainAddress(0x01, twisted), Core::Error);
}

//----------------------------------------------------------------------------------------------------------------------
