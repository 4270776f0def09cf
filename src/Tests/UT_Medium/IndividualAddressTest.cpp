//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Error.hpp"
#include "Components/Medium/IndividualAddress.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

using ParseExpectations = std::vector<std::tuple<std::string, std::uint16_t, std::string>>;

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(IndividualAddressSuite, ComponentTest)
{
    constexpr Medium::IndividualAddress address{ 1, 2, 3 };
    static_assert(address.GetRaw() == 0x1203);
    EXPECT_EQ(address.GetArea(), std::uint8_t{ 1 });
    EXPECT_EQ(address.GetLine(), std::uint8_t{ 2 });
    EXPECT_EQ(address.GetDevice(), std::uint8_t{ 3 });
    EXPECT_EQ(address.ToString(), "1.2.3");

    constexpr Medium::IndividualAddress unregistered{ 0x0F, 0x0F, 0xFF };
    EXPECT_EQ(unregistered.GetRaw(), std::uint16_t{ 0xFFFF });
    EXPECT_EQ(unregistered.ToString(), "15.15.255");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(IndividualAddressSuite, ParseTest)
{
    test::ParseExpectations const expectations = {
        { "0.0.0", 0x0000, "0.0.0" },
        { "1.1.1", 0x1101, "1.1.1" },
        { "1.1.255", 0x11FF, "1.1.255" },
        { "15.15.255", 0xFFFF, "15.15.255" },
        { "4660", 0x1234, "1.2.52" },
        { "0", 0x0000, "0.0.0" },
    };

    for (auto const& [input, raw, text] : expectations) {
        auto const address = Medium::IndividualAddress::Parse(input);
        EXPECT_EQ(address.GetRaw(), raw) << input;
        EXPECT_EQ(address.ToString(), text) << input;
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(IndividualAddressSuite, MalformedParseTest)
{
    std::vector<std::string> const malformed = {
        "", "1.1", "1.1.1.1", "16.1.1", "1.16.1", "1.1.256", "a.b.c", "1..1", ".1.1", "1.1.", "65536", "-1", "1.1.1 " };

    for (auto const& input : malformed) {
        EXPECT_THROW([[maybe_unused]] auto const address = Medium::IndividualAddress::Parse(input), Core::Error)
            << input;
    }

    try {
        [[maybe_unused]] auto const address = Medium::IndividualAddress::Parse("16.1.1");
        FAIL();
    } catch (Core::Error const& error) {
        EXPECT_EQ(error.GetCategory(), Core::Error::Category::Configuration);
        EXPECT_STREQ(error.what(), "invalid KNX device address \"16.1.1\"");
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(IndividualAddressSuite, ComparisonTest)
{
    auto const first = Medium::IndividualAddress::Parse("1.1.1");
    auto const second = Medium::IndividualAddress::Parse("1.1.2");
    EXPECT_EQ(first, Medium::IndividualAddress(0x1101));
    EXPECT_NE(first, second);
    EXPECT_LT(first, second);
    EXPECT_EQ(std::hash<Medium::IndividualAddress>{}(first), std::hash<std::uint16_t>{}(0x1101));
}

//----------------------------------------------------------------------------------------------------------------------
