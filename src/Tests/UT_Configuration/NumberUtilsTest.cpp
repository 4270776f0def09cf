//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/NumberUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

TEST(NumberUtilsSuite, DecodeRadixTest)
{
    std::vector<std::pair<std::string, std::optional<std::uint16_t>>> const expectations = {
        { "3671", 3671 },
        { "0", 0 },
        { "0x0e57", 0x0E57 },
        { "0X0E57", 0x0E57 },
        { "#e57", 0x0E57 },
        { "017", 15 },
        { "+42", 42 },
        { "65535", 65535 },
        { "65536", std::nullopt },
        { "", std::nullopt },
        { "0x", std::nullopt },
        { "12a", std::nullopt },
        { "089", std::nullopt },
        { "0x-1", std::nullopt },
        { " 1", std::nullopt },
        { "-5", std::nullopt },
        { "-0", 0 },
    };

    for (auto const& [value, expected] : expectations) {
        EXPECT_EQ(NumberUtils::DecodeInteger<std::uint16_t>(value), expected) << value;
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NumberUtilsSuite, DecodeSignedTest)
{
    EXPECT_EQ(NumberUtils::DecodeInteger<std::int32_t>("-1"), -1);
    EXPECT_EQ(NumberUtils::DecodeInteger<std::int32_t>("-0x10"), -16);
    EXPECT_EQ(NumberUtils::DecodeInteger<std::int32_t>("-2147483648"), std::numeric_limits<std::int32_t>::min());
    EXPECT_FALSE(NumberUtils::DecodeInteger<std::int32_t>("-2147483649"));
    EXPECT_FALSE(NumberUtils::DecodeInteger<std::int32_t>("2147483648"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST(NumberUtilsSuite, DecodeWideTest)
{
    EXPECT_EQ(NumberUtils::DecodeInteger<std::uint64_t>("0xffffffffffffffff"), std::numeric_limits<std::uint64_t>::max());
    EXPECT_FALSE(NumberUtils::DecodeInteger<std::uint64_t>("0x10000000000000000"));
}

//----------------------------------------------------------------------------------------------------------------------
