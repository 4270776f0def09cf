//----------------------------------------------------------------------------------------------------------------------
// File: NumberUtils.hpp
// Description: Integer decoding for command line values. A value may carry a sign and a radix prefix: "0x", "0X" or
// "#" select hexadecimal, a leading zero followed by more digits selects octal, anything else is decimal.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <charconv>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>
#include <type_traits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace NumberUtils {
//----------------------------------------------------------------------------------------------------------------------

template<std::integral IntegerType>
[[nodiscard]] std::optional<IntegerType> DecodeInteger(std::string_view value);

//----------------------------------------------------------------------------------------------------------------------
} // NumberUtils namespace
//----------------------------------------------------------------------------------------------------------------------

template<std::integral IntegerType>
std::optional<IntegerType> NumberUtils::DecodeInteger(std::string_view value)
{
    if (value.empty()) { return {}; }

    bool negative = false;
    if (value.front() == '-' || value.front() == '+') {
        negative = (value.front() == '-');
        value.remove_prefix(1);
    }

    std::int32_t base = 10;
    if (value.starts_with("0x") || value.starts_with("0X")) {
        base = 16;
        value.remove_prefix(2);
    } else if (value.starts_with("#")) {
        base = 16;
        value.remove_prefix(1);
    } else if (value.size() > 1 && value.front() == '0') {
        base = 8;
        value.remove_prefix(1);
    }

    // A second sign after the prefix is malformed (i.e. "0x-1"), from_chars would otherwise accept it.
    if (value.empty() || value.front() == '-' || value.front() == '+') { return {}; }

    std::uint64_t magnitude = 0;
    auto const [end, error] = std::from_chars(value.data(), value.data() + value.size(), magnitude, base);
    if (error != std::errc{} || end != value.data() + value.size()) { return {}; }

    if (negative) {
        if constexpr (std::is_unsigned_v<IntegerType>) {
            if (magnitude != 0) { return {}; }
            return IntegerType{ 0 };
        } else {
            auto const limit = static_cast<std::uint64_t>(std::numeric_limits<IntegerType>::max()) + 1;
            if (magnitude > limit) { return {}; }
            return static_cast<IntegerType>(-static_cast<std::int64_t>(magnitude - 1) - 1);
        }
    }

    if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<IntegerType>::max())) { return {}; }
    return static_cast<IntegerType>(magnitude);
}

//----------------------------------------------------------------------------------------------------------------------
