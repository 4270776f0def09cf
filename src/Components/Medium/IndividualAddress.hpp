//----------------------------------------------------------------------------------------------------------------------
// File: IndividualAddress.hpp
// Description: A KNX individual (device) address. The address is a 16 bit value partitioned into a 4 bit area, a 4 bit
// line and an 8 bit device number (i.e. 1.1.5).
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Medium {
//----------------------------------------------------------------------------------------------------------------------

class IndividualAddress;

using OptionalIndividualAddress = std::optional<IndividualAddress>;

//----------------------------------------------------------------------------------------------------------------------
} // Medium namespace
//----------------------------------------------------------------------------------------------------------------------

class Medium::IndividualAddress
{
public:
    static constexpr std::uint8_t MaximumArea = 0x0F;
    static constexpr std::uint8_t MaximumLine = 0x0F;
    static constexpr std::uint8_t MaximumDevice = 0xFF;

    constexpr IndividualAddress() : m_raw(0) {}
    constexpr explicit IndividualAddress(std::uint16_t raw) : m_raw(raw) {}
    constexpr IndividualAddress(std::uint8_t area, std::uint8_t line, std::uint8_t device)
        : m_raw(static_cast<std::uint16_t>(
            ((area & MaximumArea) << 12) | ((line & MaximumLine) << 8) | device))
    {
    }

    // Note: Accepts the "area.line.device" notation or a single raw number. A malformed address raises a
    // configuration error.
    [[nodiscard]] static IndividualAddress Parse(std::string_view address);

    [[nodiscard]] constexpr bool operator==(IndividualAddress const& other) const noexcept = default;
    [[nodiscard]] constexpr std::strong_ordering operator<=>(IndividualAddress const& other) const noexcept = default;

    [[nodiscard]] constexpr std::uint16_t GetRaw() const { return m_raw; }
    [[nodiscard]] constexpr std::uint8_t GetArea() const { return static_cast<std::uint8_t>(m_raw >> 12); }
    [[nodiscard]] constexpr std::uint8_t GetLine() const { return static_cast<std::uint8_t>((m_raw >> 8) & 0x0F); }
    [[nodiscard]] constexpr std::uint8_t GetDevice() const { return static_cast<std::uint8_t>(m_raw & 0xFF); }

    [[nodiscard]] std::string ToString() const;

private:
    std::uint16_t m_raw;
};

//----------------------------------------------------------------------------------------------------------------------

template<>
struct std::hash<Medium::IndividualAddress>
{
    std::size_t operator()(Medium::IndividualAddress const& address) const
    {
        return std::hash<std::uint16_t>()(address.GetRaw());
    }
};

//----------------------------------------------------------------------------------------------------------------------
