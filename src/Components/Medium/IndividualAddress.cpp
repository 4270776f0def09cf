//----------------------------------------------------------------------------------------------------------------------
// File: IndividualAddress.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "IndividualAddress.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Error.hpp"
#include "Utilities/NumberUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <charconv>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr char Separator = '.';

[[noreturn]] void ThrowMalformedAddress(std::string_view address);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Medium::IndividualAddress Medium::IndividualAddress::Parse(std::string_view address)
{
    // A single number is interpreted as the raw 16 bit address.
    if (address.find(local::Separator) == std::string_view::npos) {
        auto const optRaw = NumberUtils::DecodeInteger<std::uint16_t>(address);
        if (!optRaw) { local::ThrowMalformedAddress(address); }
        return IndividualAddress{ *optRaw };
    }

    std::array<std::uint32_t, 3> components = {};
    std::size_t index = 0;
    std::string_view remaining = address;
    while (true) {
        if (index >= components.size()) { local::ThrowMalformedAddress(address); }

        auto const boundary = remaining.find(local::Separator);
        auto const partition = remaining.substr(0, boundary);
        auto const [end, error] = std::from_chars(
            partition.data(), partition.data() + partition.size(), components[index]);
        if (partition.empty() || error != std::errc{} || end != partition.data() + partition.size()) {
            local::ThrowMalformedAddress(address);
        }

        ++index;
        if (boundary == std::string_view::npos) { break; }
        remaining.remove_prefix(boundary + 1);
    }

    if (index != components.size()) { local::ThrowMalformedAddress(address); }

    auto const& [area, line, device] = components;
    if (area > MaximumArea || line > MaximumLine || device > MaximumDevice) { local::ThrowMalformedAddress(address); }

    return IndividualAddress{
        static_cast<std::uint8_t>(area), static_cast<std::uint8_t>(line), static_cast<std::uint8_t>(device) };
}

//----------------------------------------------------------------------------------------------------------------------

std::string Medium::IndividualAddress::ToString() const
{
    std::ostringstream oss;
    oss << static_cast<std::uint32_t>(GetArea()) << local::Separator;
    oss << static_cast<std::uint32_t>(GetLine()) << local::Separator;
    oss << static_cast<std::uint32_t>(GetDevice());
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

void local::ThrowMalformedAddress(std::string_view address)
{
    std::ostringstream oss;
    oss << "invalid KNX device address \"" << address << "\"";
    throw Core::Error(Core::Error::Category::Configuration, oss.str());
}

//----------------------------------------------------------------------------------------------------------------------
