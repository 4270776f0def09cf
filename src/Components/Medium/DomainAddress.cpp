//----------------------------------------------------------------------------------------------------------------------
// File: DomainAddress.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "DomainAddress.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Error.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

Medium::DomainAddress Medium::EncodeDomainAddress(std::uint64_t value, Type type)
{
    std::size_t size = 0;
    switch (type) {
        case Type::PL110: size = Settings::PowerlineDomainSize; break;
        case Type::RF: size = Settings::RadioFrequencyDomainSize; break;
        default: {
            std::ostringstream oss;
            oss << MediumToString(type) << " networks don't use domain addresses, ";
            oss << "use --medium to specify KNX network medium";
            throw Core::Error(Core::Error::Category::Configuration, oss.str());
        }
    }

    // Lay the value out as eight big-endian bytes and keep the low-order slice.
    std::array<std::uint8_t, sizeof(std::uint64_t)> buffer = {};
    for (std::size_t idx = 0; idx < buffer.size(); ++idx) {
        buffer[buffer.size() - 1 - idx] = static_cast<std::uint8_t>(value >> (idx * 8));
    }

    return DomainAddress(buffer.end() - static_cast<std::ptrdiff_t>(size), buffer.end());
}

//----------------------------------------------------------------------------------------------------------------------

void Medium::ApplyDomainAddress(std::optional<std::uint64_t> const& optDomain, Settings& settings)
{
    if (!optDomain) { return; }
    settings.SetDomainAddress(EncodeDomainAddress(*optDomain, settings.GetMedium()));
}

//----------------------------------------------------------------------------------------------------------------------
