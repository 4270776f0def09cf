//----------------------------------------------------------------------------------------------------------------------
// File: DomainAddress.hpp
// Description: Converts the 64 bit domain value given on the command line into the big-endian byte address used by
// the medium. Powerline networks use the low 2 bytes, radio frequency networks the low 6 bytes. Higher order bits of
// a wider value are dropped without a diagnostic.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Settings.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Medium {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] DomainAddress EncodeDomainAddress(std::uint64_t value, Type type);

void ApplyDomainAddress(std::optional<std::uint64_t> const& optDomain, Settings& settings);

//----------------------------------------------------------------------------------------------------------------------
} // Medium namespace
//----------------------------------------------------------------------------------------------------------------------
