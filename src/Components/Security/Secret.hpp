//----------------------------------------------------------------------------------------------------------------------
// File: Secret.hpp
// Description: A KNX IP Secure key. A secret is either empty (i.e. no device authentication) or exactly 16 bytes,
// holding a hashed password or a raw key.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class Secret;

using OptionalSecret = std::optional<Secret>;

// Note: Decodes a key given as hexadecimal digits. An empty string gives an empty secret, 32 digits give a 16 byte
// secret. Any other length or a non-hexadecimal digit raises a configuration error.
[[nodiscard]] Secret DecodeSecret(std::string_view hex);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::Secret
{
public:
    static constexpr std::size_t Size = 16;

    Secret() = default;
    explicit Secret(ReadableView data);

    Secret(Secret const& other) = default;
    Secret& operator=(Secret const& other) = default;

    ~Secret();

    [[nodiscard]] bool operator==(Secret const& other) const noexcept = default;

    [[nodiscard]] ReadableView GetData() const;
    [[nodiscard]] std::size_t GetSize() const;
    [[nodiscard]] bool IsEmpty() const;

private:
    std::array<std::uint8_t, Size> m_data{};
    std::size_t m_size = 0;
};

//----------------------------------------------------------------------------------------------------------------------
