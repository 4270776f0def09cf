//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.hpp
// Description: Thin wrappers around the OpenSSL primitives used for KNX IP Secure credentials.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

using Buffer = std::vector<std::uint8_t>;
using OptionalBuffer = std::optional<Buffer>;
using ReadableView = std::span<std::uint8_t const>;

void EraseMemory(void* begin, std::size_t size);

[[nodiscard]] OptionalBuffer DecodeBase64(std::string_view encoded);

// Note: PBKDF2 with HMAC-SHA256. Raises a std::runtime_error when OpenSSL fails to derive the key.
[[nodiscard]] Buffer DeriveKey(ReadableView password, std::string_view salt, std::uint32_t iterations, std::size_t size);

[[nodiscard]] Buffer GenerateDigest(ReadableView data);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
