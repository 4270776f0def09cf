//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#ifndef __STDC_WANT_LIB_EXT1__
#define __STDC_WANT_LIB_EXT1__ 1
#endif
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/evp.h>
#include <openssl/sha.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

void Security::EraseMemory(void* begin, std::size_t size)
{
#if defined(__STDC_LIB_EXT1__)
    std::memset_s(begin, size, 0, size);
#else
    auto data = reinterpret_cast<std::uint8_t volatile*>(begin);
    for (std::size_t erased = 0; erased < size; ++erased) {
        data[erased] = 0x00;
    }
#endif
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Decode a padded base64 string. EVP_DecodeBlock always writes whole blocks, the trailing pad characters
// determine how many of the final bytes are real data.
//----------------------------------------------------------------------------------------------------------------------
Security::OptionalBuffer Security::DecodeBase64(std::string_view encoded)
{
    if (encoded.empty()) { return Buffer{}; }
    if (encoded.size() % 4 != 0 || !std::in_range<std::int32_t>(encoded.size())) { return {}; }

    Buffer decoded((encoded.size() / 4) * 3, 0x00);
    auto const pEncoded = reinterpret_cast<std::uint8_t const*>(encoded.data());
    std::int32_t const result = EVP_DecodeBlock(decoded.data(), pEncoded, static_cast<std::int32_t>(encoded.size()));
    if (result < 0) { return {}; }

    std::size_t padding = 0;
    for (auto itr = encoded.rbegin(); itr != encoded.rend() && *itr == '=' && padding < 2; ++itr) { ++padding; }
    decoded.resize(static_cast<std::size_t>(result) - padding);

    return decoded;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Security::DeriveKey(
    ReadableView password, std::string_view salt, std::uint32_t iterations, std::size_t size)
{
    if (!std::in_range<std::int32_t>(password.size()) || !std::in_range<std::int32_t>(salt.size()) ||
        !std::in_range<std::int32_t>(iterations) || !std::in_range<std::int32_t>(size)) {
        throw std::runtime_error("Key derivation parameters exceed the supported range!");
    }

    Buffer key(size, 0x00);
    std::int32_t const result = PKCS5_PBKDF2_HMAC(
        reinterpret_cast<char const*>(password.data()), static_cast<std::int32_t>(password.size()),
        reinterpret_cast<std::uint8_t const*>(salt.data()), static_cast<std::int32_t>(salt.size()),
        static_cast<std::int32_t>(iterations), EVP_sha256(),
        static_cast<std::int32_t>(key.size()), key.data());

    if (result != 1) {
        EraseMemory(key.data(), key.size());
        throw std::runtime_error("Failed to derive a key from the provided password!");
    }

    return key;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Security::GenerateDigest(ReadableView data)
{
    Buffer digest(SHA256_DIGEST_LENGTH, 0x00);
    if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
        throw std::runtime_error("Failed to generate a digest of the provided data!");
    }
    return digest;
}

//----------------------------------------------------------------------------------------------------------------------
