//----------------------------------------------------------------------------------------------------------------------
// File: PasswordHash.hpp
// Description: The KNX IP Secure password hashes. Both derive a 16 byte secret using PBKDF2-HMAC-SHA256 with 65536
// iterations, they differ only in the salt.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Secret.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t PasswordHashIterations = 65536;
constexpr std::string_view UserPasswordSalt = "user-password.1.secure.ip.knx.org";
constexpr std::string_view DeviceAuthenticationSalt = "device-authentication-code.1.secure.ip.knx.org";

[[nodiscard]] Secret HashUserPassword(std::string_view password);
[[nodiscard]] Secret HashDeviceAuthenticationPassword(std::string_view password);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
