//----------------------------------------------------------------------------------------------------------------------
// File: PasswordHash.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "PasswordHash.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

Security::Secret HashPassword(std::string_view password, std::string_view salt);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::Secret Security::HashUserPassword(std::string_view password)
{
    return local::HashPassword(password, UserPasswordSalt);
}

//----------------------------------------------------------------------------------------------------------------------

Security::Secret Security::HashDeviceAuthenticationPassword(std::string_view password)
{
    return local::HashPassword(password, DeviceAuthenticationSalt);
}

//----------------------------------------------------------------------------------------------------------------------

Security::Secret local::HashPassword(std::string_view password, std::string_view salt)
{
    Security::ReadableView const view{ reinterpret_cast<std::uint8_t const*>(password.data()), password.size() };
    auto derived = Security::DeriveKey(view, salt, Security::PasswordHashIterations, Security::Secret::Size);
    Security::Secret secret{ derived };
    Security::EraseMemory(derived.data(), derived.size());
    return secret;
}

//----------------------------------------------------------------------------------------------------------------------
