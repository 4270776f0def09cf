//----------------------------------------------------------------------------------------------------------------------
// File: Keyring.hpp
// Description: The credentials of a KNX installation as exported by ETS into a ".knxkeys" keyring file. Passwords and
// authentication codes stay encrypted with the keyring password until a caller requests them through
// DecryptPassword. The keyring signature is not verified.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityUtils.hpp"
#include "Components/Medium/IndividualAddress.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class Keyring;

using SharedKeyring = std::shared_ptr<Keyring const>;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::Keyring
{
public:
    static constexpr std::string_view Extension = ".knxkeys";
    static constexpr std::string_view KeySalt = "1.keyring.ets.knx.org";
    static constexpr std::uint32_t KeyIterations = 65536;
    static constexpr std::size_t KeySize = 16;
    static constexpr std::size_t PasswordPrefixSize = 8;

    // Note: A tunneling (or USB) interface of a device. The user identifier is zero when the keyring does not assign
    // one.
    struct Interface {
        std::string type;
        Medium::IndividualAddress address;
        std::uint8_t user;
        OptionalBuffer password;
        OptionalBuffer authentication;
    };

    struct Device {
        Medium::IndividualAddress address;
        OptionalBuffer password;
        OptionalBuffer authentication;
    };

    using InterfaceMap = std::map<Medium::IndividualAddress, std::vector<Interface>>;
    using DeviceMap = std::map<Medium::IndividualAddress, Device>;

    Keyring(std::filesystem::path const& path, std::string const& created, InterfaceMap&& interfaces, DeviceMap&& devices);

    // Note: Reads a keyring file from disk. A missing or malformed file raises a configuration error.
    [[nodiscard]] static SharedKeyring Load(std::filesystem::path const& path);

    [[nodiscard]] std::filesystem::path const& GetPath() const;
    [[nodiscard]] std::string const& GetCreated() const;

    // Note: Interface records keyed by the individual address of the device hosting them.
    [[nodiscard]] InterfaceMap const& Interfaces() const;
    [[nodiscard]] DeviceMap const& Devices() const;

    [[nodiscard]] std::string DecryptPassword(ReadableView encrypted, std::string_view passphrase) const;

private:
    std::filesystem::path m_path;
    std::string m_created;
    InterfaceMap m_interfaces;
    DeviceMap m_devices;
};

//----------------------------------------------------------------------------------------------------------------------
