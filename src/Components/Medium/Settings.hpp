//----------------------------------------------------------------------------------------------------------------------
// File: Settings.hpp
// Description: Per medium configuration shared between the option set and the link that is eventually opened. The
// settings hold the local device address and, for powerline and radio frequency networks, the domain address.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "IndividualAddress.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Medium {
//----------------------------------------------------------------------------------------------------------------------

enum class Type : std::uint32_t { TP1, PL110, KnxIp, RF, Invalid };

static std::unordered_map<std::string, Type> const TypeStringTranslations = {
    { "tp1", Type::TP1 },
    { "p110", Type::PL110 },
    { "pl110", Type::PL110 },
    { "knxip", Type::KnxIp },
    { "rf", Type::RF },
};

[[nodiscard]] Type ParseMedium(std::string name);
[[nodiscard]] std::string_view MediumToString(Type type);

class Settings;

using SharedSettings = std::shared_ptr<Settings>;
using DomainAddress = std::vector<std::uint8_t>;

//----------------------------------------------------------------------------------------------------------------------
} // Medium namespace
//----------------------------------------------------------------------------------------------------------------------

class Medium::Settings
{
public:
    static constexpr IndividualAddress BackboneRouter{ 0x0000 };
    static constexpr IndividualAddress UnregisteredDevice{ 0x0F, 0x0F, 0xFF };
    static constexpr std::size_t PowerlineDomainSize = 2;
    static constexpr std::size_t RadioFrequencyDomainSize = 6;

    explicit Settings(Type type, IndividualAddress const& device = BackboneRouter);

    // Note: Creates the settings for a medium identifier as given on the command line (i.e. "tp1"). An unknown
    // identifier raises a configuration error.
    [[nodiscard]] static SharedSettings Create(std::string_view identifier);
    [[nodiscard]] static SharedSettings Create(Type type);

    [[nodiscard]] Type GetMedium() const;
    [[nodiscard]] std::string_view GetMediumString() const;

    [[nodiscard]] IndividualAddress const& GetDeviceAddress() const;
    void SetDeviceAddress(IndividualAddress const& address);

    [[nodiscard]] bool UsesDomainAddress() const;
    [[nodiscard]] std::size_t GetDomainAddressSize() const;
    [[nodiscard]] DomainAddress const& GetDomainAddress() const;
    void SetDomainAddress(DomainAddress const& domain);

private:
    Type m_type;
    IndividualAddress m_device;
    DomainAddress m_domain;
};

//----------------------------------------------------------------------------------------------------------------------
