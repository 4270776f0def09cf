//----------------------------------------------------------------------------------------------------------------------
// File: Settings.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Settings.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Error.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/string.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

Medium::Type Medium::ParseMedium(std::string name)
{
    boost::algorithm::to_lower(name);

    if (auto const itr = TypeStringTranslations.find(name); itr != TypeStringTranslations.end()) {
        return itr->second;
    }

    return Type::Invalid;
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Medium::MediumToString(Type type)
{
    switch (type) {
        case Type::TP1: return "TP1";
        case Type::PL110: return "PL110";
        case Type::KnxIp: return "KNX IP";
        case Type::RF: return "RF";
        default: break;
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------

Medium::Settings::Settings(Type type, IndividualAddress const& device)
    : m_type(type)
    , m_device(device)
    , m_domain()
{
}

//----------------------------------------------------------------------------------------------------------------------

Medium::SharedSettings Medium::Settings::Create(std::string_view identifier)
{
    auto const type = ParseMedium(std::string{ identifier });
    if (type == Type::Invalid) {
        std::ostringstream oss;
        oss << "unknown KNX medium \"" << identifier << "\", use one of [tp1|p110|knxip|rf]";
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }
    return Create(type);
}

//----------------------------------------------------------------------------------------------------------------------

Medium::SharedSettings Medium::Settings::Create(Type type)
{
    return std::make_shared<Settings>(type, BackboneRouter);
}

//----------------------------------------------------------------------------------------------------------------------

Medium::Type Medium::Settings::GetMedium() const
{
    return m_type;
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Medium::Settings::GetMediumString() const
{
    return MediumToString(m_type);
}

//----------------------------------------------------------------------------------------------------------------------

Medium::IndividualAddress const& Medium::Settings::GetDeviceAddress() const
{
    return m_device;
}

//----------------------------------------------------------------------------------------------------------------------

void Medium::Settings::SetDeviceAddress(IndividualAddress const& address)
{
    m_device = address;
}

//----------------------------------------------------------------------------------------------------------------------

bool Medium::Settings::UsesDomainAddress() const
{
    return GetDomainAddressSize() != 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Medium::Settings::GetDomainAddressSize() const
{
    switch (m_type) {
        case Type::PL110: return PowerlineDomainSize;
        case Type::RF: return RadioFrequencyDomainSize;
        default: return 0;
    }
}

//----------------------------------------------------------------------------------------------------------------------

Medium::DomainAddress const& Medium::Settings::GetDomainAddress() const
{
    return m_domain;
}

//----------------------------------------------------------------------------------------------------------------------

void Medium::Settings::SetDomainAddress(DomainAddress const& domain)
{
    if (!UsesDomainAddress()) {
        std::ostringstream oss;
        oss << GetMediumString() << " networks don't use domain addresses, ";
        oss << "use --medium to specify KNX network medium";
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }

    if (domain.size() != GetDomainAddressSize()) {
        std::ostringstream oss;
        oss << GetMediumString() << " domain address requires " << GetDomainAddressSize() << " bytes";
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }

    m_domain = domain;
}

//----------------------------------------------------------------------------------------------------------------------
