//----------------------------------------------------------------------------------------------------------------------
// File: Secret.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Secret.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityUtils.hpp"
#include "Components/Core/Error.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/hex.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <iterator>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t HexSize = Security::Secret::Size * 2;

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::Secret Security::DecodeSecret(std::string_view hex)
{
    if (hex.size() != 0 && hex.size() != local::HexSize) {
        std::ostringstream oss;
        oss << "wrong KNX key length, requires " << Secret::Size << " bytes (" << local::HexSize << " hex chars)";
        throw Core::Error(Core::Error::Category::Configuration, oss.str());
    }

    Buffer decoded;
    decoded.reserve(Secret::Size);
    try {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(decoded));
    } catch (boost::algorithm::hex_decode_error const&) {
        EraseMemory(decoded.data(), decoded.size());
        throw Core::Error(Core::Error::Category::Configuration, "KNX key contains non-hexadecimal characters");
    }

    Secret secret{ decoded };
    EraseMemory(decoded.data(), decoded.size());
    return secret;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Secret::Secret(ReadableView data)
{
    if (!data.empty() && data.size() != Size) {
        throw Core::Error(Core::Error::Category::Configuration, "wrong KNX key length, requires 16 bytes");
    }
    std::ranges::copy(data, m_data.begin());
    m_size = data.size();
}

//----------------------------------------------------------------------------------------------------------------------

Security::Secret::~Secret()
{
    EraseMemory(m_data.data(), m_data.size());
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::Secret::GetData() const
{
    return ReadableView{ m_data.data(), m_size };
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Security::Secret::GetSize() const
{
    return m_size;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::Secret::IsEmpty() const
{
    return m_size == 0;
}

//----------------------------------------------------------------------------------------------------------------------
