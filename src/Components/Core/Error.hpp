//----------------------------------------------------------------------------------------------------------------------
// File: Error.hpp
// Description: The exception type raised by the connection core. Each error carries a category describing whether
// the caller can fix it (configuration), whether a secure link could not be keyed, or whether name resolution, the
// transport or a cancellation request stopped the operation.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Core {
//----------------------------------------------------------------------------------------------------------------------

class Error;

//----------------------------------------------------------------------------------------------------------------------
} // Core namespace
//----------------------------------------------------------------------------------------------------------------------

class Core::Error : public std::runtime_error
{
public:
    enum class Category : std::uint32_t { Configuration, MissingCredential, Resolution, Transport, Interrupted };

    Error(Category category, std::string const& message)
        : std::runtime_error(message)
        , m_category(category)
    {
    }

    [[nodiscard]] Category GetCategory() const noexcept { return m_category; }

    [[nodiscard]] static constexpr std::string_view CategoryToString(Category category)
    {
        switch (category) {
            case Category::Configuration: return "configuration";
            case Category::MissingCredential: return "missing secure credential";
            case Category::Resolution: return "resolution";
            case Category::Transport: return "transport";
            case Category::Interrupted: return "interrupted";
        }
        return "unknown";
    }

private:
    Category m_category;
};

//----------------------------------------------------------------------------------------------------------------------
