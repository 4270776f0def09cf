//----------------------------------------------------------------------------------------------------------------------
// File: Keyring.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Keyring.hpp"
#include "SecurityUtils.hpp"
#include "Components/Core/Error.hpp"
#include "Utilities/NumberUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

namespace Element {

constexpr std::string_view Root = "Keyring";
constexpr std::string_view Interface = "Interface";
constexpr std::string_view Devices = "Devices";
constexpr std::string_view Device = "Device";
constexpr std::string_view Attributes = "<xmlattr>";

} // Element namespace

namespace Attribute {

constexpr std::string_view Created = "Created";
constexpr std::string_view Type = "Type";
constexpr std::string_view Host = "Host";
constexpr std::string_view IndividualAddress = "IndividualAddress";
constexpr std::string_view User = "UserID";
constexpr std::string_view Password = "Password";
constexpr std::string_view ManagementPassword = "ManagementPassword";
constexpr std::string_view Authentication = "Authentication";

} // Attribute namespace

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

[[noreturn]] void ThrowInvalidKeyring(std::filesystem::path const& path, std::string_view reason);

std::optional<std::string> ReadAttribute(boost::property_tree::ptree const& element, std::string_view name);

Security::OptionalBuffer ReadEncryptedAttribute(
    std::filesystem::path const& path, boost::property_tree::ptree const& element, std::string_view name);

Security::Keyring::Interface ParseInterface(
    std::filesystem::path const& path, boost::property_tree::ptree const& element, Medium::IndividualAddress& host);

Security::Keyring::Device ParseDevice(std::filesystem::path const& path, boost::property_tree::ptree const& element);

// Note: Owns decrypted or derived key material and wipes it when the scope ends.
class ErasingBuffer
{
public:
    explicit ErasingBuffer(Security::Buffer&& buffer) : m_buffer(std::move(buffer)) {}
    ~ErasingBuffer() { Security::EraseMemory(m_buffer.data(), m_buffer.size()); }

    ErasingBuffer(ErasingBuffer const&) = delete;
    ErasingBuffer& operator=(ErasingBuffer const&) = delete;

    [[nodiscard]] Security::ReadableView GetData() const { return m_buffer; }

private:
    Security::Buffer m_buffer;
};

Security::Buffer Decrypt(
    Security::ReadableView encrypted, Security::ReadableView key, Security::ReadableView iv);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Security::Keyring::Keyring(
    std::filesystem::path const& path, std::string const& created, InterfaceMap&& interfaces, DeviceMap&& devices)
    : m_path(path)
    , m_created(created)
    , m_interfaces(std::move(interfaces))
    , m_devices(std::move(devices))
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::SharedKeyring Security::Keyring::Load(std::filesystem::path const& path)
{
    using boost::property_tree::ptree;

    ptree tree;
    try {
        boost::property_tree::read_xml(path.string(), tree, boost::property_tree::xml_parser::trim_whitespace);
    } catch (boost::property_tree::xml_parser_error const& exception) {
        local::ThrowInvalidKeyring(path, exception.message());
    }

    auto const optRoot = tree.get_child_optional(std::string{ local::Element::Root });
    if (!optRoot) { local::ThrowInvalidKeyring(path, "missing keyring element"); }

    auto const optCreated = local::ReadAttribute(*optRoot, local::Attribute::Created);
    if (!optCreated) { local::ThrowInvalidKeyring(path, "missing creation timestamp"); }

    InterfaceMap interfaces;
    DeviceMap devices;
    for (auto const& [name, element] : *optRoot) {
        if (name == local::Element::Interface) {
            Medium::IndividualAddress host;
            auto record = local::ParseInterface(path, element, host);
            interfaces[host].emplace_back(std::move(record));
        } else if (name == local::Element::Devices) {
            for (auto const& [deviceName, deviceElement] : element) {
                if (deviceName != local::Element::Device) { continue; }
                auto device = local::ParseDevice(path, deviceElement);
                auto const address = device.address;
                devices.insert_or_assign(address, std::move(device));
            }
        }
    }

    return std::make_shared<Keyring const>(path, *optCreated, std::move(interfaces), std::move(devices));
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Security::Keyring::GetPath() const
{
    return m_path;
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Security::Keyring::GetCreated() const
{
    return m_created;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Keyring::InterfaceMap const& Security::Keyring::Interfaces() const
{
    return m_interfaces;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Keyring::DeviceMap const& Security::Keyring::Devices() const
{
    return m_devices;
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Passwords are encrypted with AES-128-CBC. The key is derived from the keyring password, the 
// initialization vector is taken from the digest of the keyring's creation timestamp. The plaintext carries an 8 byte
// random prefix and is padded with bytes whose value is the padding length.
//----------------------------------------------------------------------------------------------------------------------
std::string Security::Keyring::DecryptPassword(ReadableView encrypted, std::string_view passphrase) const
{
    if (encrypted.empty()) { return {}; }

    ReadableView const password{ reinterpret_cast<std::uint8_t const*>(passphrase.data()), passphrase.size() };
    local::ErasingBuffer const key{ DeriveKey(password, KeySalt, KeyIterations, KeySize) };

    ReadableView const created{ reinterpret_cast<std::uint8_t const*>(m_created.data()), m_created.size() };
    auto const digest = GenerateDigest(created);
    ReadableView const iv{ digest.data(), KeySize };

    local::ErasingBuffer const decrypted{ local::Decrypt(encrypted, key.GetData(), iv) };
    auto const data = decrypted.GetData();
    std::size_t const padding = data.back();
    if (padding == 0 || data.size() < PasswordPrefixSize + padding) {
        throw Core::Error(
            Core::Error::Category::Configuration, "failed to decrypt keyring password, wrong keyring password?");
    }

    auto const begin = data.begin() + PasswordPrefixSize;
    auto const end = data.end() - static_cast<std::ptrdiff_t>(padding);
    return std::string(begin, end);
}

//----------------------------------------------------------------------------------------------------------------------

void local::ThrowInvalidKeyring(std::filesystem::path const& path, std::string_view reason)
{
    std::ostringstream oss;
    oss << "failed to load keyring " << path << ": " << reason;
    throw Core::Error(Core::Error::Category::Configuration, oss.str());
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::ReadAttribute(boost::property_tree::ptree const& element, std::string_view name)
{
    std::ostringstream oss;
    oss << Element::Attributes << '.' << name;
    auto const optValue = element.get_optional<std::string>(oss.str());
    if (!optValue) { return {}; }
    return *optValue;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer local::ReadEncryptedAttribute(
    std::filesystem::path const& path, boost::property_tree::ptree const& element, std::string_view name)
{
    auto const optEncoded = ReadAttribute(element, name);
    if (!optEncoded) { return {}; }

    auto optDecoded = Security::DecodeBase64(*optEncoded);
    if (!optDecoded) {
        std::ostringstream oss;
        oss << "attribute " << name << " is not valid base64";
        ThrowInvalidKeyring(path, oss.str());
    }
    return optDecoded;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Keyring::Interface local::ParseInterface(
    std::filesystem::path const& path, boost::property_tree::ptree const& element, Medium::IndividualAddress& host)
{
    auto const optAddress = ReadAttribute(element, Attribute::IndividualAddress);
    if (!optAddress) { ThrowInvalidKeyring(path, "interface without individual address"); }

    Security::Keyring::Interface record{
        .type = ReadAttribute(element, Attribute::Type).value_or(""),
        .address = Medium::IndividualAddress::Parse(*optAddress),
        .user = 0,
        .password = ReadEncryptedAttribute(path, element, Attribute::Password),
        .authentication = ReadEncryptedAttribute(path, element, Attribute::Authentication),
    };

    if (auto const optUser = ReadAttribute(element, Attribute::User); optUser) {
        auto const optDecoded = NumberUtils::DecodeInteger<std::uint8_t>(*optUser);
        if (!optDecoded) { ThrowInvalidKeyring(path, "interface with invalid user identifier"); }
        record.user = *optDecoded;
    }

    // USB interfaces are not hosted by another device, they are filed under their own address.
    auto const optHost = ReadAttribute(element, Attribute::Host);
    host = (optHost) ? Medium::IndividualAddress::Parse(*optHost) : record.address;

    return record;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Keyring::Device local::ParseDevice(
    std::filesystem::path const& path, boost::property_tree::ptree const& element)
{
    auto const optAddress = ReadAttribute(element, Attribute::IndividualAddress);
    if (!optAddress) { ThrowInvalidKeyring(path, "device without individual address"); }

    return Security::Keyring::Device{
        .address = Medium::IndividualAddress::Parse(*optAddress),
        .password = ReadEncryptedAttribute(path, element, Attribute::ManagementPassword),
        .authentication = ReadEncryptedAttribute(path, element, Attribute::Authentication),
    };
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer local::Decrypt(
    Security::ReadableView encrypted, Security::ReadableView key, Security::ReadableView iv)
{
    constexpr std::size_t BlockSize = 16;
    if (encrypted.size() % BlockSize != 0 || !std::in_range<std::int32_t>(encrypted.size())) {
        throw Core::Error(Core::Error::Category::Configuration, "keyring password has an invalid length");
    }

    CipherContext upCipherContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!upCipherContext) { throw std::runtime_error("Failed to create a cipher context!"); }

    auto const pContext = upCipherContext.get();
    if (EVP_DecryptInit_ex(pContext, EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("Failed to initialize the keyring cipher!");
    }
    EVP_CIPHER_CTX_set_padding(pContext, 0);

    Security::Buffer plaintext(encrypted.size(), 0x00);
    std::int32_t decrypted = 0;
    std::int32_t finalized = 0;
    bool const success =
        EVP_DecryptUpdate(
            pContext, plaintext.data(), &decrypted, encrypted.data(), static_cast<std::int32_t>(encrypted.size())) == 1 &&
        EVP_DecryptFinal_ex(pContext, plaintext.data() + decrypted, &finalized) == 1;

    if (!success) {
        Security::EraseMemory(plaintext.data(), plaintext.size());
        throw Core::Error(Core::Error::Category::Configuration, "failed to decrypt keyring password");
    }

    plaintext.resize(static_cast<std::size_t>(decrypted + finalized));
    return plaintext;
}

//----------------------------------------------------------------------------------------------------------------------
