//----------------------------------------------------------------------------------------------------------------------
// File: NetworkLink.hpp
// Description: The handles returned by a link provider. A network link carries group and individual communication
// over its medium, a management connection carries local device management of a KNXnet/IP interface.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Medium/Settings.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class INetworkLink
{
public:
    virtual ~INetworkLink() = default;

    [[nodiscard]] virtual std::string GetName() const = 0;
    [[nodiscard]] virtual Medium::SharedSettings const& GetMedium() const = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;

    virtual void Close() = 0;
};

//----------------------------------------------------------------------------------------------------------------------

class IManagementConnection
{
public:
    virtual ~IManagementConnection() = default;

    [[nodiscard]] virtual std::string GetName() const = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;

    virtual void Close() = 0;
};

//----------------------------------------------------------------------------------------------------------------------

using SharedNetworkLink = std::shared_ptr<INetworkLink>;
using SharedManagementConnection = std::shared_ptr<IManagementConnection>;

//----------------------------------------------------------------------------------------------------------------------
