#pragma once

#include "DeviceDescriptor.hpp"
#include "PortalClient.hpp"
#include "ports/ISessionProvider.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace deebot {

/**
 * @brief Resolves the account to its registered devices
 * 
 * The first successful listing is cached; resolve() and resolveByName()
 * read from the cache and list on first use.
 */
class DeviceDirectory {
public:
    static constexpr std::uint16_t kBrokerPort = 8883;

    DeviceDirectory(std::shared_ptr<PortalClient> portal,
                    std::shared_ptr<ports::ISessionProvider> session);

    /**
     * @brief Fetch the device list from the portal and refresh the cache
     * @throws DirectoryError Empty when the account has no devices,
     *         Unavailable when the lookup fails
     * @throws AuthError propagated from the session, TokenRejected when the
     *         portal refuses the token (the session is invalidated first)
     */
    std::vector<DeviceDescriptor> listDevices();

    /// @throws DirectoryError NotFound, also when the account has no devices
    DeviceDescriptor resolve(const std::string& deviceId);

    /// Lookup by nickname, falling back to the short name and then the device ID
    DeviceDescriptor resolveByName(const std::string& name);

    static std::string brokerHostFor(const Region& region);

private:
    std::shared_ptr<PortalClient> portal_;
    std::shared_ptr<ports::ISessionProvider> session_;

    std::mutex mutex_;
    std::optional<std::vector<DeviceDescriptor>> cache_;

    std::vector<DeviceDescriptor> cachedOrList();
    std::vector<DeviceDescriptor> knownDevices();
    static DeviceDescriptor parseDevice(const nlohmann::json& device, const Region& region);
};

} // namespace deebot
