#include "DeviceDirectory.hpp"
#include "Errors.hpp"
#include <iostream>
#include <stdexcept>

namespace deebot {

DeviceDirectory::DeviceDirectory(std::shared_ptr<PortalClient> portal,
                                 std::shared_ptr<ports::ISessionProvider> session)
    : portal_(std::move(portal)), session_(std::move(session)) {
    if (!portal_ || !session_) {
        throw std::invalid_argument("DeviceDirectory dependencies cannot be null");
    }
}

std::vector<DeviceDescriptor> DeviceDirectory::listDevices() {
    Credentials credentials = session_->ensureValid();
    
    nlohmann::json response;
    try {
        response = portal_->post(credentials.region, PortalClient::kAppPath,
                                 {{"userid", credentials.userId}, {"todo", "GetGlobalDeviceList"}},
                                 &credentials);
    } catch (const TransportError& e) {
        std::cerr << "[Directory] Device list request failed: " << e.what() << std::endl;
        throw DirectoryError(DirectoryError::Code::Unavailable, "device list request failed",
                             ErrorContext{"", "", e.what()});
    }
    
    if (PortalClient::isTokenRejection(response)) {
        std::cerr << "[Directory] Portal rejected the session token" << std::endl;
        session_->invalidate();
        throw AuthError(AuthError::Code::TokenRejected, "portal rejected the session token",
                        ErrorContext{"", "", response.dump()});
    }
    
    if (!response.contains("devices") || !response["devices"].is_array()) {
        throw DirectoryError(DirectoryError::Code::Unavailable, "device list response has no devices array",
                             ErrorContext{"", "", response.dump()});
    }
    
    std::vector<DeviceDescriptor> devices;
    for (const auto& device : response["devices"]) {
        if (!device.is_object() || !device.contains("did")) {
            std::cerr << "[Directory] Skipping malformed device entry" << std::endl;
            continue;
        }
        devices.push_back(parseDevice(device, credentials.region));
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_ = devices;
    }
    
    std::cout << "[Directory] Found " << devices.size() << " device(s)" << std::endl;
    if (devices.empty()) {
        throw DirectoryError(DirectoryError::Code::Empty, "account has no registered devices");
    }
    return devices;
}

DeviceDescriptor DeviceDirectory::resolve(const std::string& deviceId) {
    for (const auto& device : knownDevices()) {
        if (device.deviceId == deviceId) {
            return device;
        }
    }
    throw DirectoryError(DirectoryError::Code::NotFound, "device not registered to this account",
                         ErrorContext{deviceId, "", ""});
}

DeviceDescriptor DeviceDirectory::resolveByName(const std::string& name) {
    auto devices = knownDevices();
    for (const auto& device : devices) {
        if (device.nickname == name) {
            return device;
        }
    }
    for (const auto& device : devices) {
        if (device.name == name || device.deviceId == name) {
            return device;
        }
    }
    throw DirectoryError(DirectoryError::Code::NotFound, "no device named '" + name + "'");
}

std::string DeviceDirectory::brokerHostFor(const Region& region) {
    return "mq-" + (region.isChina() ? std::string("cn") : region.continent) + ".ecouser.net";
}

std::vector<DeviceDescriptor> DeviceDirectory::cachedOrList() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cache_) {
            return *cache_;
        }
    }
    return listDevices();
}

std::vector<DeviceDescriptor> DeviceDirectory::knownDevices() {
    // An empty account means the lookup found nothing, whether or not the list is cached
    try {
        return cachedOrList();
    } catch (const DirectoryError& e) {
        if (e.code() != DirectoryError::Code::Empty) {
            throw;
        }
        return {};
    }
}

DeviceDescriptor DeviceDirectory::parseDevice(const nlohmann::json& device, const Region& region) {
    auto text = [&device](const char* key) {
        if (device.contains(key) && device[key].is_string()) {
            return device[key].get<std::string>();
        }
        return std::string();
    };
    
    DeviceDescriptor descriptor;
    descriptor.deviceId = text("did");
    descriptor.name = text("name");
    descriptor.nickname = text("nick");
    descriptor.deviceClass = text("class");
    descriptor.model = text("model");
    descriptor.resource = text("resource");
    descriptor.productCategory = text("product_category");
    if (device.contains("status") && device["status"].is_number_integer()) {
        descriptor.status = device["status"].get<int>();
    }
    descriptor.brokerHost = brokerHostFor(region);
    descriptor.brokerPort = kBrokerPort;
    return descriptor;
}

} // namespace deebot
