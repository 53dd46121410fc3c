#pragma once

#include "DeviceDescriptor.hpp"
#include <string>

namespace deebot::topics {

/// Unsolicited device events: iot/atr/{event}/{did}/{class}/{resource}/j
inline std::string eventSubscription(const DeviceDescriptor& device) {
    return "iot/atr/+/" + device.deviceId + "/" + device.deviceClass + "/" + device.resource + "/j";
}

/// Command replies addressed to this client
inline std::string replySubscription(const DeviceDescriptor& device, const std::string& userId,
                                     const std::string& clientResource) {
    return "iot/p2p/+/" + device.deviceId + "/" + device.deviceClass + "/" + device.resource + "/" +
           userId + "/ecouser/" + clientResource + "/p/+/j";
}

/// Command request from this client to the device
inline std::string commandTopic(const DeviceDescriptor& device, const std::string& userId,
                                const std::string& clientResource, const std::string& command,
                                const std::string& requestId) {
    return "iot/p2p/" + command + "/" + userId + "/ecouser/" + clientResource + "/" +
           device.deviceId + "/" + device.deviceClass + "/" + device.resource + "/q/" + requestId + "/j";
}

inline std::string mqttClientId(const std::string& userId, const std::string& clientResource) {
    return userId + "@ecouser/" + clientResource;
}

inline std::string mqttUsername(const std::string& userId) {
    return userId + "@ecouser.net";
}

} // namespace deebot::topics
