#pragma once

#include <cstdint>
#include <string>

namespace deebot {

/**
 * @brief Registered device and its realtime endpoint
 * 
 * Immutable after directory resolution.
 */
struct DeviceDescriptor {
    std::string deviceId;          ///< Vendor device ID ("did")
    std::string name;              ///< Short device name
    std::string nickname;          ///< User-assigned name
    std::string deviceClass;       ///< Device class used in topics
    std::string model;             ///< Marketing model name
    std::string resource;          ///< Device resource used in topics
    std::string productCategory;   ///< e.g. "DEEBOT"
    int status = 0;                ///< 1 when the cloud reports the device online
    std::string brokerHost;        ///< MQTT broker host
    std::uint16_t brokerPort = 8883;   ///< MQTT broker port (TLS)
};

} // namespace deebot
