/**
 * @file DeebotClient.hpp
 * @brief Library entry point for the vendor cloud client
 * 
 * Composes the session manager, device directory and per-device sessions:
 * login -> listDevices -> openDevice -> invoke / currentState / watchState.
 * 
 * @note One live connection per device; openDevice() returns the existing
 *       session while it is live
 */

#pragma once

#include "AuthSessionManager.hpp"
#include "DeviceDirectory.hpp"
#include "DeviceSession.hpp"
#include "IRng.hpp"
#include "ports/IHttpClient.hpp"
#include "ports/ITransport.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace deebot {

/**
 * @brief Client-wide settings
 */
struct ClientConfig {
    AuthConfig auth;                                        ///< Session settings
    std::chrono::milliseconds backoffBase{1000};            ///< First reconnect delay
    double backoffFactor = 2.0;                             ///< Delay multiplier per attempt
    std::chrono::milliseconds backoffCap{60000};            ///< Longest reconnect delay
    int backoffMaxAttempts = 0;                             ///< 0 retries forever
    std::chrono::milliseconds connectTimeout{30000};        ///< Broker connect timeout
    bool verifyServerCert = false;                          ///< Broker certificate validation
    std::chrono::milliseconds commandTimeout{5000};         ///< Default command timeout
    std::chrono::seconds staleness{0};                      ///< State staleness threshold, 0 disables
};

using DeviceHandle = std::shared_ptr<DeviceSession>;

class DeebotClient {
public:
    /// Creates the transport for one device connection
    using TransportFactory = std::function<std::shared_ptr<ports::ITransport>(const DeviceDescriptor&)>;
    
    /**
     * @throws std::invalid_argument if a dependency is null
     */
    DeebotClient(std::shared_ptr<ports::IHttpClient> http,
                 TransportFactory transportFactory,
                 std::shared_ptr<CredentialStore> store,
                 std::shared_ptr<IClock> clock,
                 std::shared_ptr<IRng> rng,
                 ClientConfig config);
    ~DeebotClient();
    
    DeebotClient(const DeebotClient&) = delete;
    DeebotClient& operator=(const DeebotClient&) = delete;
    
    Credentials login(const std::string& username, const std::string& password, const Region& region);
    Credentials loginWithHash(const std::string& username, const std::string& passwordHash,
                              const Region& region);
    
    std::vector<DeviceDescriptor> listDevices();
    
    /**
     * @brief Open (or return the live) session for a device
     * @throws DirectoryError NotFound, AuthError, ChannelError
     */
    DeviceHandle openDevice(const std::string& deviceId);
    
    /**
     * @brief Send a command and wait for its reply data
     * @param timeout Zero uses the configured default
     * @throws CommandError
     */
    nlohmann::json invoke(const DeviceHandle& device, const std::string& command,
                          const nlohmann::json& payload,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    
    DeviceState currentState(const DeviceHandle& device) const;
    std::shared_ptr<StateWatch> watchState(const DeviceHandle& device, const std::string& component);
    
    void closeDevice(const DeviceHandle& device);
    void closeAll();
    
    AuthSessionManager& session() { return *session_; }
    DeviceDirectory& directory() { return *directory_; }
    
private:
    TransportFactory transportFactory_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IRng> rng_;
    ClientConfig config_;
    
    std::shared_ptr<PortalClient> portal_;
    std::shared_ptr<AuthSessionManager> session_;
    std::shared_ptr<DeviceDirectory> directory_;
    std::shared_ptr<ports::IMessageCodec> codec_;
    
    std::mutex devicesMutex_;
    std::map<std::string, DeviceHandle> devices_;
    
    static void requireHandle(const DeviceHandle& device);
};

} // namespace deebot
