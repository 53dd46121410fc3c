#include "DeebotClient.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "adapters/JsonMessageCodec.hpp"
#include <iostream>
#include <stdexcept>

namespace deebot {

DeebotClient::DeebotClient(std::shared_ptr<ports::IHttpClient> http,
                           TransportFactory transportFactory,
                           std::shared_ptr<CredentialStore> store,
                           std::shared_ptr<IClock> clock,
                           std::shared_ptr<IRng> rng,
                           ClientConfig config)
    : transportFactory_(std::move(transportFactory))
    , clock_(std::move(clock))
    , rng_(std::move(rng))
    , config_(std::move(config)) {
    if (!http || !transportFactory_ || !store || !clock_ || !rng_) {
        throw std::invalid_argument("DeebotClient dependencies cannot be null");
    }
    
    portal_ = std::make_shared<PortalClient>(http, config_.auth.clientDeviceId);
    session_ = std::make_shared<AuthSessionManager>(http, portal_, store, clock_, config_.auth);
    directory_ = std::make_shared<DeviceDirectory>(portal_, session_);
    codec_ = std::make_shared<adapters::JsonMessageCodec>(clock_);
}

DeebotClient::~DeebotClient() {
    closeAll();
}

Credentials DeebotClient::login(const std::string& username, const std::string& password,
                                const Region& region) {
    return session_->login(username, password, region);
}

Credentials DeebotClient::loginWithHash(const std::string& username, const std::string& passwordHash,
                                        const Region& region) {
    return session_->loginWithHash(username, passwordHash, region);
}

std::vector<DeviceDescriptor> DeebotClient::listDevices() {
    return directory_->listDevices();
}

DeviceHandle DeebotClient::openDevice(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(devicesMutex_);
    
    auto it = devices_.find(deviceId);
    if (it != devices_.end()) {
        if (it->second->isLive()) {
            return it->second;
        }
        devices_.erase(it);
    }
    
    DeviceDescriptor device = directory_->resolve(deviceId);
    Credentials credentials = session_->ensureValid();
    
    auto transport = transportFactory_(device);
    if (!transport) {
        throw std::runtime_error("Transport factory returned no transport for " + deviceId);
    }
    
    ChannelOptions options;
    options.clientResource = portal_->clientResource();
    options.connectTimeout = config_.connectTimeout;
    options.verifyServer = config_.verifyServerCert;
    
    auto retryPolicy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(
        config_.backoffBase, config_.backoffFactor, config_.backoffCap, config_.backoffMaxAttempts);
    auto channel = std::make_shared<RealtimeChannel>(transport, codec_, session_, retryPolicy, options);
    
    auto handle = std::make_shared<DeviceSession>(device, channel, codec_, rng_, clock_,
                                                  config_.commandTimeout, config_.staleness);
    handle->open(credentials);
    
    devices_[deviceId] = handle;
    std::cout << "[Client] Opened " << (device.nickname.empty() ? device.deviceId : device.nickname) << std::endl;
    return handle;
}

nlohmann::json DeebotClient::invoke(const DeviceHandle& device, const std::string& command,
                                    const nlohmann::json& payload, std::chrono::milliseconds timeout) {
    requireHandle(device);
    auto effective = timeout.count() > 0 ? timeout : device->commandTimeout();
    return device->dispatcher().invoke(command, payload, effective).fields;
}

DeviceState DeebotClient::currentState(const DeviceHandle& device) const {
    requireHandle(device);
    return device->state().snapshot();
}

std::shared_ptr<StateWatch> DeebotClient::watchState(const DeviceHandle& device, const std::string& component) {
    requireHandle(device);
    return device->state().subscribe(component);
}

void DeebotClient::closeDevice(const DeviceHandle& device) {
    requireHandle(device);
    device->close();
    
    std::lock_guard<std::mutex> lock(devicesMutex_);
    auto it = devices_.find(device->device().deviceId);
    if (it != devices_.end() && it->second == device) {
        devices_.erase(it);
    }
}

void DeebotClient::closeAll() {
    std::map<std::string, DeviceHandle> devices;
    {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        devices.swap(devices_);
    }
    for (auto& [deviceId, handle] : devices) {
        handle->close();
    }
}

void DeebotClient::requireHandle(const DeviceHandle& device) {
    if (!device) {
        throw std::invalid_argument("Device handle cannot be null");
    }
}

} // namespace deebot
