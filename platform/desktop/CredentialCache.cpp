#include "CredentialCache.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>

namespace deebot {

CredentialCache::CredentialCache(std::string path)
    : path_(std::move(path)) {
}

std::optional<Credentials> CredentialCache::load() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    try {
        nlohmann::json doc = nlohmann::json::parse(file);
        auto credentials = fromJson(doc);
        std::cout << "[Config] Loaded cached credentials for " << credentials.userId << std::endl;
        return credentials;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Config] Ignoring unreadable credential cache " << path_ << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool CredentialCache::save(const Credentials& credentials) const {
    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[Config] Could not write credential cache: " << path_ << std::endl;
        return false;
    }
    
    file << toJson(credentials).dump(2) << std::endl;
    return file.good();
}

bool CredentialCache::remove() const {
    return std::remove(path_.c_str()) == 0;
}

void CredentialCache::attach(CredentialStore& store) const {
    if (auto cached = load()) {
        store.store(*cached);
    }
    
    std::string path = path_;
    store.setChangeCallback([path](const std::optional<Credentials>& credentials) {
        CredentialCache cache(path);
        if (credentials) {
            cache.save(*credentials);
        } else {
            cache.remove();
        }
    });
}

nlohmann::json CredentialCache::toJson(const Credentials& credentials) {
    auto expiryMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        credentials.accessTokenExpiry.time_since_epoch()).count();
    
    return {
        {"uid", credentials.userId},
        {"access_token", credentials.accessToken},
        {"access_token_expiry_ms", expiryMs},
        {"auth_code", credentials.authCode},
        {"country", credentials.region.country},
        {"continent", credentials.region.continent}
    };
}

Credentials CredentialCache::fromJson(const nlohmann::json& doc) {
    Credentials credentials;
    credentials.userId = doc.at("uid").get<std::string>();
    credentials.accessToken = doc.at("access_token").get<std::string>();
    credentials.accessTokenExpiry = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(doc.at("access_token_expiry_ms").get<std::int64_t>()));
    credentials.authCode = doc.value("auth_code", "");
    credentials.region.country = doc.at("country").get<std::string>();
    credentials.region.continent = doc.at("continent").get<std::string>();
    return credentials;
}

} // namespace deebot
