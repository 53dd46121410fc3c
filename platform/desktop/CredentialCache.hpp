/**
 * @file CredentialCache.hpp
 * @brief JSON file persistence for session credentials
 * 
 * Keeps the CLI logged in between runs. The cache observes a CredentialStore
 * through its change callback: every store() rewrites the file and clear()
 * removes it.
 */

#pragma once

#include "CredentialStore.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace deebot {

class CredentialCache {
public:
    explicit CredentialCache(std::string path);
    
    /**
     * @brief Read cached credentials
     * @return nullopt when the file is missing or unreadable
     */
    std::optional<Credentials> load() const;
    
    bool save(const Credentials& credentials) const;
    bool remove() const;
    
    /// Restore cached credentials into the store and follow its changes
    void attach(CredentialStore& store) const;
    
    const std::string& path() const { return path_; }
    
    static nlohmann::json toJson(const Credentials& credentials);
    
    /// @throws nlohmann::json::exception for missing or mistyped fields
    static Credentials fromJson(const nlohmann::json& doc);
    
private:
    std::string path_;
};

} // namespace deebot
