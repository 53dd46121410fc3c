/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop CLI
 * 
 * Simple line-based parser for the client settings. Unknown keys are
 * ignored, malformed numbers are reported and leave the default in place.
 * 
 * Supported Sections:
 * - [account]: username, password_hash, country, continent, client_device_id
 * - [session]: renewal_margin_seconds, token_lifetime_hours
 * - [channel]: backoff_base_ms, backoff_factor, backoff_cap_ms,
 *              backoff_max_attempts, connect_timeout_seconds, verify_server_cert
 * - [commands]: default_timeout_ms
 * - [state]: staleness_seconds
 * - [cache]: credentials_path
 * 
 * @note DEEBOT_USERNAME, DEEBOT_PASSWORD_HASH, DEEBOT_COUNTRY and
 *       DEEBOT_CONTINENT override the [account] values
 */

#pragma once

#include "DeebotClient.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace deebot {

/**
 * @brief Account settings used for login and fallback re-login
 */
struct AccountConfig {
    std::string username;
    std::string passwordHash;   ///< MD5 of the password, never the clear text
    std::string country;
    std::string continent;      ///< Inferred from country when empty
    
    bool hasLogin() const { return !username.empty() && !passwordHash.empty(); }
};

/**
 * @brief Complete desktop configuration
 */
struct DesktopConfig {
    AccountConfig account;
    ClientConfig client;
    std::string credentialsPath = "deebot.credentials.json";
};

class TomlConfig {
public:
    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Configuration with defaults for missing values
     * @note A missing file yields the defaults and a warning
     */
    static DesktopConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        
        if (!file.is_open()) {
            std::cerr << "[Config] Could not open config file: " << filename << std::endl;
            return DesktopConfig{};
        }
        
        return parse(file);
    }
    
    /**
     * @brief Parse TOML text from a stream
     */
    static DesktopConfig parse(std::istream& input) {
        DesktopConfig config;
        
        std::string currentSection;
        std::string line;
        while (std::getline(input, line)) {
            // Remove comments and trim whitespace
            size_t commentPos = line.find('#');
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }
            
            trim(line);
            
            // Skip empty lines
            if (line.empty()) {
                continue;
            }
            
            // Handle section headers
            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }
            
            // Parse key = value
            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }
            
            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            
            // Clean up key and value
            trim(key);
            trim(value);
            unquote(value);
            
            try {
                applyValue(config, currentSection, key, value);
            } catch (const std::exception&) {
                std::cerr << "[Config] Warning: invalid value for " << currentSection << "." << key
                          << ": " << value << std::endl;
            }
        }
        
        return config;
    }
    
    /**
     * @brief Apply DEEBOT_* environment overrides to the account section
     */
    static void applyEnvironment(DesktopConfig& config) {
        overrideFromEnv("DEEBOT_USERNAME", config.account.username);
        overrideFromEnv("DEEBOT_PASSWORD_HASH", config.account.passwordHash);
        overrideFromEnv("DEEBOT_COUNTRY", config.account.country);
        overrideFromEnv("DEEBOT_CONTINENT", config.account.continent);
    }

private:
    static void applyValue(DesktopConfig& config, const std::string& section,
                           const std::string& key, const std::string& value) {
        auto& client = config.client;
        
        if (section == "account") {
            if (key == "username") {
                config.account.username = value;
            } else if (key == "password_hash") {
                config.account.passwordHash = value;
            } else if (key == "country") {
                config.account.country = lower(value);
            } else if (key == "continent") {
                config.account.continent = lower(value);
            } else if (key == "client_device_id") {
                client.auth.clientDeviceId = value;
            }
        } else if (section == "session") {
            if (key == "renewal_margin_seconds") {
                client.auth.renewalMargin = std::chrono::seconds(std::stoi(value));
            } else if (key == "token_lifetime_hours") {
                client.auth.tokenLifetime = std::chrono::hours(std::stoi(value));
            }
        } else if (section == "channel") {
            if (key == "backoff_base_ms") {
                client.backoffBase = std::chrono::milliseconds(std::stoi(value));
            } else if (key == "backoff_factor") {
                client.backoffFactor = std::stod(value);
            } else if (key == "backoff_cap_ms") {
                client.backoffCap = std::chrono::milliseconds(std::stoi(value));
            } else if (key == "backoff_max_attempts") {
                client.backoffMaxAttempts = std::stoi(value);
            } else if (key == "connect_timeout_seconds") {
                client.connectTimeout = std::chrono::seconds(std::stoi(value));
            } else if (key == "verify_server_cert") {
                client.verifyServerCert = (value == "true" || value == "1");
            }
        } else if (section == "commands") {
            if (key == "default_timeout_ms") {
                client.commandTimeout = std::chrono::milliseconds(std::stoi(value));
            }
        } else if (section == "state") {
            if (key == "staleness_seconds") {
                client.staleness = std::chrono::seconds(std::stoi(value));
            }
        } else if (section == "cache") {
            if (key == "credentials_path") {
                config.credentialsPath = value;
            }
        }
    }
    
    static void overrideFromEnv(const char* name, std::string& target) {
        const char* value = std::getenv(name);
        if (value != nullptr && *value != '\0') {
            target = value;
        }
    }
    
    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }
    
    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
    
    static std::string lower(std::string value) {
        for (auto& c : value) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return value;
    }
};

} // namespace deebot
