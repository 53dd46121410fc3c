/**
 * @file main_cli.cpp
 * @brief Command-line interface for the Deebot cloud client
 * 
 * Logs in, lists the account's devices and drives one device:
 * 
 *   deebot_cli [--config file] login --username U --password P --country C [--continent X]
 *   deebot_cli [--config file] renew
 *   deebot_cli [--config file] list-devices
 *   deebot_cli [--config file] device <nickname> <action> [args]
 * 
 * Credentials are cached in a JSON file between runs.
 * 
 * @note Includes signal handling so `subscribe` stops cleanly on Ctrl+C
 */

#include "CredentialCache.hpp"
#include "DeebotClient.hpp"
#include "Errors.hpp"
#include "HttplibHttpClient.hpp"
#include "IClock.hpp"
#include "IRng.hpp"
#include "MqttTransportAdapter.hpp"
#include "PahoMqttClient.hpp"
#include "TomlConfig.hpp"
#include "VacuumEvents.hpp"
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <signal.h>
#include <sstream>
#include <thread>
#include <vector>

using namespace deebot;

/// Global flag for graceful shutdown coordination
static volatile sig_atomic_t g_running = 1;

/**
 * @brief Signal handler for graceful shutdown
 * @param signal Signal number received
 */
void signalHandler(int signal) {
    (void)signal;
    g_running = 0;
}

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [--config file] <command> [args]\n"
              << "Commands:\n"
              << "  login --username U --password P --country C [--continent X]\n"
              << "  renew                           Check the cached session, renewing it if needed\n"
              << "  list-devices                    List devices registered to the account\n"
              << "  device <nickname> <action>      Drive one device\n"
              << "\nDevice actions:\n"
              << "  subscribe                       Print state changes until Ctrl+C\n"
              << "  state                           Query and print the full state\n"
              << "  clean | stop | pause | resume | charge | relocate | sound\n"
              << "  clean-areas <id> [id...]       Clean map areas\n"
              << "  clean-custom <x1,y1,x2,y2>      Clean a rectangle\n"
              << "  water <low|medium|high|ultrahigh>\n"
              << "  speed <quiet|standard|max|max+>\n"
              << "  true-detect <on|off>            Toggle obstacle detection\n"
              << "  clean-preference <on|off>       Toggle the saved cleaning preference\n"
              << "  invoke <command> [json]         Send a raw command\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [account]\n"
              << "  username = \"user@example.com\"\n"
              << "  password_hash = \"<md5 of password>\"\n"
              << "  country = \"de\"\n"
              << "  client_device_id = \"<32 hex chars>\"\n"
              << std::endl;
}

std::optional<bool> parseSwitch(const std::string& text) {
    if (text == "on") {
        return true;
    }
    if (text == "off") {
        return false;
    }
    return std::nullopt;
}

/**
 * @brief Safe environment variable getter for Windows
 * @param name Environment variable name
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

namespace {

/// Value following a named option, or empty when absent
std::string optionValue(const std::vector<std::string>& args, const std::string& name) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == name) {
            return args[i + 1];
        }
    }
    return "";
}

std::string formatTime(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

void printState(const DeviceState& state) {
    for (const auto& [component, entry] : state) {
        std::cout << "  " << std::left << std::setw(16) << component << " "
                  << entry.value.dump() << "  (" << formatTime(entry.observedAt) << ")" << std::endl;
    }
}

void printDevices(const std::vector<DeviceDescriptor>& devices) {
    std::cout << std::left << std::setw(20) << "NICKNAME" << std::setw(34) << "DEVICE ID"
              << std::setw(12) << "CLASS" << std::setw(24) << "MODEL" << "STATUS" << std::endl;
    for (const auto& device : devices) {
        std::cout << std::left << std::setw(20) << device.nickname << std::setw(34) << device.deviceId
                  << std::setw(12) << device.deviceClass << std::setw(24) << device.model
                  << (device.status == 1 ? "online" : "offline") << std::endl;
    }
}

/// Follow state changes until interrupted or the channel ends
int runSubscribe(DeebotClient& client, const DeviceHandle& device) {
    std::cout << "Watching " << device->device().nickname << ". Press Ctrl+C to stop." << std::endl;
    
    device->controller().refresh();
    printState(client.currentState(device));
    
    DeviceState last = client.currentState(device);
    while (g_running && device->isLive()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        
        DeviceState current = client.currentState(device);
        for (const auto& [component, entry] : current) {
            auto it = last.find(component);
            if (it == last.end() || it->second.value != entry.value) {
                std::cout << "[" << formatTime(entry.observedAt) << "] " << component << " = "
                          << entry.value.dump() << std::endl;
            }
        }
        last = std::move(current);
    }
    
    if (!device->isLive()) {
        std::cerr << "Connection to " << device->device().nickname << " ended" << std::endl;
        return 1;
    }
    return 0;
}

int runDeviceAction(DeebotClient& client, const std::string& nickname,
                    const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Missing device action" << std::endl;
        return 1;
    }
    
    DeviceDescriptor descriptor = client.directory().resolveByName(nickname);
    DeviceHandle device = client.openDevice(descriptor.deviceId);
    VacuumController& controller = device->controller();
    
    const std::string& action = args[0];
    if (action == "subscribe") {
        return runSubscribe(client, device);
    } else if (action == "state") {
        controller.refresh();
        printState(client.currentState(device));
    } else if (action == "clean") {
        controller.clean();
    } else if (action == "clean-areas") {
        std::vector<int> areas;
        for (std::size_t i = 1; i < args.size(); ++i) {
            areas.push_back(std::stoi(args[i]));
        }
        if (areas.empty()) {
            std::cerr << "clean-areas needs at least one area ID" << std::endl;
            return 1;
        }
        controller.cleanAreas(areas);
    } else if (action == "clean-custom") {
        if (args.size() < 2) {
            std::cerr << "clean-custom needs a rectangle x1,y1,x2,y2" << std::endl;
            return 1;
        }
        controller.cleanCustom(args[1]);
    } else if (action == "stop") {
        controller.stop();
    } else if (action == "pause") {
        controller.pause();
    } else if (action == "resume") {
        controller.resume();
    } else if (action == "charge") {
        controller.returnToCharge();
    } else if (action == "relocate") {
        controller.relocate();
    } else if (action == "sound") {
        controller.playSound();
    } else if (action == "water") {
        auto level = args.size() > 1 ? parseWaterLevel(args[1]) : std::nullopt;
        if (!level) {
            std::cerr << "Unknown water level" << std::endl;
            return 1;
        }
        controller.setWaterLevel(*level);
    } else if (action == "speed") {
        auto speed = args.size() > 1 ? parseVacuumSpeed(args[1]) : std::nullopt;
        if (!speed) {
            std::cerr << "Unknown vacuum speed" << std::endl;
            return 1;
        }
        controller.setVacuumSpeed(*speed);
    } else if (action == "true-detect" || action == "clean-preference") {
        auto enabled = args.size() > 1 ? parseSwitch(args[1]) : std::nullopt;
        if (!enabled) {
            std::cerr << action << " needs on or off" << std::endl;
            return 1;
        }
        if (action == "true-detect") {
            controller.setTrueDetect(*enabled);
        } else {
            controller.setCleanPreference(*enabled);
        }
    } else if (action == "invoke") {
        if (args.size() < 2) {
            std::cerr << "invoke needs a command name" << std::endl;
            return 1;
        }
        nlohmann::json payload = args.size() > 2 ? nlohmann::json::parse(args[2]) : nlohmann::json::object();
        auto reply = client.invoke(device, args[1], payload);
        std::cout << reply.dump(2) << std::endl;
    } else {
        std::cerr << "Unknown device action: " << action << std::endl;
        return 1;
    }
    
    if (action != "state" && action != "invoke") {
        std::cout << action << " acknowledged by " << descriptor.nickname << std::endl;
    }
    return 0;
}

} // namespace

/**
 * @brief Main application entry point
 * @return Exit code (0 for success, 1 for error)
 */
int main(int argc, char* argv[]) {
    // Install signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    
    // Parse command line arguments
    std::string configFile = "deebot.toml";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && args.empty()) {
            if (i + 1 < argc) {
                configFile = argv[++i];
            }
        } else {
            args.push_back(arg);
        }
    }
    
    if (args.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    
    // Load configuration from TOML file, then environment overrides
    auto config = TomlConfig::loadFromFile(configFile);
    TomlConfig::applyEnvironment(config);
    
    auto clock = std::make_shared<SystemClock>();
    auto rng = std::make_shared<StandardRng>();
    
    if (config.client.auth.clientDeviceId.empty()) {
        config.client.auth.clientDeviceId = rng->hexString(32);
        std::cerr << "[Config] Warning: client_device_id not set, using a random one for this run" << std::endl;
    }
    
    // Create platform-specific dependencies
    auto http = std::make_shared<HttplibHttpClient>(30, true);
    auto store = std::make_shared<CredentialStore>(clock);
    CredentialCache cache(config.credentialsPath);
    cache.attach(*store);
    
    DeebotClient::TransportFactory transportFactory = [](const DeviceDescriptor&) {
        return std::make_shared<adapters::MqttTransportAdapter>(std::make_shared<PahoMqttClient>());
    };
    
    try {
        DeebotClient client(http, transportFactory, store, clock, rng, config.client);
        if (config.account.hasLogin()) {
            client.session().rememberLogin(config.account.username, config.account.passwordHash);
        }
        
        const std::string& command = args[0];
        std::vector<std::string> rest(args.begin() + 1, args.end());
        
        if (command == "login") {
            std::string username = optionValue(rest, "--username");
            std::string password = optionValue(rest, "--password");
            std::string country = optionValue(rest, "--country");
            std::string continent = optionValue(rest, "--continent");
            
            if (username.empty()) username = config.account.username;
            if (country.empty()) country = config.account.country;
            if (continent.empty()) continent = config.account.continent;
            
            auto region = Region::make(country, continent);
            if (username.empty() || !region) {
                std::cerr << "login needs --username and a valid --country" << std::endl;
                return 1;
            }
            
            Credentials credentials;
            if (!password.empty()) {
                credentials = client.login(username, password, *region);
            } else if (!config.account.passwordHash.empty()) {
                credentials = client.loginWithHash(username, config.account.passwordHash, *region);
            } else {
                std::cerr << "login needs --password or account.password_hash" << std::endl;
                return 1;
            }
            
            std::cout << "Logged in as " << credentials.userId << " (" << region->country << "/"
                      << region->continent << "), token valid until "
                      << formatTime(credentials.accessTokenExpiry) << std::endl;
            
        } else if (command == "renew") {
            Credentials credentials = client.session().ensureValid();
            std::cout << "Session " << toString(client.session().state()) << ", token valid until "
                      << formatTime(credentials.accessTokenExpiry) << std::endl;
            
        } else if (command == "list-devices") {
            printDevices(client.listDevices());
            
        } else if (command == "device") {
            if (rest.empty()) {
                std::cerr << "device needs a nickname" << std::endl;
                return 1;
            }
            std::vector<std::string> actionArgs(rest.begin() + 1, rest.end());
            int rc = runDeviceAction(client, rest[0], actionArgs);
            client.closeAll();
            return rc;
            
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    } catch (const ClientError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
