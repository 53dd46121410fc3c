#pragma once

#include "DeviceStateAggregator.hpp"
#include "ports/IMessageCodec.hpp"
#include <optional>
#include <string>
#include <vector>

namespace deebot {

enum class VacuumSpeed { Quiet, Standard, Max, MaxPlus };
enum class WaterLevel { Low, Medium, High, UltraHigh };

std::string toString(VacuumSpeed speed);
std::string toString(WaterLevel level);
std::optional<VacuumSpeed> parseVacuumSpeed(const std::string& text);
std::optional<WaterLevel> parseWaterLevel(const std::string& text);

/// Device speed code: 1000 quiet, 0 standard, 1 max, 2 max+
int speedCode(VacuumSpeed speed);
std::optional<VacuumSpeed> speedFromCode(int code);

/// Device water amount: 1 (low) through 4 (ultra high)
int waterAmount(WaterLevel level);
std::optional<WaterLevel> waterLevelFromAmount(int amount);

/**
 * @brief Maps vendor events and query replies to state components
 * 
 * Components: battery, charging, robotState, cleanType, cleanCount,
 * cleanPreference, vacuumSpeed, cleanStats, trueDetect, mopAttached,
 * waterLevel, totalStats, lifespan.<part>, error, position.
 */
class VacuumEvents {
public:
    static std::vector<StateUpdate> translate(const ports::DecodedMessage& message);
    
    static std::vector<StateUpdate> translate(const std::string& kind, const nlohmann::json& data,
                                              std::optional<std::uint64_t> sequence);
    
    /// Event name delivering the same data as a query ("getBattery" -> "onBattery")
    static std::string eventNameFor(const std::string& kind);
    
private:
    static void translateCleanInfo(const nlohmann::json& data, std::optional<std::uint64_t> sequence,
                                   std::vector<StateUpdate>& updates);
    static void translateBuryPoint(const nlohmann::json& data, std::optional<std::uint64_t> sequence,
                                   std::vector<StateUpdate>& updates);
};

} // namespace deebot
