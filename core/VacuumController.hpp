#pragma once

#include "CommandDispatcher.hpp"
#include "DeviceStateAggregator.hpp"
#include "VacuumEvents.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace deebot {

/**
 * @brief Vacuum command set on top of the command dispatcher
 * 
 * Every operation waits for the device reply and surfaces CommandError
 * unchanged. Nothing is retried.
 */
class VacuumController {
public:
    static constexpr int kDefaultSoundId = 30;

    VacuumController(std::shared_ptr<CommandDispatcher> dispatcher,
                     std::shared_ptr<DeviceStateAggregator> state,
                     std::chrono::milliseconds timeout);

    void clean();
    void cleanAreas(const std::vector<int>& areaIds);

    /// @param area "x1,y1,x2,y2" in map coordinates
    void cleanCustom(const std::string& area);

    void stop();
    void pause();
    void resume();
    void returnToCharge();
    void relocate();
    void playSound(int soundId = kDefaultSoundId);

    void setWaterLevel(WaterLevel level);
    void setVacuumSpeed(VacuumSpeed speed);
    void setTrueDetect(bool enabled);
    void setCleanPreference(bool enabled);

    /**
     * @brief Query every known state component and fold the replies into the state view
     * @return Number of components whose value changed
     */
    std::size_t refresh();

private:
    std::shared_ptr<CommandDispatcher> dispatcher_;
    std::shared_ptr<DeviceStateAggregator> state_;
    std::chrono::milliseconds timeout_;

    ports::DecodedMessage execute(const std::string& command, const nlohmann::json& payload);
    void startClean(const std::string& act, const std::string& type, const std::string& value);
};

} // namespace deebot
