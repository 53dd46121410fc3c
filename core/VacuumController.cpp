#include "VacuumController.hpp"
#include <iostream>
#include <stdexcept>

namespace deebot {

namespace {
const std::vector<std::string> kInfoQueries{
    "getWaterInfo", "getChargeState", "getBattery", "getStats", "getCleanInfo_V2", "getSpeed",
    "getCleanCount", "getTotalStats", "getTrueDetect", "getCleanPreference", "getError"
};
const std::vector<std::string> kLifeSpanParts{"sideBrush", "brush", "heap", "unitCare"};
}

VacuumController::VacuumController(std::shared_ptr<CommandDispatcher> dispatcher,
                                   std::shared_ptr<DeviceStateAggregator> state,
                                   std::chrono::milliseconds timeout)
    : dispatcher_(std::move(dispatcher)), state_(std::move(state)), timeout_(timeout) {
    if (!dispatcher_ || !state_) {
        throw std::invalid_argument("VacuumController dependencies cannot be null");
    }
}

void VacuumController::clean() {
    startClean("start", "auto", "");
}

void VacuumController::cleanAreas(const std::vector<int>& areaIds) {
    if (areaIds.empty()) {
        throw std::invalid_argument("At least one area is required");
    }
    std::string value;
    for (std::size_t i = 0; i < areaIds.size(); ++i) {
        if (i > 0) {
            value += ",";
        }
        value += std::to_string(areaIds[i]);
    }
    startClean("start", "spotArea", value);
}

void VacuumController::cleanCustom(const std::string& area) {
    if (area.empty()) {
        throw std::invalid_argument("Custom area cannot be empty");
    }
    startClean("start", "customArea", area);
}

void VacuumController::stop() {
    startClean("stop", "", "");
}

void VacuumController::pause() {
    execute("clean_V2", {{"act", "pause"}});
}

void VacuumController::resume() {
    execute("clean_V2", {{"act", "resume"}});
}

void VacuumController::returnToCharge() {
    execute("charge", {{"act", "go"}});
}

void VacuumController::relocate() {
    execute("setRelocationState", {{"mode", "manu"}});
}

void VacuumController::playSound(int soundId) {
    execute("playSound", {{"count", 1}, {"sid", soundId}});
}

void VacuumController::setWaterLevel(WaterLevel level) {
    execute("setWaterInfo", {{"amount", waterAmount(level)}});
}

void VacuumController::setVacuumSpeed(VacuumSpeed speed) {
    execute("setSpeed", {{"speed", speedCode(speed)}});
}

void VacuumController::setTrueDetect(bool enabled) {
    execute("setTrueDetect", {{"enable", enabled ? 1 : 0}});
}

void VacuumController::setCleanPreference(bool enabled) {
    execute("setCleanPreference", {{"enable", enabled ? 1 : 0}});
}

std::size_t VacuumController::refresh() {
    std::size_t changed = 0;
    
    auto info = execute("getInfo", kInfoQueries);
    for (const auto& update : VacuumEvents::translate("getInfo", info.fields, info.sequence)) {
        changed += state_->apply(update) ? 1 : 0;
    }
    
    auto lifespan = execute("getLifeSpan", kLifeSpanParts);
    for (const auto& update : VacuumEvents::translate("getLifeSpan", lifespan.fields, lifespan.sequence)) {
        changed += state_->apply(update) ? 1 : 0;
    }
    
    std::cout << "[State] Refresh changed " << changed << " component(s)" << std::endl;
    return changed;
}

ports::DecodedMessage VacuumController::execute(const std::string& command, const nlohmann::json& payload) {
    return dispatcher_->invoke(command, payload, timeout_);
}

void VacuumController::startClean(const std::string& act, const std::string& type, const std::string& value) {
    execute("clean_V2", {
        {"act", act},
        {"content", {{"count", ""}, {"donotClean", ""}, {"type", type}, {"value", value}}},
        {"mode", ""},
        {"router", "plan"}
    });
}

} // namespace deebot
