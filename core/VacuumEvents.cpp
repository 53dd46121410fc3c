#include "VacuumEvents.hpp"
#include <iostream>

namespace deebot {

namespace {

bool hasInt(const nlohmann::json& data, const char* key) {
    return data.is_object() && data.contains(key) && data[key].is_number_integer();
}

std::optional<std::string> cleanTypeName(const nlohmann::json& type) {
    if (!type.is_string()) {
        return std::nullopt;
    }
    const auto& text = type.get_ref<const std::string&>();
    if (text == "auto" || text == "spotArea" || text == "customArea") {
        return text;
    }
    std::cerr << "[State] Unknown clean type: " << text << std::endl;
    return std::nullopt;
}

}

std::string toString(VacuumSpeed speed) {
    switch (speed) {
        case VacuumSpeed::Quiet: return "quiet";
        case VacuumSpeed::Standard: return "standard";
        case VacuumSpeed::Max: return "max";
        case VacuumSpeed::MaxPlus: return "max+";
    }
    return "unknown";
}

std::string toString(WaterLevel level) {
    switch (level) {
        case WaterLevel::Low: return "low";
        case WaterLevel::Medium: return "medium";
        case WaterLevel::High: return "high";
        case WaterLevel::UltraHigh: return "ultrahigh";
    }
    return "unknown";
}

std::optional<VacuumSpeed> parseVacuumSpeed(const std::string& text) {
    for (auto speed : {VacuumSpeed::Quiet, VacuumSpeed::Standard, VacuumSpeed::Max, VacuumSpeed::MaxPlus}) {
        if (toString(speed) == text) {
            return speed;
        }
    }
    return std::nullopt;
}

std::optional<WaterLevel> parseWaterLevel(const std::string& text) {
    for (auto level : {WaterLevel::Low, WaterLevel::Medium, WaterLevel::High, WaterLevel::UltraHigh}) {
        if (toString(level) == text) {
            return level;
        }
    }
    return std::nullopt;
}

int speedCode(VacuumSpeed speed) {
    switch (speed) {
        case VacuumSpeed::Quiet: return 1000;
        case VacuumSpeed::Standard: return 0;
        case VacuumSpeed::Max: return 1;
        case VacuumSpeed::MaxPlus: return 2;
    }
    return 0;
}

std::optional<VacuumSpeed> speedFromCode(int code) {
    switch (code) {
        case 1000: return VacuumSpeed::Quiet;
        case 0: return VacuumSpeed::Standard;
        case 1: return VacuumSpeed::Max;
        case 2: return VacuumSpeed::MaxPlus;
        default: return std::nullopt;
    }
}

int waterAmount(WaterLevel level) {
    return static_cast<int>(level) + 1;
}

std::optional<WaterLevel> waterLevelFromAmount(int amount) {
    if (amount < 1 || amount > 4) {
        return std::nullopt;
    }
    return static_cast<WaterLevel>(amount - 1);
}

std::vector<StateUpdate> VacuumEvents::translate(const ports::DecodedMessage& message) {
    return translate(message.kind, message.fields, message.sequence);
}

std::vector<StateUpdate> VacuumEvents::translate(const std::string& kind, const nlohmann::json& data,
                                                 std::optional<std::uint64_t> sequence) {
    std::vector<StateUpdate> updates;
    const std::string event = eventNameFor(kind);
    
    if (event == "onInfo") {
        // getInfo bundles several query replies keyed by query name
        if (data.is_object()) {
            for (const auto& [query, reply] : data.items()) {
                if (reply.is_object() && reply.contains("data")) {
                    auto nested = translate(query, reply["data"], sequence);
                    updates.insert(updates.end(), nested.begin(), nested.end());
                }
            }
        }
    } else if (event == "onBattery") {
        if (hasInt(data, "value")) {
            updates.push_back({"battery", data["value"], sequence});
        }
    } else if (event == "onChargeState") {
        if (hasInt(data, "isCharging")) {
            updates.push_back({"charging", data["isCharging"].get<int>() != 0, sequence});
        }
    } else if (event == "onCleanCount") {
        if (hasInt(data, "count")) {
            updates.push_back({"cleanCount", data["count"], sequence});
        }
    } else if (event == "onCleanInfo_V2") {
        translateCleanInfo(data, sequence, updates);
    } else if (event == "onCleanPreference") {
        if (hasInt(data, "enable")) {
            updates.push_back({"cleanPreference", data["enable"].get<int>() != 0, sequence});
        }
    } else if (event == "onTrueDetect") {
        if (hasInt(data, "enable")) {
            updates.push_back({"trueDetect", data["enable"].get<int>() != 0, sequence});
        }
    } else if (event == "onSpeed") {
        if (hasInt(data, "speed")) {
            if (auto speed = speedFromCode(data["speed"].get<int>())) {
                updates.push_back({"vacuumSpeed", toString(*speed), sequence});
            }
        }
    } else if (event == "onWaterInfo") {
        if (hasInt(data, "enable")) {
            updates.push_back({"mopAttached", data["enable"].get<int>() != 0, sequence});
        }
        if (hasInt(data, "amount")) {
            if (auto level = waterLevelFromAmount(data["amount"].get<int>())) {
                updates.push_back({"waterLevel", toString(*level), sequence});
            }
        }
    } else if (event == "onFwBuryPoint") {
        translateBuryPoint(data, sequence, updates);
    } else if (event == "onStats") {
        if (data.is_object()) {
            nlohmann::json stats{
                {"area", data.value("area", 0)},
                {"time", data.value("time", 0)},
                {"avoidCount", data.value("avoidCount", 0)},
                {"start", data.contains("start") ? data["start"] : nlohmann::json()}
            };
            updates.push_back({"cleanStats", stats, sequence});
            if (data.contains("type")) {
                if (auto type = cleanTypeName(data["type"])) {
                    updates.push_back({"cleanType", *type, sequence});
                }
            }
        }
    } else if (event == "onTotalStats") {
        if (data.is_object()) {
            updates.push_back({"totalStats",
                               {{"area", data.value("area", 0)},
                                {"time", data.value("time", 0)},
                                {"count", data.value("count", 0)}},
                               sequence});
        }
    } else if (event == "onLifeSpan") {
        if (data.is_array()) {
            for (const auto& part : data) {
                if (part.is_object() && part.contains("type") && part["type"].is_string()) {
                    updates.push_back({"lifespan." + part["type"].get<std::string>(),
                                       {{"left", part.value("left", 0)}, {"total", part.value("total", 0)}},
                                       sequence});
                }
            }
        }
    } else if (event == "onError") {
        if (data.is_object() && data.contains("code")) {
            updates.push_back({"error", data["code"], sequence});
        }
    } else if (event == "onPos" || kind == "reportPos") {
        if (data.is_object() && data.contains("deebotPos")) {
            updates.push_back({"position", data["deebotPos"], sequence});
        }
    }
    
    return updates;
}

std::string VacuumEvents::eventNameFor(const std::string& kind) {
    if (kind.size() > 3 && kind.compare(0, 3, "get") == 0) {
        return "on" + kind.substr(3);
    }
    return kind;
}

void VacuumEvents::translateCleanInfo(const nlohmann::json& data, std::optional<std::uint64_t> sequence,
                                      std::vector<StateUpdate>& updates) {
    if (!data.is_object() || !data.contains("state") || !data["state"].is_string()) {
        return;
    }
    
    const std::string state = data["state"].get<std::string>();
    if (state == "idle") {
        updates.push_back({"robotState", "idle", sequence});
        updates.push_back({"cleanType", nullptr, sequence});
    } else if (state == "goCharging") {
        updates.push_back({"robotState", "returning", sequence});
        updates.push_back({"cleanType", nullptr, sequence});
    } else if (state == "clean") {
        const auto cleanState = data.value("cleanState", nlohmann::json::object());
        const std::string motion = cleanState.value("motionState", "");
        if (motion == "working") {
            updates.push_back({"robotState", "cleaning", sequence});
        } else if (motion == "pause") {
            updates.push_back({"robotState", "paused", sequence});
        } else {
            std::cerr << "[State] Unhandled motion state: " << motion << std::endl;
        }
        
        const auto content = cleanState.value("content", nlohmann::json::object());
        if (content.contains("type")) {
            if (auto type = cleanTypeName(content["type"])) {
                updates.push_back({"cleanType", *type, sequence});
            }
        }
    } else {
        std::cerr << "[State] Unhandled clean state: " << state << std::endl;
    }
}

void VacuumEvents::translateBuryPoint(const nlohmann::json& data, std::optional<std::uint64_t> sequence,
                                      std::vector<StateUpdate>& updates) {
    if (!data.is_object() || !data.contains("content") || !data["content"].is_string()) {
        return;
    }
    
    try {
        auto content = nlohmann::json::parse(data["content"].get<std::string>());
        if (content.value("rn", "") != "bd_setting") {
            return;
        }
        auto setting = nlohmann::json::parse(
            content.at("d").at("body").at("data").at("d_val").get<std::string>());
        if (hasInt(setting, "waterAmount")) {
            // bd_setting reports water amounts 0 through 3
            if (auto level = waterLevelFromAmount(setting["waterAmount"].get<int>() + 1)) {
                updates.push_back({"waterLevel", toString(*level), sequence});
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[State] Malformed onFwBuryPoint content: " << e.what() << std::endl;
    }
}

} // namespace deebot
