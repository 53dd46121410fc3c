#include "Region.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace deebot {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isKnownContinent(const std::string& continent) {
    return continent == "eu" || continent == "na" || continent == "as" || continent == "ww";
}

} // namespace

bool Region::isValid() const {
    if (country.size() != 2 || !isKnownContinent(continent)) {
        return false;
    }
    return std::all_of(country.begin(), country.end(),
                       [](unsigned char c) { return std::islower(c) != 0; });
}

std::optional<Region> Region::make(const std::string& country, const std::string& continent) {
    Region region;
    region.country = toLower(country);
    region.continent = continent.empty() ? continentFor(region.country) : toLower(continent);

    if (!region.isValid()) {
        return std::nullopt;
    }
    return region;
}

std::string Region::continentFor(const std::string& country) {
    static const std::unordered_map<std::string, std::string> kContinents = {
        {"at", "eu"}, {"be", "eu"}, {"ch", "eu"}, {"cz", "eu"}, {"de", "eu"},
        {"dk", "eu"}, {"es", "eu"}, {"fi", "eu"}, {"fr", "eu"}, {"gb", "eu"},
        {"gr", "eu"}, {"ie", "eu"}, {"it", "eu"}, {"nl", "eu"}, {"no", "eu"},
        {"pl", "eu"}, {"pt", "eu"}, {"se", "eu"}, {"uk", "eu"},
        {"us", "na"}, {"ca", "na"}, {"mx", "na"},
        {"cn", "as"}, {"jp", "as"}, {"kr", "as"}, {"my", "as"}, {"sg", "as"},
        {"th", "as"}, {"tw", "as"}, {"hk", "as"}, {"in", "as"}, {"id", "as"},
        {"ph", "as"}, {"vn", "as"},
        {"au", "ww"}, {"nz", "ww"}, {"za", "ww"}, {"br", "ww"}, {"ar", "ww"}
    };

    auto it = kContinents.find(toLower(country));
    return it != kContinents.end() ? it->second : "ww";
}

} // namespace deebot
