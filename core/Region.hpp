#pragma once

#include <optional>
#include <string>

namespace deebot {

/**
 * @brief Vendor cloud region
 *
 * The account country selects the login API host, the continent selects the
 * portal and MQTT broker hosts. China uses dedicated hosts and the "cn" TLD.
 */
struct Region {
    std::string country;     ///< Lowercase ISO 3166 alpha-2 code (e.g. "de")
    std::string continent;   ///< Portal continent code: "eu", "na", "as" or "ww"

    bool isChina() const { return country == "cn"; }
    bool isValid() const;

    std::string topLevelDomain() const { return isChina() ? "cn" : "com"; }

    /// Build a region, inferring the continent from the country when omitted
    static std::optional<Region> make(const std::string& country,
                                      const std::string& continent = "");

    /// Continent for a country code, "ww" for countries without a dedicated portal
    static std::string continentFor(const std::string& country);
};

} // namespace deebot
