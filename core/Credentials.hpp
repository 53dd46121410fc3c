#pragma once

#include "Region.hpp"
#include <chrono>
#include <string>

namespace deebot {

/**
 * @brief Session credentials obtained from the vendor cloud
 *
 * @invariant accessToken is only usable while accessTokenExpiry is in the future
 */
struct Credentials {
    std::string userId;                                          ///< Vendor user ID (uid)
    std::string accessToken;                                     ///< IoT access token
    std::chrono::system_clock::time_point accessTokenExpiry{};   ///< Access token expiry
    std::string authCode;                                        ///< Longer-lived code used for renewal
    Region region;                                               ///< Region the session belongs to

    bool isValidAt(std::chrono::system_clock::time_point now) const {
        return !accessToken.empty() && accessTokenExpiry > now;
    }
};

} // namespace deebot
