#pragma once

#include "Credentials.hpp"
#include "Region.hpp"
#include "ports/IHttpClient.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace deebot {

/**
 * @brief JSON requests against the vendor portal (portal-{continent}.ecouser.net)
 *
 * Authenticated requests carry an "auth" block built from the session
 * credentials and the client resource (first 8 characters of the client
 * device ID).
 */
class PortalClient {
public:
    static constexpr const char* kRealm = "ecouser.net";
    static constexpr const char* kUserPath = "users/user.do";
    static constexpr const char* kAppPath = "appsvr/app.do";

    PortalClient(std::shared_ptr<ports::IHttpClient> http, std::string clientDeviceId);

    /**
     * @brief POST a JSON body to a portal path
     * @param credentials Adds the auth block when not null
     * @return Parsed response document
     * @throws TransportError on transport failure, non-2xx status or non-JSON body
     */
    nlohmann::json post(const Region& region, const std::string& path, nlohmann::json body,
                        const Credentials* credentials = nullptr,
                        const ports::QueryParams& query = {});

    static std::string portalUrl(const Region& region, const std::string& path);

    /// True when the portal refused the request because of the session token
    static bool isTokenRejection(const nlohmann::json& response);

    const std::string& clientDeviceId() const { return clientDeviceId_; }
    std::string clientResource() const { return clientDeviceId_.substr(0, 8); }

private:
    std::shared_ptr<ports::IHttpClient> http_;
    std::string clientDeviceId_;
};

} // namespace deebot
