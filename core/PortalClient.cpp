#include "PortalClient.hpp"
#include "Errors.hpp"
#include <stdexcept>

namespace deebot {

PortalClient::PortalClient(std::shared_ptr<ports::IHttpClient> http, std::string clientDeviceId)
    : http_(std::move(http)), clientDeviceId_(std::move(clientDeviceId)) {
    if (!http_) {
        throw std::invalid_argument("HTTP client cannot be null");
    }
    if (clientDeviceId_.size() < 8) {
        throw std::invalid_argument("Client device ID must have at least 8 characters");
    }
}

std::string PortalClient::portalUrl(const Region& region, const std::string& path) {
    std::string host = region.isChina() ? "portal" : "portal-" + region.continent;
    return "https://" + host + ".ecouser.net/api/" + path;
}

nlohmann::json PortalClient::post(const Region& region, const std::string& path, nlohmann::json body,
                                  const Credentials* credentials,
                                  const ports::QueryParams& query) {
    if (credentials) {
        body["auth"] = {
            {"with", "users"},
            {"userid", credentials->userId},
            {"realm", kRealm},
            {"token", credentials->accessToken},
            {"resource", clientResource()}
        };
    }
    
    auto response = http_->post(portalUrl(region, path), body.dump(),
                                {{"Content-Type", "application/json"}}, query);
    if (response.status == 0) {
        throw TransportError(0, "portal request failed", ErrorContext{"", "", response.error});
    }
    if (!response.ok()) {
        throw TransportError(response.status, "portal returned an error status",
                             ErrorContext{"", "", path});
    }
    
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TransportError(response.status, "portal returned a non-JSON body",
                             ErrorContext{"", "", e.what()});
    }
}

bool PortalClient::isTokenRejection(const nlohmann::json& response) {
    if (!response.is_object()) {
        return false;
    }
    std::string outcome = response.value("result", response.value("ret", std::string()));
    if (outcome != "fail") {
        return false;
    }
    // errno 3 and 4 are the portal's "token error" and "token expired"
    if (response.contains("errno")) {
        const auto& code = response["errno"];
        if (code.is_number_integer()) {
            int value = code.get<int>();
            return value == 3 || value == 4;
        }
        if (code.is_string()) {
            return code == "3" || code == "4";
        }
    }
    auto error = response.value("error", std::string());
    return error.find("token") != std::string::npos;
}

} // namespace deebot
