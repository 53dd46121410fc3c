/**
 * @file HttplibHttpClient.hpp
 * @brief HTTPS capability backed by cpp-httplib
 *
 * Serves the vendor login API, the auth code API and the portal. A client
 * instance is built per request from the URL origin, so one object can talk
 * to every regional host.
 *
 * @note Transport failures are reported through HttpResponse::error, never thrown
 */

#pragma once

#include "../../core/ports/IHttpClient.hpp"
#include <string>

namespace deebot {

class HttplibHttpClient : public ports::IHttpClient {
public:
    /**
     * @param timeoutSeconds Connection, read and write timeout
     * @param verifyServer Enable server certificate verification
     */
    explicit HttplibHttpClient(int timeoutSeconds = 30, bool verifyServer = true);

    ports::HttpResponse get(const std::string& url, const ports::QueryParams& query) override;
    ports::HttpResponse post(const std::string& url, const std::string& body,
                             const ports::HttpHeaders& headers,
                             const ports::QueryParams& query = {}) override;

private:
    struct Target {
        std::string origin;   ///< scheme://host:port
        std::string path;     ///< Path including the encoded query string
    };

    /// Split a URL into origin and path; returns false for unsupported URLs
    static bool parseUrl(const std::string& url, const ports::QueryParams& query, Target& target);

    int timeoutSeconds_;
    bool verifyServer_;
};

} // namespace deebot
