#pragma once

#include <map>
#include <string>

namespace deebot::ports {

using HttpHeaders = std::map<std::string, std::string>;
using QueryParams = std::map<std::string, std::string>;

struct HttpResponse {
    int status = 0;        // 0 when no response was received
    std::string body;
    std::string error;     // transport error description
    
    bool ok() const { return status >= 200 && status < 300; }
};

// HTTP capability. Never throws for transport failures, those are reported
// through status 0 and error. Retries are the caller's policy.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    
    virtual HttpResponse get(const std::string& url, const QueryParams& query) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HttpHeaders& headers, const QueryParams& query = {}) = 0;
};

} // namespace deebot::ports
