#pragma once

#include "../ports/IHttpClient.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace deebot::sim {

struct RecordedRequest {
    std::string method;
    std::string url;
    std::string body;
    ports::HttpHeaders headers;
    ports::QueryParams query;
};

// Scripted HTTP client. Responses are matched by URL substring in the order
// they were scripted; a route answers once unless marked persistent.
// Unmatched requests get a transport error (status 0).
class MockHttpClient : public ports::IHttpClient {
public:
    using Responder = std::function<ports::HttpResponse(const RecordedRequest&)>;

    MockHttpClient() = default;
    ~MockHttpClient() override = default;

    // IHttpClient interface
    ports::HttpResponse get(const std::string& url, const ports::QueryParams& query) override;
    ports::HttpResponse post(const std::string& url, const std::string& body,
                             const ports::HttpHeaders& headers,
                             const ports::QueryParams& query = {}) override;

    // Mock-specific methods for testing
    void respond(const std::string& urlFragment, int status, const std::string& body,
                 bool persistent = false);
    void respondWith(const std::string& urlFragment, Responder responder, bool persistent = false);
    void failNext(const std::string& urlFragment, const std::string& error = "Connection refused");

    std::vector<RecordedRequest> getRequests() const;
    int requestCount(const std::string& urlFragment) const;
    void clear();

private:
    struct Route {
        std::string urlFragment;
        Responder responder;
        bool persistent;
    };

    mutable std::mutex mutex_;
    std::deque<Route> routes_;
    std::vector<RecordedRequest> requests_;

    ports::HttpResponse dispatch(RecordedRequest request);
};

} // namespace deebot::sim
