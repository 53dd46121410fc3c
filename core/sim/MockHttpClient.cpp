#include "MockHttpClient.hpp"

namespace deebot::sim {

ports::HttpResponse MockHttpClient::get(const std::string& url, const ports::QueryParams& query) {
    return dispatch(RecordedRequest{"GET", url, "", {}, query});
}

ports::HttpResponse MockHttpClient::post(const std::string& url, const std::string& body,
                                         const ports::HttpHeaders& headers,
                                         const ports::QueryParams& query) {
    return dispatch(RecordedRequest{"POST", url, body, headers, query});
}

void MockHttpClient::respond(const std::string& urlFragment, int status, const std::string& body,
                             bool persistent) {
    respondWith(urlFragment, [status, body](const RecordedRequest&) {
        ports::HttpResponse response;
        response.status = status;
        response.body = body;
        return response;
    }, persistent);
}

void MockHttpClient::respondWith(const std::string& urlFragment, Responder responder, bool persistent) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.push_back(Route{urlFragment, std::move(responder), persistent});
}

void MockHttpClient::failNext(const std::string& urlFragment, const std::string& error) {
    respondWith(urlFragment, [error](const RecordedRequest&) {
        ports::HttpResponse response;
        response.error = error;
        return response;
    });
}

std::vector<RecordedRequest> MockHttpClient::getRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

int MockHttpClient::requestCount(const std::string& urlFragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& request : requests_) {
        if (request.url.find(urlFragment) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

void MockHttpClient::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.clear();
    requests_.clear();
}

ports::HttpResponse MockHttpClient::dispatch(RecordedRequest request) {
    Responder responder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        
        for (auto it = routes_.begin(); it != routes_.end(); ++it) {
            if (request.url.find(it->urlFragment) != std::string::npos) {
                responder = it->responder;
                if (!it->persistent) {
                    routes_.erase(it);
                }
                break;
            }
        }
    }
    
    if (!responder) {
        ports::HttpResponse response;
        response.error = "No scripted response for " + request.url;
        return response;
    }
    return responder(request);
}

} // namespace deebot::sim
