#include "HttplibHttpClient.hpp"
#include "../../crypto/RequestSigner.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include <iostream>
#include <regex>

namespace deebot {

HttplibHttpClient::HttplibHttpClient(int timeoutSeconds, bool verifyServer)
    : timeoutSeconds_(timeoutSeconds), verifyServer_(verifyServer) {}

bool HttplibHttpClient::parseUrl(const std::string& url, const ports::QueryParams& query, Target& target) {
    static const std::regex urlRegex(R"(^(https?):\/\/([^:\/]+)(?::(\d+))?(\/.*)?$)");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        return false;
    }
    
    bool useSsl = match[1].str() == "https";
    int port = match[3].matched ? std::stoi(match[3].str()) : (useSsl ? 443 : 80);
    target.origin = match[1].str() + "://" + match[2].str() + ":" + std::to_string(port);
    target.path = match[4].matched ? match[4].str() : "/";
    
    if (!query.empty()) {
        target.path += (target.path.find('?') == std::string::npos ? "?" : "&");
        target.path += RequestSigner::buildQuery(query);
    }
    return true;
}

ports::HttpResponse HttplibHttpClient::get(const std::string& url, const ports::QueryParams& query) {
    ports::HttpResponse response;
    Target target;
    if (!parseUrl(url, query, target)) {
        response.error = "Unsupported URL: " + url;
        return response;
    }
    
    httplib::Client client(target.origin);
    client.set_connection_timeout(timeoutSeconds_, 0);
    client.set_read_timeout(timeoutSeconds_, 0);
    client.set_write_timeout(timeoutSeconds_, 0);
    client.enable_server_certificate_verification(verifyServer_);
    
    auto result = client.Get(target.path.c_str(), httplib::Headers{{"Accept", "application/json"}});
    if (result) {
        response.status = result->status;
        response.body = result->body;
    } else {
        response.error = "Request failed: " + httplib::to_string(result.error());
        std::cerr << "[HTTP] GET " << target.origin << " failed: " << response.error << std::endl;
    }
    return response;
}

ports::HttpResponse HttplibHttpClient::post(const std::string& url, const std::string& body,
                                            const ports::HttpHeaders& headers,
                                            const ports::QueryParams& query) {
    ports::HttpResponse response;
    Target target;
    if (!parseUrl(url, query, target)) {
        response.error = "Unsupported URL: " + url;
        return response;
    }
    
    httplib::Client client(target.origin);
    client.set_connection_timeout(timeoutSeconds_, 0);
    client.set_read_timeout(timeoutSeconds_, 0);
    client.set_write_timeout(timeoutSeconds_, 0);
    client.enable_server_certificate_verification(verifyServer_);
    
    httplib::Headers requestHeaders{{"Accept", "application/json"}};
    std::string contentType = "application/json";
    for (const auto& [name, value] : headers) {
        if (name == "Content-Type") {
            contentType = value;
        } else {
            requestHeaders.insert({name, value});
        }
    }
    
    auto result = client.Post(target.path.c_str(), requestHeaders, body, contentType.c_str());
    if (result) {
        response.status = result->status;
        response.body = result->body;
    } else {
        response.error = "Request failed: " + httplib::to_string(result.error());
        std::cerr << "[HTTP] POST " << target.origin << " failed: " << response.error << std::endl;
    }
    return response;
}

} // namespace deebot
