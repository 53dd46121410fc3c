#pragma once

#include <map>
#include <string>

namespace deebot {

class RequestSigner {
public:
    /// Ordered so the signature input is built from keys in ascending order
    using Params = std::map<std::string, std::string>;
    
    struct AppKey {
        std::string key;
        std::string secret;
    };
    
    /// Key pair used for the account/password exchange
    static const AppKey& loginAppKey();
    
    /// Key pair used for the auth code request
    static const AppKey& authCodeAppKey();
    
    static std::string sign(const Params& params, const AppKey& appKey);
    static std::string md5Hex(const std::string& data);
    static std::string hashPassword(const std::string& password);
    
    static std::string urlEncode(const std::string& value);
    static std::string buildQuery(const Params& params);
    
private:
    static std::string createStringToSign(const Params& params, const AppKey& appKey);
};

} // namespace deebot
