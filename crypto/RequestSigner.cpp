/**
 * @file RequestSigner.cpp
 * @brief Request signing for the vendor login and auth code APIs
 * 
 * The vendor APIs authenticate the calling application by an MD5 signature
 * over the request parameters, wrapped between an application key and its
 * secret. Passwords are never sent in clear text, only as their MD5 digest.
 * Uses OpenSSL EVP for the digest computation.
 * 
 * @note Signature input: key + "k1=v1" + "k2=v2" + ... + secret, keys ascending
 * @note Digests are rendered as lowercase hex
 */

#include "RequestSigner.hpp"
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>

namespace deebot {

const RequestSigner::AppKey& RequestSigner::loginAppKey() {
    static const AppKey kLoginAppKey{"1520391301804", "6c319b2a5cd3e66e39159c2e28f2fce9"};
    return kLoginAppKey;
}

const RequestSigner::AppKey& RequestSigner::authCodeAppKey() {
    static const AppKey kAuthCodeAppKey{"1520391491841", "77ef58ce3afbe337da74aa8c5ab963a9"};
    return kAuthCodeAppKey;
}

/**
 * @brief Compute the request signature for a parameter set
 * 
 * @param params All parameters that take part in the signature (including
 *               request metadata such as country and app version)
 * @param appKey Application key pair issued by the vendor
 * @return Lowercase hex MD5 digest to send as "authSign"
 * 
 * @note The signature covers parameter values exactly as they are sent
 */
std::string RequestSigner::sign(const Params& params, const AppKey& appKey) {
    return md5Hex(createStringToSign(params, appKey));
}

std::string RequestSigner::createStringToSign(const Params& params, const AppKey& appKey) {
    std::string payload = appKey.key;
    for (const auto& [key, value] : params) {
        payload += key + "=" + value;
    }
    payload += appKey.secret;
    return payload;
}

/**
 * @brief Compute MD5 digest using OpenSSL
 * 
 * @param data Input bytes
 * @return 32-character lowercase hex digest
 * @throws std::runtime_error if OpenSSL fails to compute the digest
 */
std::string RequestSigner::md5Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    
    if (EVP_Digest(data.data(), data.size(), digest, &digestLength, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("RequestSigner: MD5 digest computation failed");
    }
    
    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLength; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string RequestSigner::hashPassword(const std::string& password) {
    return md5Hex(password);
}

/**
 * @brief URL-encode string according to RFC 3986
 * 
 * @param value String to be URL-encoded
 * @return Percent-encoded string, unreserved characters kept as-is
 * 
 * @note Preserves unreserved characters: A-Z a-z 0-9 - _ . ~
 * @note Uses uppercase hex digits as per RFC 3986
 */
std::string RequestSigner::urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

std::string RequestSigner::buildQuery(const Params& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += urlEncode(key) + "=" + urlEncode(value);
    }
    return query;
}

} // namespace deebot
