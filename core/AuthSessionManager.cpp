#include "AuthSessionManager.hpp"
#include "Errors.hpp"
#include "../crypto/RequestSigner.hpp"
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace deebot {

namespace {
constexpr const char* kLanguage = "EN";
constexpr const char* kAppCode = "global_e";
constexpr const char* kAppVersion = "1.6.3";
constexpr const char* kChannel = "google_play";
constexpr const char* kDeviceType = "1";
constexpr const char* kTimeZone = "GMT-8";
constexpr const char* kBizType = "ECOVACS_IOT";
constexpr const char* kOpenId = "global";
constexpr const char* kEdition = "ECOGLOBLE";

std::string stringField(const nlohmann::json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}
}

AuthSessionManager::AuthSessionManager(std::shared_ptr<ports::IHttpClient> http,
                                       std::shared_ptr<PortalClient> portal,
                                       std::shared_ptr<CredentialStore> store,
                                       std::shared_ptr<IClock> clock,
                                       AuthConfig config)
    : http_(std::move(http))
    , portal_(std::move(portal))
    , store_(std::move(store))
    , clock_(std::move(clock))
    , config_(std::move(config)) {
    if (!http_ || !portal_ || !store_ || !clock_) {
        throw std::invalid_argument("AuthSessionManager dependencies cannot be null");
    }
    if (config_.clientDeviceId.empty()) {
        throw std::invalid_argument("Client device ID cannot be empty");
    }
    if (store_->raw()) {
        state_ = SessionState::Authenticated;
    }
}

Credentials AuthSessionManager::login(const std::string& username, const std::string& password,
                                      const Region& region) {
    return loginWithHash(username, RequestSigner::hashPassword(password), region);
}

Credentials AuthSessionManager::loginWithHash(const std::string& username, const std::string& passwordHash,
                                              const Region& region) {
    if (!region.isValid()) {
        throw AuthError(AuthError::Code::RegionUnavailable, "unsupported region",
                        ErrorContext{"", "", region.country + "/" + region.continent});
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Authenticating;
    }
    
    std::cout << "[Auth] Logging in " << username << " (country " << region.country
              << ", continent " << region.continent << ")" << std::endl;
    
    LoginMemo memo{username, passwordHash};
    try {
        Credentials credentials = performLogin(memo, region);
        store_->store(credentials);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            memo_ = memo;
            state_ = SessionState::Authenticated;
        }
        std::cout << "[Auth] Authenticated user " << credentials.userId << ", token expires "
                  << formatUtc(credentials.accessTokenExpiry) << std::endl;
        return credentials;
    } catch (const AuthError& e) {
        std::cerr << "[Auth] Login failed: " << e.what() << std::endl;
        bool hasSession = store_->raw().has_value();
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = hasSession ? SessionState::Authenticated : SessionState::Unauthenticated;
        throw;
    }
}

void AuthSessionManager::rememberLogin(const std::string& username, const std::string& passwordHash) {
    bool hasSession = store_->raw().has_value();
    std::lock_guard<std::mutex> lock(mutex_);
    memo_ = LoginMemo{username, passwordHash};
    if (hasSession) {
        state_ = SessionState::Authenticated;
    }
}

Credentials AuthSessionManager::ensureValid() {
    std::promise<Credentials> promise;
    std::shared_future<Credentials> flight;
    std::optional<Credentials> expiring;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stored = store_->raw();
        if (!stored) {
            state_ = SessionState::Unauthenticated;
            throw AuthError(AuthError::Code::Unauthenticated, "no session, login first");
        }
        
        if (!renewal_ && !stored->accessToken.empty() &&
            stored->accessTokenExpiry - clock_->now() > config_.renewalMargin) {
            state_ = SessionState::Authenticated;
            return *stored;
        }
        
        if (renewal_) {
            flight = *renewal_;
        } else {
            flight = promise.get_future().share();
            renewal_ = flight;
            state_ = SessionState::Renewing;
            ++renewalCount_;
            expiring = stored;
        }
    }
    
    if (expiring) {
        std::cout << "[Auth] Access token expires " << formatUtc(expiring->accessTokenExpiry)
                  << ", renewing" << std::endl;
        try {
            Credentials renewed = renew(*expiring);
            store_->store(renewed);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                renewal_.reset();
                state_ = SessionState::Authenticated;
            }
            std::cout << "[Auth] Renewed, token expires " << formatUtc(renewed.accessTokenExpiry) << std::endl;
            promise.set_value(renewed);
        } catch (const AuthError& e) {
            std::cerr << "[Auth] " << e.what() << std::endl;
            bool revoked = e.rootCause() == AuthError::Code::InvalidCredentials ||
                           e.rootCause() == AuthError::Code::TokenRejected;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                renewal_.reset();
                state_ = revoked ? SessionState::Unauthenticated : SessionState::Expiring;
            }
            if (revoked) {
                invalidate();
            }
            promise.set_exception(std::current_exception());
        } catch (const std::exception& e) {
            std::cerr << "[Auth] Renewal aborted: " << e.what() << std::endl;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                renewal_.reset();
                state_ = SessionState::Expiring;
            }
            promise.set_exception(std::make_exception_ptr(
                AuthError(AuthError::Code::RenewalFailed, "renewal aborted", ErrorContext{"", "", e.what()},
                          AuthError::Code::ProtocolError)));
        }
    }
    
    return flight.get();
}

void AuthSessionManager::invalidate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        memo_.reset();
        state_ = SessionState::Unauthenticated;
    }
    store_->clear();
    std::cout << "[Auth] Session invalidated" << std::endl;
}

SessionState AuthSessionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Authenticated) {
        auto remaining = store_->timeUntilExpiry();
        if (!remaining) {
            return SessionState::Unauthenticated;
        }
        if (*remaining <= config_.renewalMargin) {
            return SessionState::Expiring;
        }
    }
    return state_;
}

std::size_t AuthSessionManager::renewalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return renewalCount_;
}

Credentials AuthSessionManager::performLogin(const LoginMemo& memo, const Region& region) {
    AccountToken account = exchangePassword(memo, region);
    std::string authCode = fetchAuthCode(account, region);
    return loginByAuthCode(account.userId, authCode, region);
}

Credentials AuthSessionManager::renew(const Credentials& expiring) {
    std::optional<AuthError> renewalFailure;
    if (!expiring.authCode.empty()) {
        try {
            return loginByAuthCode(expiring.userId, expiring.authCode, expiring.region);
        } catch (const AuthError& e) {
            std::cerr << "[Auth] Token exchange with stored auth code failed: " << e.what() << std::endl;
            renewalFailure.emplace(e);
        }
    }
    
    std::optional<LoginMemo> memo;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        memo = memo_;
    }
    
    if (memo) {
        std::cout << "[Auth] Falling back to full login for " << memo->username << std::endl;
        try {
            return performLogin(*memo, expiring.region);
        } catch (const AuthError& e) {
            throw AuthError(AuthError::Code::RenewalFailed, "renewal and fallback login failed",
                            ErrorContext{"", "", e.what()}, e.rootCause());
        }
    }
    
    if (renewalFailure) {
        throw AuthError(AuthError::Code::RenewalFailed, "token renewal failed",
                        ErrorContext{"", "", renewalFailure->what()}, renewalFailure->rootCause());
    }
    throw AuthError(AuthError::Code::RenewalFailed, "no auth code or remembered login to renew with",
                    ErrorContext{}, AuthError::Code::Unauthenticated);
}

AuthSessionManager::AccountToken AuthSessionManager::exchangePassword(const LoginMemo& memo,
                                                                      const Region& region) {
    RequestSigner::Params params{
        {"requestId", RequestSigner::md5Hex(std::to_string(clock_->epochMillis()))},
        {"account", memo.username},
        {"password", memo.passwordHash},
        {"authTimespan", std::to_string(clock_->epochMillis())},
        {"authTimeZone", kTimeZone}
    };
    
    RequestSigner::Params signing = params;
    signing.insert({
        {"country", region.country},
        {"lang", kLanguage},
        {"deviceId", config_.clientDeviceId},
        {"appCode", kAppCode},
        {"appVersion", kAppVersion},
        {"channel", kChannel},
        {"deviceType", kDeviceType}
    });
    params["authSign"] = RequestSigner::sign(signing, RequestSigner::loginAppKey());
    params["authAppkey"] = RequestSigner::loginAppKey().key;
    
    nlohmann::json response = getJson(loginUrl(region), params);
    std::string code = stringField(response, "code");
    
    if (code == kCodeSuccess) {
        const auto& data = response.contains("data") ? response["data"] : nlohmann::json::object();
        AccountToken account{stringField(data, "uid"), stringField(data, "accessToken")};
        if (account.userId.empty() || account.accessToken.empty()) {
            throw AuthError(AuthError::Code::ProtocolError, "login response lacks uid or access token");
        }
        return account;
    }
    if (code == kCodeWrongPassword || code == kCodeUnknownAccount) {
        throw AuthError(AuthError::Code::InvalidCredentials, "invalid account or password",
                        ErrorContext{"", "", "code " + code});
    }
    throw AuthError(AuthError::Code::ProtocolError, "login rejected",
                    ErrorContext{"", "", stringField(response, "msg") + " (code " + code + ")"});
}

std::string AuthSessionManager::fetchAuthCode(const AccountToken& account, const Region& region) {
    RequestSigner::Params params{
        {"uid", account.userId},
        {"accessToken", account.accessToken},
        {"bizType", kBizType},
        {"deviceId", config_.clientDeviceId},
        {"authTimespan", std::to_string(clock_->epochMillis())}
    };
    
    RequestSigner::Params signing = params;
    signing["openId"] = kOpenId;
    params["authSign"] = RequestSigner::sign(signing, RequestSigner::authCodeAppKey());
    params["authAppkey"] = RequestSigner::authCodeAppKey().key;
    
    nlohmann::json response = getJson(authCodeUrl(region), params);
    std::string code = stringField(response, "code");
    
    if (code == kCodeSuccess) {
        const auto& data = response.contains("data") ? response["data"] : nlohmann::json::object();
        std::string authCode = stringField(data, "authCode");
        if (authCode.empty()) {
            throw AuthError(AuthError::Code::ProtocolError, "auth code response lacks authCode");
        }
        return authCode;
    }
    if (code == kCodeWrongPassword) {
        throw AuthError(AuthError::Code::InvalidCredentials, "auth code request rejected",
                        ErrorContext{"", "", "code " + code});
    }
    throw AuthError(AuthError::Code::ProtocolError, "auth code request failed",
                    ErrorContext{"", "", stringField(response, "msg") + " (code " + code + ")"});
}

Credentials AuthSessionManager::loginByAuthCode(const std::string& userId, const std::string& authCode,
                                                const Region& region) {
    std::string country = "Chinese";
    if (!region.isChina()) {
        country = region.country;
        for (auto& c : country) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    
    nlohmann::json body{
        {"todo", "loginByItToken"},
        {"edition", kEdition},
        {"userId", userId},
        {"token", authCode},
        {"realm", PortalClient::kRealm},
        {"resource", portal_->clientResource()},
        {"org", region.isChina() ? "ECOCN" : "ECOWW"},
        {"last", ""},
        {"country", country}
    };
    
    nlohmann::json response;
    try {
        response = portal_->post(region, PortalClient::kUserPath, body);
    } catch (const TransportError& e) {
        if (e.httpStatus() == 404) {
            throw AuthError(AuthError::Code::RegionUnavailable, "portal not available for region",
                            ErrorContext{"", "", e.what()});
        }
        if (e.httpStatus() == 0 || e.httpStatus() >= 500) {
            throw AuthError(AuthError::Code::NetworkError, "portal unreachable", ErrorContext{"", "", e.what()});
        }
        throw AuthError(AuthError::Code::ProtocolError, "token exchange failed", ErrorContext{"", "", e.what()});
    }
    
    if (stringField(response, "result") == "ok") {
        Credentials credentials;
        credentials.userId = stringField(response, "userId");
        if (credentials.userId.empty()) {
            credentials.userId = userId;
        }
        credentials.accessToken = stringField(response, "token");
        credentials.accessTokenExpiry = clock_->now() + config_.tokenLifetime;
        credentials.authCode = authCode;
        credentials.region = region;
        if (credentials.accessToken.empty()) {
            throw AuthError(AuthError::Code::ProtocolError, "token exchange response lacks token");
        }
        return credentials;
    }
    if (PortalClient::isTokenRejection(response)) {
        throw AuthError(AuthError::Code::TokenRejected, "auth code rejected by portal",
                        ErrorContext{"", "", response.dump()});
    }
    throw AuthError(AuthError::Code::ProtocolError, "token exchange failed", ErrorContext{"", "", response.dump()});
}

nlohmann::json AuthSessionManager::getJson(const std::string& url, const ports::QueryParams& query) {
    auto response = http_->get(url, query);
    if (response.status == 0) {
        throw AuthError(AuthError::Code::NetworkError, "login API unreachable", ErrorContext{"", "", response.error});
    }
    if (response.status == 404) {
        throw AuthError(AuthError::Code::RegionUnavailable, "login API not available for region",
                        ErrorContext{"", "", url});
    }
    if (response.status >= 500) {
        throw AuthError(AuthError::Code::NetworkError, "login API failed",
                        ErrorContext{"", "", "HTTP " + std::to_string(response.status)});
    }
    if (!response.ok()) {
        throw AuthError(AuthError::Code::ProtocolError, "unexpected login API status",
                        ErrorContext{"", "", "HTTP " + std::to_string(response.status)});
    }
    
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw AuthError(AuthError::Code::ProtocolError, "login API returned a non-JSON body",
                        ErrorContext{"", "", e.what()});
    }
}

std::string AuthSessionManager::loginUrl(const Region& region) const {
    std::string path = region.isChina() ? "user/loginCheckMobile" : "user/login";
    return "https://gl-" + region.country + "-api.ecovacs." + region.topLevelDomain() +
           "/v1/private/" + region.country + "/" + kLanguage + "/" + config_.clientDeviceId + "/" +
           kAppCode + "/" + kAppVersion + "/" + kChannel + "/" + kDeviceType + "/" + path;
}

std::string AuthSessionManager::authCodeUrl(const Region& region) {
    return "https://gl-" + region.country + "-openapi.ecovacs." + region.topLevelDomain() +
           "/v1/global/auth/getAuthCode";
}

std::string toString(SessionState state) {
    switch (state) {
        case SessionState::Unauthenticated: return "unauthenticated";
        case SessionState::Authenticating: return "authenticating";
        case SessionState::Authenticated: return "authenticated";
        case SessionState::Expiring: return "expiring";
        case SessionState::Renewing: return "renewing";
    }
    return "unknown";
}

} // namespace deebot
