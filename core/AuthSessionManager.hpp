/**
 * @file AuthSessionManager.hpp
 * @brief Login, token exchange and renewal against the vendor cloud
 * 
 * Drives the three step vendor handshake:
 * 1. Account/password exchange on the regional login API (signed GET)
 * 2. Auth code request on the regional open API (signed GET)
 * 3. loginByItToken on the portal, which yields the IoT access token
 * 
 * Renewal repeats step 3 with the stored auth code. Renewal is checked lazily
 * on every ensureValid() call; there is no background timer.
 * 
 * @note Concurrent ensureValid() callers share one renewal (single flight)
 * @note invalidate() forgets the remembered login so a revoked session is
 *       never retried automatically
 */

#pragma once

#include "CredentialStore.hpp"
#include "IClock.hpp"
#include "PortalClient.hpp"
#include "ports/IHttpClient.hpp"
#include "ports/ISessionProvider.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace deebot {

/**
 * @brief Session lifecycle as observed by callers
 */
enum class SessionState {
    Unauthenticated,   ///< No usable session
    Authenticating,    ///< Full login in progress
    Authenticated,     ///< Access token valid beyond the safety margin
    Expiring,          ///< Access token within the safety margin or expired
    Renewing           ///< Renewal in progress
};

/**
 * @brief Auth session configuration
 */
struct AuthConfig {
    std::string clientDeviceId;                                ///< Stable client identifier (hex)
    std::chrono::seconds renewalMargin{60};                    ///< Renew when expiry is this close
    std::chrono::seconds tokenLifetime{std::chrono::hours(48)}; ///< Assumed IoT token lifetime
};

class AuthSessionManager : public ports::ISessionProvider {
public:
    /// Login API codes
    static constexpr const char* kCodeSuccess = "0000";
    static constexpr const char* kCodeWrongPassword = "1005";
    static constexpr const char* kCodeUnknownAccount = "1010";
    
    /**
     * @brief Construct session manager
     * @param http HTTP capability for the login and auth code APIs
     * @param portal Portal request layer for the token exchange
     * @param store Credential store populated by login and renewal
     * @param clock Time source for expiry computation
     * @param config Session configuration
     * @throws std::invalid_argument if a dependency is null or the device ID is empty
     */
    AuthSessionManager(std::shared_ptr<ports::IHttpClient> http,
                       std::shared_ptr<PortalClient> portal,
                       std::shared_ptr<CredentialStore> store,
                       std::shared_ptr<IClock> clock,
                       AuthConfig config);
    
    /**
     * @brief Full login with a clear text password
     * @throws AuthError InvalidCredentials, RegionUnavailable, NetworkError or ProtocolError
     */
    Credentials login(const std::string& username, const std::string& password, const Region& region);
    
    /**
     * @brief Full login with an MD5 password hash
     * @throws AuthError InvalidCredentials, RegionUnavailable, NetworkError or ProtocolError
     */
    Credentials loginWithHash(const std::string& username, const std::string& passwordHash,
                              const Region& region);
    
    /**
     * @brief Remember a login for the renewal fallback without contacting the cloud
     * 
     * Used when credentials were restored from a cache.
     */
    void rememberLogin(const std::string& username, const std::string& passwordHash);
    
    /**
     * @brief Current credentials, renewed when they expire within the margin
     * @throws AuthError Unauthenticated when nothing is stored, RenewalFailed
     *         when renewal and the fallback login both fail
     */
    Credentials ensureValid() override;
    
    /**
     * @brief Drop the session after an explicit rejection by the cloud
     */
    void invalidate() override;
    
    SessionState state() const;
    
    /// Number of renewals performed (token exchanges with a stored auth code)
    std::size_t renewalCount() const;
    
private:
    struct LoginMemo {
        std::string username;
        std::string passwordHash;
    };
    
    struct AccountToken {
        std::string userId;
        std::string accessToken;
    };
    
    std::shared_ptr<ports::IHttpClient> http_;
    std::shared_ptr<PortalClient> portal_;
    std::shared_ptr<CredentialStore> store_;
    std::shared_ptr<IClock> clock_;
    AuthConfig config_;
    
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Unauthenticated;
    std::optional<LoginMemo> memo_;
    std::optional<std::shared_future<Credentials>> renewal_;
    std::size_t renewalCount_ = 0;
    
    Credentials performLogin(const LoginMemo& memo, const Region& region);
    Credentials renew(const Credentials& expiring);
    
    AccountToken exchangePassword(const LoginMemo& memo, const Region& region);
    std::string fetchAuthCode(const AccountToken& account, const Region& region);
    Credentials loginByAuthCode(const std::string& userId, const std::string& authCode,
                                const Region& region);
    
    nlohmann::json getJson(const std::string& url, const ports::QueryParams& query);
    
    std::string loginUrl(const Region& region) const;
    static std::string authCodeUrl(const Region& region);
};

std::string toString(SessionState state);

} // namespace deebot
