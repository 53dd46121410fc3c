/**
 * @file CredentialStore.hpp
 * @brief In-memory holder of the current session credentials
 *
 * Explicitly owned and passed to the components that need it, so several
 * accounts can coexist in one process and tests can inject their own store.
 * Persistence belongs to an external collaborator which observes changes
 * through the change callback; the store never touches files.
 */

#pragma once

#include "Credentials.hpp"
#include "IClock.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace deebot {

class CredentialStore {
public:
    /// Store lifecycle
    enum class Validity {
        Empty,     ///< No credentials stored
        Valid,     ///< Access token not yet expired
        Expired    ///< Access token expired (auth code may still renew it)
    };

    /// Invoked after every store() or clear(); empty optional means cleared
    using ChangeCallback = std::function<void(const std::optional<Credentials>&)>;

    explicit CredentialStore(std::shared_ptr<IClock> clock);

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    void store(const Credentials& credentials);
    void clear();

    Validity validity() const;

    /**
     * @brief Credentials usable for authenticated calls
     * @return Stored credentials, or nullopt when empty or expired
     */
    std::optional<Credentials> current() const;

    /**
     * @brief Stored record regardless of expiry
     * @note Renewal needs the user ID and auth code of an expired session
     */
    std::optional<Credentials> raw() const;

    /// Time left before expiry; zero or negative when expired, nullopt when empty
    std::optional<std::chrono::system_clock::duration> timeUntilExpiry() const;

    void setChangeCallback(ChangeCallback callback);

private:
    std::shared_ptr<IClock> clock_;
    mutable std::mutex mutex_;
    std::optional<Credentials> credentials_;
    ChangeCallback changeCallback_;

    void notifyChanged(const std::optional<Credentials>& credentials);
};

std::string toString(CredentialStore::Validity validity);

} // namespace deebot
