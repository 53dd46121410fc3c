#include "CredentialStore.hpp"
#include <stdexcept>

namespace deebot {

CredentialStore::CredentialStore(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("CredentialStore: clock cannot be null");
    }
}

void CredentialStore::store(const Credentials& credentials) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials_ = credentials;
    }
    notifyChanged(credentials);
}

void CredentialStore::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!credentials_) {
            return;
        }
        credentials_.reset();
    }
    notifyChanged(std::nullopt);
}

CredentialStore::Validity CredentialStore::validity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!credentials_) {
        return Validity::Empty;
    }
    return credentials_->isValidAt(clock_->now()) ? Validity::Valid : Validity::Expired;
}

std::optional<Credentials> CredentialStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!credentials_ || !credentials_->isValidAt(clock_->now())) {
        return std::nullopt;
    }
    return credentials_;
}

std::optional<Credentials> CredentialStore::raw() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_;
}

std::optional<std::chrono::system_clock::duration> CredentialStore::timeUntilExpiry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!credentials_) {
        return std::nullopt;
    }
    return credentials_->accessTokenExpiry - clock_->now();
}

void CredentialStore::setChangeCallback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    changeCallback_ = std::move(callback);
}

void CredentialStore::notifyChanged(const std::optional<Credentials>& credentials) {
    ChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = changeCallback_;
    }
    if (callback) {
        callback(credentials);
    }
}

std::string toString(CredentialStore::Validity validity) {
    switch (validity) {
        case CredentialStore::Validity::Empty: return "empty";
        case CredentialStore::Validity::Valid: return "valid";
        case CredentialStore::Validity::Expired: return "expired";
    }
    return "unknown";
}

} // namespace deebot
