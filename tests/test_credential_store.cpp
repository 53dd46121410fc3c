#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "../core/CredentialStore.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../platform/desktop/CredentialCache.hpp"
#include <cstdio>
#include <fstream>
#include <memory>

using namespace deebot;

class CredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        clock_->freezeTime();
        store_ = std::make_shared<CredentialStore>(clock_);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<CredentialStore> store_;
};

TEST_F(CredentialStoreTest, StartsEmpty) {
    EXPECT_EQ(store_->validity(), CredentialStore::Validity::Empty);
    EXPECT_FALSE(store_->current().has_value());
    EXPECT_FALSE(store_->raw().has_value());
    EXPECT_FALSE(store_->timeUntilExpiry().has_value());
}

TEST_F(CredentialStoreTest, ExpiredCredentialsAreKeptButNotCurrent) {
    auto credentials = testsupport::sampleCredentials(clock_->now());
    credentials.accessTokenExpiry = clock_->now() + std::chrono::seconds(10);
    store_->store(credentials);
    
    EXPECT_EQ(store_->validity(), CredentialStore::Validity::Valid);
    ASSERT_TRUE(store_->current().has_value());
    
    clock_->advance(std::chrono::seconds(10));
    EXPECT_EQ(store_->validity(), CredentialStore::Validity::Expired);
    EXPECT_FALSE(store_->current().has_value());
    ASSERT_TRUE(store_->raw().has_value());
    EXPECT_EQ(store_->raw()->authCode, "auth-code-1");
    EXPECT_LE(store_->timeUntilExpiry()->count(), 0);
}

TEST_F(CredentialStoreTest, ChangeCallbackSeesStoreAndClear) {
    int stored = 0;
    int cleared = 0;
    store_->setChangeCallback([&](const std::optional<Credentials>& credentials) {
        credentials ? ++stored : ++cleared;
    });
    
    store_->store(testsupport::sampleCredentials(clock_->now()));
    store_->clear();
    store_->clear();  // already empty, no notification
    
    EXPECT_EQ(stored, 1);
    EXPECT_EQ(cleared, 1);
    EXPECT_EQ(store_->validity(), CredentialStore::Validity::Empty);
}

TEST_F(CredentialStoreTest, NullClockIsRejected) {
    EXPECT_THROW(CredentialStore(nullptr), std::invalid_argument);
}

TEST_F(CredentialStoreTest, CacheFollowsStoreChanges) {
    const std::string path = ::testing::TempDir() + "deebot_credentials_test.json";
    std::remove(path.c_str());
    
    CredentialCache cache(path);
    cache.attach(*store_);
    EXPECT_FALSE(cache.load().has_value());
    
    auto credentials = testsupport::sampleCredentials(clock_->now());
    store_->store(credentials);
    
    auto loaded = cache.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->userId, credentials.userId);
    EXPECT_EQ(loaded->accessToken, credentials.accessToken);
    EXPECT_EQ(loaded->authCode, credentials.authCode);
    EXPECT_EQ(loaded->region.continent, "eu");
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(loaded->accessTokenExpiry.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::milliseconds>(credentials.accessTokenExpiry.time_since_epoch()));
    
    // A second store restores the cached session on attach
    auto restored = std::make_shared<CredentialStore>(clock_);
    cache.attach(*restored);
    EXPECT_EQ(restored->validity(), CredentialStore::Validity::Valid);
    
    store_->clear();
    EXPECT_FALSE(cache.load().has_value());
}

TEST_F(CredentialStoreTest, CorruptCacheIsIgnored) {
    const std::string path = ::testing::TempDir() + "deebot_credentials_corrupt.json";
    {
        std::ofstream file(path);
        file << "{\"uid\": 42";
    }
    
    CredentialCache cache(path);
    EXPECT_FALSE(cache.load().has_value());
    std::remove(path.c_str());
}
