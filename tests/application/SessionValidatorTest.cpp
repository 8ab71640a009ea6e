#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/SessionValidator.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/KeyValueSessionStore.hpp"
#include "adapters/secondary/Sha256FingerprintGenerator.hpp"
#include "settings/MetricsSettings.hpp"
#include "mocks/InMemoryKeyValueStore.hpp"
#include "mocks/MockSessionStore.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/TestSettings.hpp"

using namespace gateway;
using namespace gateway::tests::mocks;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::StrictMock;

// ============================================
// TEST FIXTURE
// ============================================

class SessionValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        kv_ = std::make_shared<InMemoryKeyValueStore>(clock_);
        settings_ = std::make_shared<TestSessionSettings>();
        store_ = std::make_shared<adapters::secondary::KeyValueSessionStore>(kv_, settings_);
        fingerprints_ = std::make_shared<adapters::secondary::Sha256FingerprintGenerator>();
        metrics_ = std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());
        validator_ = std::make_shared<application::SessionValidator>(store_, fingerprints_, clock_, metrics_);

        device_.ip = "1.2.3.4";
        device_.userAgent = "UA1";
        device_.acceptLanguage = "en";
    }

    domain::Session seed(const std::string& id, const std::string& userId) {
        domain::Session s;
        s.sessionId = id;
        s.userId = userId;
        s.fingerprint = fingerprints_->fingerprint(device_);
        s.createdAt = clock_->now();
        s.expiresAt = s.createdAt + settings_->getSessionTtl();
        s.deviceInfo = device_;
        store_->create(s);
        return s;
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<InMemoryKeyValueStore> kv_;
    std::shared_ptr<TestSessionSettings> settings_;
    std::shared_ptr<adapters::secondary::KeyValueSessionStore> store_;
    std::shared_ptr<adapters::secondary::Sha256FingerprintGenerator> fingerprints_;
    std::shared_ptr<application::MetricsService> metrics_;
    std::shared_ptr<application::SessionValidator> validator_;
    domain::DeviceAttributes device_;
};

// ============================================
// VALID
// ============================================

TEST_F(SessionValidatorTest, SameDevice_Valid_WithUserId) {
    seed("sess-1", "42");

    auto result = validator_->validate("sess-1", device_);

    EXPECT_EQ(result.outcome, domain::ValidationOutcome::Valid);
    EXPECT_EQ(result.userId, "42");
    EXPECT_EQ(result.sessionId, "sess-1");
}

TEST_F(SessionValidatorTest, Valid_JustBeforeExpiry) {
    seed("sess-1", "42");
    clock_->advance(std::chrono::seconds(3599));

    EXPECT_EQ(validator_->validate("sess-1", device_).outcome, domain::ValidationOutcome::Valid);
}

TEST_F(SessionValidatorTest, UserIdCacheMiss_RepopulatedFromRecord) {
    seed("sess-1", "42");
    store_->evictCachedUserId("sess-1");

    auto result = validator_->validate("sess-1", device_);

    EXPECT_EQ(result.userId, "42");
    EXPECT_EQ(store_->getCachedUserId("sess-1"), std::optional<std::string>("42"));
}

TEST_F(SessionValidatorTest, UserIdCacheDisagrees_RecordWinsAndCacheRefreshed) {
    seed("sess-1", "42");
    store_->cacheUserId("sess-1", "666");

    auto result = validator_->validate("sess-1", device_);

    EXPECT_EQ(result.outcome, domain::ValidationOutcome::Valid);
    EXPECT_EQ(result.userId, "42");
    EXPECT_EQ(store_->getCachedUserId("sess-1"), std::optional<std::string>("42"));
}

// ============================================
// NOT FOUND
// ============================================

TEST_F(SessionValidatorTest, UnknownSession_NotFound) {
    auto result = validator_->validate("sess-unknown", device_);
    EXPECT_EQ(result.outcome, domain::ValidationOutcome::NotFound);
    EXPECT_TRUE(result.userId.empty());
}

TEST_F(SessionValidatorTest, MissingToken_NotFound_WithoutStoreCall) {
    auto store = std::make_shared<StrictMock<MockSessionStore>>();
    application::SessionValidator validator(store, fingerprints_, clock_, metrics_);

    EXPECT_EQ(validator.validate("", device_).outcome, domain::ValidationOutcome::NotFound);
}

TEST_F(SessionValidatorTest, MalformedToken_NotFound_WithoutStoreCall) {
    auto store = std::make_shared<StrictMock<MockSessionStore>>();
    application::SessionValidator validator(store, fingerprints_, clock_, metrics_);

    EXPECT_EQ(validator.validate("abc;DROP", device_).outcome, domain::ValidationOutcome::NotFound);
    EXPECT_EQ(validator.validate(std::string(300, 'a'), device_).outcome, domain::ValidationOutcome::NotFound);
}

TEST_F(SessionValidatorTest, DeletedSession_NotFound) {
    seed("sess-1", "42");
    store_->remove("sess-1");
    EXPECT_EQ(validator_->validate("sess-1", device_).outcome, domain::ValidationOutcome::NotFound);
}

// ============================================
// EXPIRED
// ============================================

TEST_F(SessionValidatorTest, AtExpiresAt_Expired_EvenIfStoreStillHoldsKey) {
    kv_->setEvictionLag(std::chrono::seconds(30));
    seed("sess-1", "42");
    clock_->advance(std::chrono::seconds(3600));

    ASSERT_TRUE(kv_->contains("session:sess-1"));
    EXPECT_EQ(validator_->validate("sess-1", device_).outcome, domain::ValidationOutcome::Expired);
}

TEST_F(SessionValidatorTest, Expired_RegardlessOfFingerprint) {
    kv_->setEvictionLag(std::chrono::seconds(30));
    seed("sess-1", "42");
    clock_->advance(std::chrono::seconds(3605));

    auto other = device_;
    other.userAgent = "UA2";
    EXPECT_EQ(validator_->validate("sess-1", other).outcome, domain::ValidationOutcome::Expired);
}

TEST_F(SessionValidatorTest, NegativeLifetimeRecord_Expired) {
    domain::Session s;
    s.sessionId = "sess-skew";
    s.userId = "42";
    s.fingerprint = fingerprints_->fingerprint(device_);
    s.createdAt = clock_->now() + std::chrono::hours(2);
    s.expiresAt = clock_->now() + std::chrono::hours(1);
    store_->create(s);

    EXPECT_EQ(validator_->validate("sess-skew", device_).outcome, domain::ValidationOutcome::Expired);
}

// ============================================
// FINGERPRINT MISMATCH
// ============================================

TEST_F(SessionValidatorTest, AnySingleAttributeChange_Mismatch) {
    seed("sess-1", "42");

    auto ip = device_;
    ip.ip = "5.6.7.8";
    auto ua = device_;
    ua.userAgent = "UA2";
    auto lang = device_;
    lang.acceptLanguage = "de";

    for (const auto& attrs : {ip, ua, lang}) {
        auto result = validator_->validate("sess-1", attrs);
        EXPECT_EQ(result.outcome, domain::ValidationOutcome::FingerprintMismatch);
        EXPECT_TRUE(result.userId.empty());
    }
}

TEST_F(SessionValidatorTest, Mismatch_DoesNotDeleteSession) {
    seed("sess-1", "42");
    auto other = device_;
    other.userAgent = "UA2";

    validator_->validate("sess-1", other);

    EXPECT_EQ(validator_->validate("sess-1", device_).outcome, domain::ValidationOutcome::Valid);
}

// ============================================
// STORE ERROR (fail closed)
// ============================================

TEST_F(SessionValidatorTest, StoreTimeout_StoreError) {
    seed("sess-1", "42");
    kv_->setUnavailable(true);

    auto result = validator_->validate("sess-1", device_);

    EXPECT_EQ(result.outcome, domain::ValidationOutcome::StoreError);
    EXPECT_TRUE(result.userId.empty());
    EXPECT_EQ(metrics_->value("gateway_store_errors_total{operation=\"get\"}"), 1);
}

TEST_F(SessionValidatorTest, MalformedRecord_StoreError) {
    kv_->putRaw("session:sess-bad", "garbage", std::chrono::seconds(60));
    EXPECT_EQ(validator_->validate("sess-bad", device_).outcome, domain::ValidationOutcome::StoreError);
}

TEST_F(SessionValidatorTest, UserIdCacheUnavailable_StoreError) {
    auto store = std::make_shared<StrictMock<MockSessionStore>>();
    application::SessionValidator validator(store, fingerprints_, clock_, metrics_);

    domain::Session s;
    s.sessionId = "sess-1";
    s.userId = "42";
    s.fingerprint = fingerprints_->fingerprint(device_);
    s.createdAt = clock_->now();
    s.expiresAt = s.createdAt + std::chrono::hours(1);

    EXPECT_CALL(*store, get("sess-1")).WillOnce(Return(s));
    EXPECT_CALL(*store, getCachedUserId("sess-1"))
        .WillOnce(Throw(domain::StoreUnavailableException("timeout")));

    auto result = validator.validate("sess-1", device_);
    EXPECT_EQ(result.outcome, domain::ValidationOutcome::StoreError);
    EXPECT_TRUE(result.userId.empty());
}

TEST_F(SessionValidatorTest, CachedUserIdMatches_NoCacheWrite) {
    auto store = std::make_shared<StrictMock<MockSessionStore>>();
    application::SessionValidator validator(store, fingerprints_, clock_, metrics_);

    domain::Session s;
    s.sessionId = "sess-1";
    s.userId = "42";
    s.fingerprint = fingerprints_->fingerprint(device_);
    s.createdAt = clock_->now();
    s.expiresAt = s.createdAt + std::chrono::hours(1);

    EXPECT_CALL(*store, get("sess-1")).WillOnce(Return(s));
    EXPECT_CALL(*store, getCachedUserId("sess-1")).WillOnce(Return(std::optional<std::string>("42")));

    EXPECT_EQ(validator.validate("sess-1", device_).userId, "42");
}
