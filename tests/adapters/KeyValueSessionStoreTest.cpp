#include <gtest/gtest.h>

#include "adapters/secondary/KeyValueSessionStore.hpp"
#include "domain/exceptions/StoreUnavailableException.hpp"
#include "adapters/secondary/LruKeyValueStore.hpp"
#include "mocks/InMemoryKeyValueStore.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/TestSettings.hpp"

#include <algorithm>

using namespace gateway;
using namespace gateway::tests::mocks;
using gateway::adapters::secondary::KeyValueSessionStore;

// ============================================
// TEST FIXTURE
// ============================================

class KeyValueSessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        kv_ = std::make_shared<InMemoryKeyValueStore>(clock_);
        settings_ = std::make_shared<TestSessionSettings>();
        store_ = std::make_shared<KeyValueSessionStore>(kv_, settings_);
    }

    domain::Session makeSession(const std::string& id, const std::string& userId) {
        domain::Session s;
        s.sessionId = id;
        s.userId = userId;
        s.fingerprint = std::string(64, 'a');
        s.createdAt = clock_->now();
        s.expiresAt = s.createdAt + settings_->getSessionTtl();
        s.deviceInfo.ip = "1.2.3.4";
        s.deviceInfo.userAgent = "UA1";
        s.deviceInfo.acceptLanguage = "en";
        return s;
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<InMemoryKeyValueStore> kv_;
    std::shared_ptr<TestSessionSettings> settings_;
    std::shared_ptr<KeyValueSessionStore> store_;
};

// ============================================
// CREATE / GET
// ============================================

TEST_F(KeyValueSessionStoreTest, CreateThenGet_ReturnsSameRecord) {
    auto session = makeSession("sess-1", "42");
    store_->create(session);

    auto found = store_->get("sess-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->userId, "42");
    EXPECT_EQ(found->fingerprint, session.fingerprint);
    EXPECT_EQ(found->deviceInfo.userAgent, "UA1");
    EXPECT_EQ(found->expiresAt, session.expiresAt);
}

TEST_F(KeyValueSessionStoreTest, Create_WritesKeysWithPrefixes) {
    store_->create(makeSession("sess-1", "42"));

    EXPECT_TRUE(kv_->contains("session:sess-1"));
    EXPECT_TRUE(kv_->contains("user_id:sess-1"));
    EXPECT_TRUE(kv_->contains("user_sessions:42"));
    EXPECT_EQ(store_->getCachedUserId("sess-1"), std::optional<std::string>("42"));
}

TEST_F(KeyValueSessionStoreTest, Create_ExistingId_ThrowsCollision) {
    store_->create(makeSession("sess-1", "42"));
    EXPECT_THROW(store_->create(makeSession("sess-1", "43")), domain::SessionIdCollisionException);

    // Исходная запись не перезаписана
    EXPECT_EQ(store_->get("sess-1")->userId, "42");
}

TEST_F(KeyValueSessionStoreTest, Get_Unknown_ReturnsNullopt) {
    EXPECT_FALSE(store_->get("nope").has_value());
}

TEST_F(KeyValueSessionStoreTest, Get_AfterTtl_ReturnsNullopt) {
    store_->create(makeSession("sess-1", "42"));
    clock_->advance(std::chrono::seconds(3601));
    EXPECT_FALSE(store_->get("sess-1").has_value());
}

TEST_F(KeyValueSessionStoreTest, UserIdCache_HasOwnTtl) {
    settings_->userIdCacheTtl = std::chrono::seconds(60);
    store_->create(makeSession("sess-1", "42"));

    clock_->advance(std::chrono::seconds(61));
    EXPECT_FALSE(store_->getCachedUserId("sess-1").has_value());
    EXPECT_TRUE(store_->get("sess-1").has_value());
}

TEST_F(KeyValueSessionStoreTest, Get_GarbageRecord_ThrowsMalformed) {
    kv_->putRaw("session:sess-1", "{not json", std::chrono::seconds(60));
    EXPECT_THROW(store_->get("sess-1"), domain::MalformedSessionRecordException);
}

TEST_F(KeyValueSessionStoreTest, Get_RecordForOtherId_ThrowsMalformed) {
    store_->create(makeSession("sess-1", "42"));
    auto raw = kv_->getValue("session:sess-1");
    kv_->putRaw("session:sess-2", *raw, std::chrono::seconds(60));

    EXPECT_THROW(store_->get("sess-2"), domain::MalformedSessionRecordException);
}

// ============================================
// DELETE
// ============================================

TEST_F(KeyValueSessionStoreTest, Remove_DeletesRecordCacheAndIndexEntry) {
    store_->create(makeSession("sess-1", "42"));
    store_->create(makeSession("sess-2", "42"));

    store_->remove("sess-1");

    EXPECT_FALSE(store_->get("sess-1").has_value());
    EXPECT_FALSE(store_->getCachedUserId("sess-1").has_value());
    EXPECT_EQ(store_->sessionsOfUser("42"), std::vector<std::string>{"sess-2"});
}

TEST_F(KeyValueSessionStoreTest, Remove_IsIdempotent) {
    store_->create(makeSession("sess-1", "42"));
    EXPECT_TRUE(store_->remove("sess-1"));
    EXPECT_FALSE(store_->remove("sess-1"));
    EXPECT_FALSE(store_->remove("never-existed"));
    EXPECT_FALSE(store_->get("sess-1").has_value());
}

TEST_F(KeyValueSessionStoreTest, Remove_WithoutCachedUserId_StillCleansIndex) {
    settings_->userIdCacheTtl = std::chrono::seconds(10);
    store_->create(makeSession("sess-1", "42"));
    clock_->advance(std::chrono::seconds(11));

    store_->remove("sess-1");
    EXPECT_TRUE(store_->sessionsOfUser("42").empty());
}

// ============================================
// НЕДОСТУПНОСТЬ
// ============================================

TEST_F(KeyValueSessionStoreTest, Unavailable_EveryOperationThrows) {
    kv_->setUnavailable(true);

    EXPECT_THROW(store_->create(makeSession("sess-1", "42")), domain::StoreUnavailableException);
    EXPECT_THROW(store_->get("sess-1"), domain::StoreUnavailableException);
    EXPECT_THROW(store_->remove("sess-1"), domain::StoreUnavailableException);
    EXPECT_THROW(store_->getCachedUserId("sess-1"), domain::StoreUnavailableException);
    EXPECT_FALSE(store_->isReachable());
}

TEST_F(KeyValueSessionStoreTest, MemoryBackendAtCapacity_StillIndexesAllLiveSessions) {
    auto lru = std::make_shared<adapters::secondary::LruKeyValueStore>(4, clock_);
    KeyValueSessionStore store(lru, settings_);

    store.create(makeSession("laptop", "42"));
    store.create(makeSession("phone", "42"));
    // Чтения сессий держат их ключи свежими в LRU
    for (int i = 0; i < 5; ++i) {
        store.get("laptop");
        store.get("phone");
    }

    auto ids = store.sessionsOfUser("42");
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"laptop", "phone"}));
    EXPECT_LE(lru->size(), 4u);
}
