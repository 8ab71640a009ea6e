#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/SignInHandler.hpp"
#include "adapters/primary/LogoutHandler.hpp"
#include "adapters/primary/AuthRedirectHandler.hpp"
#include "application/SignInService.hpp"
#include "application/SessionLifecycleManager.hpp"
#include "application/SessionValidator.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/KeyValueSessionStore.hpp"
#include "adapters/secondary/Sha256FingerprintGenerator.hpp"
#include "settings/MetricsSettings.hpp"
#include "mocks/InMemoryKeyValueStore.hpp"
#include "mocks/InMemoryDeviceAuditRepository.hpp"
#include "mocks/SequenceSessionIdGenerator.hpp"
#include "mocks/MockAuthProvider.hpp"
#include "mocks/FakeClock.hpp"
#include "mocks/TestHttp.hpp"
#include "mocks/TestSettings.hpp"

#include <nlohmann/json.hpp>

using namespace gateway;
using namespace gateway::adapters::primary;
using namespace gateway::tests::mocks;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Тестовый класс: реальные сервисы поверх in-memory хранилища
// ============================================================================

class AuthEndpointsTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        kv_ = std::make_shared<InMemoryKeyValueStore>(clock_);
        sessionSettings_ = std::make_shared<TestSessionSettings>();
        gatewaySettings_ = std::make_shared<TestGatewaySettings>();
        store_ = std::make_shared<adapters::secondary::KeyValueSessionStore>(kv_, sessionSettings_);
        auto fingerprints = std::make_shared<adapters::secondary::Sha256FingerprintGenerator>();
        metrics_ = std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());
        provider_ = std::make_shared<MockAuthProvider>();

        validator_ = std::make_shared<application::SessionValidator>(store_, fingerprints, clock_, metrics_);
        lifecycle_ = std::make_shared<application::SessionLifecycleManager>(
            store_, fingerprints, std::make_shared<SequenceSessionIdGenerator>(), clock_,
            std::make_shared<InMemoryDeviceAuditRepository>(), metrics_, sessionSettings_);
        auto signIn = std::make_shared<application::SignInService>(provider_, lifecycle_, metrics_);

        signInHandler_ = std::make_shared<SignInHandler>(signIn, sessionSettings_, gatewaySettings_);
        logoutHandler_ = std::make_shared<LogoutHandler>(validator_, lifecycle_, sessionSettings_);
    }

    static TestRequest fromLaptop(const std::string& method, const std::string& path, const std::string& body = "") {
        TestRequest req(method, path, body);
        req.withIp("1.2.3.4").withHeader("User-Agent", "UA1").withHeader("Accept-Language", "en");
        return req;
    }

    static domain::SignInResult accepted(const std::string& userId) {
        domain::SignInResult r;
        r.success = true;
        r.userId = userId;
        return r;
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<InMemoryKeyValueStore> kv_;
    std::shared_ptr<TestSessionSettings> sessionSettings_;
    std::shared_ptr<TestGatewaySettings> gatewaySettings_;
    std::shared_ptr<adapters::secondary::KeyValueSessionStore> store_;
    std::shared_ptr<application::MetricsService> metrics_;
    std::shared_ptr<MockAuthProvider> provider_;
    std::shared_ptr<application::SessionValidator> validator_;
    std::shared_ptr<application::SessionLifecycleManager> lifecycle_;
    std::shared_ptr<SignInHandler> signInHandler_;
    std::shared_ptr<LogoutHandler> logoutHandler_;
};

// ============================================================================
// SIGN IN
// ============================================================================

TEST_F(AuthEndpointsTest, SignIn_Success_SetsCookieAndRedirects) {
    EXPECT_CALL(*provider_, signIn("john@test.com", "pass")).WillOnce(Return(accepted("42")));

    auto req = fromLaptop("POST", "/api/v1/auth/signin", R"({"email":"john@test.com","password":"pass"})");
    TestResponse res;
    signInHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 302);
    EXPECT_EQ(res.header("Location"), "/app/home");
    EXPECT_EQ(res.header("Set-Cookie"), "session_id=sess-1; Path=/; Max-Age=3600; HttpOnly; SameSite=Lax");

    auto result = validator_->validate("sess-1", adapters::primary::DeviceAttributesExtractor::fromRequest(req));
    EXPECT_EQ(result.outcome, domain::ValidationOutcome::Valid);
    EXPECT_EQ(result.userId, "42");
}

TEST_F(AuthEndpointsTest, SignIn_WrongPassword_401NoCookie) {
    EXPECT_CALL(*provider_, signIn(_, _)).WillOnce(Return(domain::SignInResult{}));

    auto req = fromLaptop("POST", "/api/v1/auth/signin", R"({"email":"john@test.com","password":"bad"})");
    TestResponse res;
    signInHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_FALSE(res.hasHeader("Set-Cookie"));
}

TEST_F(AuthEndpointsTest, SignIn_BadInput) {
    EXPECT_CALL(*provider_, signIn(_, _)).Times(0);

    auto invalidJson = fromLaptop("POST", "/api/v1/auth/signin", "not json");
    TestResponse r1;
    signInHandler_->handle(invalidJson, r1);
    EXPECT_EQ(r1.getStatus(), 400);

    auto missing = fromLaptop("POST", "/api/v1/auth/signin", R"({"email":"john@test.com"})");
    TestResponse r2;
    signInHandler_->handle(missing, r2);
    EXPECT_EQ(r2.getStatus(), 400);

    auto get = fromLaptop("GET", "/api/v1/auth/signin");
    TestResponse r3;
    signInHandler_->handle(get, r3);
    EXPECT_EQ(r3.getStatus(), 405);
}

// ============================================================================
// LOGOUT
// ============================================================================

TEST_F(AuthEndpointsTest, Logout_EndsSessionAndExpiresCookie) {
    auto id = lifecycle_->startSession("42", adapters::primary::DeviceAttributesExtractor::fromRequest(
        fromLaptop("GET", "/")));

    auto req = fromLaptop("POST", "/api/v1/auth/logout");
    req.withHeader("Cookie", "session_id=" + id);
    TestResponse res;
    logoutHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_NE(res.header("Set-Cookie").find("Max-Age=0"), std::string::npos);
    EXPECT_FALSE(store_->get(id).has_value());
}

TEST_F(AuthEndpointsTest, Logout_FromOtherDevice_KeepsSession) {
    auto id = lifecycle_->startSession("42", adapters::primary::DeviceAttributesExtractor::fromRequest(
        fromLaptop("GET", "/")));

    TestRequest req("POST", "/api/v1/auth/logout");
    req.withIp("9.9.9.9").withHeader("User-Agent", "curl").withHeader("Cookie", "session_id=" + id);
    TestResponse res;
    logoutHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(store_->get(id).has_value());
}

TEST_F(AuthEndpointsTest, Logout_StoreDown_503) {
    auto req = fromLaptop("POST", "/api/v1/auth/logout");
    req.withHeader("Cookie", "session_id=sess-1");
    kv_->setUnavailable(true);
    TestResponse res;

    logoutHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
}

TEST_F(AuthEndpointsTest, Logout_WithoutCookie_StillOk) {
    auto req = fromLaptop("POST", "/api/v1/auth/logout");
    TestResponse res;

    logoutHandler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["message"], "Logged out successfully");
}

TEST_F(AuthEndpointsTest, AuthRedirect_PointsToAuthUrl) {
    AuthRedirectHandler handler(gatewaySettings_);
    TestRequest req("GET", "/auth");
    TestResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 302);
    EXPECT_EQ(res.header("Location"), "/auth/signin");
}
