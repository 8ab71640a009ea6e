#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/SessionAdminHandler.hpp"
#include "mocks/TestHttp.hpp"
#include "mocks/TestSettings.hpp"

#include <nlohmann/json.hpp>

using namespace gateway;
using namespace gateway::adapters::primary;
using namespace gateway::tests::mocks;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

class MockLifecycleService : public ports::input::ISessionLifecycleService {
public:
    MOCK_METHOD(std::string, startSession, (const std::string& userId, const domain::DeviceAttributes& attrs), (override));
    MOCK_METHOD(void, endSession, (const std::string& sessionId), (override));
    MOCK_METHOD(std::size_t, invalidateAllForUser, (const std::string& userId), (override));
};

class SessionAdminHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        lifecycle_ = std::make_shared<MockLifecycleService>();
        handler_ = std::make_shared<SessionAdminHandler>(lifecycle_, std::make_shared<TestSessionSettings>());
    }

    std::shared_ptr<MockLifecycleService> lifecycle_;
    std::shared_ptr<SessionAdminHandler> handler_;
};

TEST_F(SessionAdminHandlerTest, CreateSession_201) {
    EXPECT_CALL(*lifecycle_, startSession("42", ::testing::AllOf(
            Field(&domain::DeviceAttributes::ip, "1.2.3.4"),
            Field(&domain::DeviceAttributes::userAgent, "UA1"))))
        .WillOnce(Return("sess-1"));

    TestRequest req("POST", "/internal/v1/sessions",
                    R"({"user_id": 42, "device": {"ip": "1.2.3.4", "user_agent": "UA1", "accept_language": "en"}})");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    auto body = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(body["session_id"], "sess-1");
    EXPECT_EQ(body["expires_in"], 3600);
}

TEST_F(SessionAdminHandlerTest, CreateSession_MissingUser_400) {
    EXPECT_CALL(*lifecycle_, startSession(_, _)).Times(0);

    TestRequest req("POST", "/internal/v1/sessions", R"({"device": {}})");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(SessionAdminHandlerTest, CreateSession_StoreDown_503) {
    EXPECT_CALL(*lifecycle_, startSession(_, _))
        .WillOnce(Throw(domain::StoreUnavailableException("down")));

    TestRequest req("POST", "/internal/v1/sessions", R"({"user_id": "42"})");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 503);
}

TEST_F(SessionAdminHandlerTest, DeleteSession_200) {
    EXPECT_CALL(*lifecycle_, endSession("sess-1"));

    TestRequest req("DELETE", "/internal/v1/sessions/sess-1");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
}

TEST_F(SessionAdminHandlerTest, InvalidateAll_ReturnsCount) {
    EXPECT_CALL(*lifecycle_, invalidateAllForUser("42")).WillOnce(Return(3));

    TestRequest req("POST", "/internal/v1/users/sessions/invalidate", R"({"user_id": "42"})");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(nlohmann::json::parse(res.getBody())["invalidated"], 3);
}

TEST_F(SessionAdminHandlerTest, UnknownRoute_404) {
    TestRequest req("GET", "/internal/v1/sessions");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(SessionAdminHandlerTest, CreateSession_NullUserId_400) {
    EXPECT_CALL(*lifecycle_, startSession(_, _)).Times(0);

    TestRequest req("POST", "/internal/v1/sessions", R"({"user_id": null})");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(SessionAdminHandlerTest, CreateSession_ObjectUserId_400) {
    EXPECT_CALL(*lifecycle_, startSession(_, _)).Times(0);

    TestRequest req("POST", "/internal/v1/sessions", R"({"user_id": {"id": 42}})");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(SessionAdminHandlerTest, InvalidateAll_BoolUserId_400) {
    EXPECT_CALL(*lifecycle_, invalidateAllForUser(_)).Times(0);

    TestRequest req("POST", "/internal/v1/users/sessions/invalidate", R"({"user_id": true})");
    TestResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}
