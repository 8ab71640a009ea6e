#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISignInService.hpp"
#include "settings/ISessionSettings.hpp"
#include "settings/IGatewaySettings.hpp"
#include "adapters/primary/SessionCookie.hpp"
#include "adapters/primary/DeviceAttributesExtractor.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace gateway::adapters::primary {

/**
 * @brief POST /api/v1/auth/signin
 *
 * Request: {"email": "...", "password": "..."}
 * Success: 302 Location: post_login_url, Set-Cookie: session_id=...
 * Failure: 401 {"error": "Invalid credentials"}
 */
class SignInHandler : public IHttpHandler {
public:
    SignInHandler(
        std::shared_ptr<ports::input::ISignInService> signInService,
        std::shared_ptr<settings::ISessionSettings> sessionSettings,
        std::shared_ptr<settings::IGatewaySettings> gatewaySettings
    ) : signInService_(std::move(signInService))
      , sessionSettings_(std::move(sessionSettings))
      , gatewaySettings_(std::move(gatewaySettings))
    {}

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(req.getBody());
        } catch (const nlohmann::json::parse_error&) {
            sendError(res, 400, "Invalid JSON");
            return;
        }

        if (!body.is_object() || !body.contains("email") || !body.contains("password")
            || !body["email"].is_string() || !body["password"].is_string()) {
            sendError(res, 400, "Missing required fields: email, password");
            return;
        }

        auto outcome = signInService_->signIn(
            body["email"].get<std::string>(),
            body["password"].get<std::string>(),
            DeviceAttributesExtractor::fromRequest(req));

        if (!outcome.success) {
            sendError(res, 401, outcome.message);
            return;
        }

        nlohmann::json response;
        response["user_id"] = outcome.userId;
        response["message"] = "Signed in";

        res.setHeader("Set-Cookie", SessionCookie::issue(*sessionSettings_, outcome.sessionId));
        res.setHeader("Location", gatewaySettings_->getPostLoginUrl());
        res.setHeader("Cache-Control", "no-store");
        res.setResult(302, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ISignInService> signInService_;
    std::shared_ptr<settings::ISessionSettings> sessionSettings_;
    std::shared_ptr<settings::IGatewaySettings> gatewaySettings_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace gateway::adapters::primary
