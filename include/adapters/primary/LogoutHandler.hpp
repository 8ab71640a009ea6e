#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionValidator.hpp"
#include "ports/input/ISessionLifecycleService.hpp"
#include "settings/ISessionSettings.hpp"
#include "adapters/primary/SessionCookie.hpp"
#include "adapters/primary/DeviceAttributesExtractor.hpp"
#include "domain/exceptions/StoreUnavailableException.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace gateway::adapters::primary {

/**
 * @brief POST /api/v1/auth/logout
 *
 * Сессия удаляется только если запрос прошёл проверку (тот же fingerprint):
 * чужой cookie не даёт права закрыть чужую сессию.
 * Cookie у клиента сбрасывается в любом случае.
 */
class LogoutHandler : public IHttpHandler {
public:
    LogoutHandler(
        std::shared_ptr<ports::input::ISessionValidator> validator,
        std::shared_ptr<ports::input::ISessionLifecycleService> lifecycle,
        std::shared_ptr<settings::ISessionSettings> sessionSettings
    ) : validator_(std::move(validator))
      , lifecycle_(std::move(lifecycle))
      , sessionSettings_(std::move(sessionSettings))
    {}

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        std::string token = SessionCookie::read(req, sessionSettings_->getCookieName());
        auto result = validator_->validate(token, DeviceAttributesExtractor::fromRequest(req));

        if (result.outcome == domain::ValidationOutcome::StoreError) {
            sendError(res, 503, "Service temporarily unavailable");
            return;
        }

        if (result.isValid()) {
            try {
                lifecycle_->endSession(result.sessionId);
            } catch (const domain::StoreUnavailableException& e) {
                std::cerr << "[LogoutHandler] " << e.what() << std::endl;
                sendError(res, 503, "Service temporarily unavailable");
                return;
            }
        }

        nlohmann::json response;
        response["message"] = "Logged out successfully";
        res.setHeader("Set-Cookie", SessionCookie::expire(*sessionSettings_));
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ISessionValidator> validator_;
    std::shared_ptr<ports::input::ISessionLifecycleService> lifecycle_;
    std::shared_ptr<settings::ISessionSettings> sessionSettings_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace gateway::adapters::primary
