#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/output/ISessionStore.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace gateway::adapters::primary {

/**
 * @brief GET /health - доступность хранилища сессий
 *
 * 200 {"status": "ok", "store": "up"} или 503 {"status": "degraded", "store": "down"}
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::ISessionStore> store)
        : store_(std::move(store)) {}

    void handle(IRequest& req, IResponse& res) override {
        bool up = false;
        try {
            up = store_->isReachable();
        } catch (const std::exception&) {
            up = false;
        }

        nlohmann::json response;
        response["status"] = up ? "ok" : "degraded";
        response["store"] = up ? "up" : "down";
        response["service"] = "session-gateway";

        res.setResult(up ? 200 : 503, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::output::ISessionStore> store_;
};

} // namespace gateway::adapters::primary
