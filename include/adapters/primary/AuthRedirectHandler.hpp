#pragma once

#include <IHttpHandler.hpp>
#include "settings/IGatewaySettings.hpp"
#include <memory>

namespace gateway::adapters::primary {

/// GET /auth -> 302 на точку входа аутентификации
class AuthRedirectHandler : public IHttpHandler {
public:
    explicit AuthRedirectHandler(std::shared_ptr<settings::IGatewaySettings> settings)
        : settings_(std::move(settings)) {}

    void handle(IRequest& req, IResponse& res) override {
        res.setHeader("Location", settings_->getAuthUrl());
        res.setResult(302, "text/plain", "");
    }

private:
    std::shared_ptr<settings::IGatewaySettings> settings_;
};

} // namespace gateway::adapters::primary
