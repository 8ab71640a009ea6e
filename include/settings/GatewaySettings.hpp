#pragma once

#include "settings/EnvNumber.hpp"
#include "settings/IGatewaySettings.hpp"
#include <cstdlib>
#include <string>
#include <stdexcept>

namespace gateway::settings {

/**
 * @brief Настройки gateway из ENV
 *
 * Читает из ENV:
 * - AUTH_URL (default: "/auth/signin")
 * - POST_LOGIN_URL (default: PROTECTED_PREFIX)
 * - PROTECTED_PREFIX (default: "/app")
 * - BACKEND_HOST (default: "backend")
 * - BACKEND_PORT (default: 8080)
 */
class GatewaySettings : public IGatewaySettings {
public:
    GatewaySettings() {
        if (const char* val = std::getenv("AUTH_URL")) {
            authUrl_ = val;
        }
        if (const char* val = std::getenv("PROTECTED_PREFIX")) {
            protectedPrefix_ = val;
        }
        if (const char* val = std::getenv("POST_LOGIN_URL")) {
            postLoginUrl_ = val;
        } else {
            postLoginUrl_ = protectedPrefix_;
        }
        if (const char* val = std::getenv("BACKEND_HOST")) {
            backendHost_ = val;
        }
        if (const char* val = std::getenv("BACKEND_PORT")) {
            backendPort_ = static_cast<int>(parseEnvLong("BACKEND_PORT", val));
        }

        if (authUrl_.empty()) {
            throw std::invalid_argument("AUTH_URL must not be empty");
        }
        if (protectedPrefix_.empty() || protectedPrefix_.front() != '/') {
            throw std::invalid_argument("PROTECTED_PREFIX must start with '/'");
        }
    }

    std::string getAuthUrl() const override { return authUrl_; }
    std::string getPostLoginUrl() const override { return postLoginUrl_; }
    std::string getProtectedPrefix() const override { return protectedPrefix_; }
    std::string getBackendHost() const override { return backendHost_; }
    int getBackendPort() const override { return backendPort_; }

private:
    std::string authUrl_ = "/auth/signin";
    std::string postLoginUrl_;
    std::string protectedPrefix_ = "/app";
    std::string backendHost_ = "backend";
    int backendPort_ = 8080;
};

} // namespace gateway::settings
