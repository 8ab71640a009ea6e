#pragma once

#include "settings/EnvNumber.hpp"
#include <string>
#include <cstdlib>

namespace gateway::settings {

/**
 * @brief Настройки подключения к провайдеру аутентификации
 *
 * Читает из ENV:
 * - AUTH_PROVIDER_HOST (default: "identity-service")
 * - AUTH_PROVIDER_PORT (default: 8080)
 * - AUTH_PROVIDER_SIGNIN_PATH (default: "/api/v1/auth/signin")
 */
class AuthProviderSettings {
public:
    AuthProviderSettings() {
        if (const char* host = std::getenv("AUTH_PROVIDER_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("AUTH_PROVIDER_PORT")) {
            port_ = static_cast<int>(parseEnvLong("AUTH_PROVIDER_PORT", port));
        }
        if (const char* path = std::getenv("AUTH_PROVIDER_SIGNIN_PATH")) {
            signInPath_ = path;
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getSignInPath() const { return signInPath_; }

private:
    std::string host_ = "identity-service";
    int port_ = 8080;
    std::string signInPath_ = "/api/v1/auth/signin";
};

} // namespace gateway::settings
