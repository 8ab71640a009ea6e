#pragma once

#include "settings/EnvNumber.hpp"
#include "settings/ISessionSettings.hpp"
#include <cstdlib>
#include <string>
#include <stdexcept>

namespace gateway::settings {

/**
 * @brief Настройки сессий из ENV
 *
 * Читает из ENV:
 * - SESSION_TTL_SECONDS (default: 3600)
 * - USER_ID_CACHE_TTL_SECONDS (default: 900)
 * - SESSION_COOKIE_NAME (default: "session_id")
 * - SESSION_COOKIE_PATH (default: "/")
 * - COOKIE_SECURE (default: false)
 *
 * @throws std::invalid_argument если TTL не положительный
 */
class SessionSettings : public ISessionSettings {
public:
    SessionSettings() {
        if (const char* val = std::getenv("SESSION_TTL_SECONDS")) {
            sessionTtl_ = std::chrono::seconds(parseEnvLong("SESSION_TTL_SECONDS", val));
        }
        if (const char* val = std::getenv("USER_ID_CACHE_TTL_SECONDS")) {
            userIdCacheTtl_ = std::chrono::seconds(parseEnvLong("USER_ID_CACHE_TTL_SECONDS", val));
        }
        if (const char* val = std::getenv("SESSION_COOKIE_NAME")) {
            cookieName_ = val;
        }
        if (const char* val = std::getenv("SESSION_COOKIE_PATH")) {
            cookiePath_ = val;
        }
        if (const char* val = std::getenv("COOKIE_SECURE")) {
            std::string s(val);
            cookieSecure_ = (s == "1" || s == "true" || s == "yes");
        }

        if (sessionTtl_.count() <= 0) {
            throw std::invalid_argument("SESSION_TTL_SECONDS must be positive");
        }
        if (userIdCacheTtl_.count() <= 0) {
            throw std::invalid_argument("USER_ID_CACHE_TTL_SECONDS must be positive");
        }
        if (cookieName_.empty()) {
            throw std::invalid_argument("SESSION_COOKIE_NAME must not be empty");
        }
    }

    std::chrono::seconds getSessionTtl() const override { return sessionTtl_; }
    std::chrono::seconds getUserIdCacheTtl() const override { return userIdCacheTtl_; }
    std::string getCookieName() const override { return cookieName_; }
    std::string getCookiePath() const override { return cookiePath_; }
    bool isCookieSecure() const override { return cookieSecure_; }

private:
    std::chrono::seconds sessionTtl_{3600};
    std::chrono::seconds userIdCacheTtl_{900};
    std::string cookieName_ = "session_id";
    std::string cookiePath_ = "/";
    bool cookieSecure_ = false;
};

} // namespace gateway::settings
