#pragma once

#include <string>
#include <chrono>

namespace gateway::settings {

/**
 * @brief Настройки сессий и session cookie
 */
class ISessionSettings {
public:
    virtual ~ISessionSettings() = default;

    virtual std::chrono::seconds getSessionTtl() const = 0;
    virtual std::chrono::seconds getUserIdCacheTtl() const = 0;

    virtual std::string getCookieName() const = 0;
    virtual std::string getCookiePath() const = 0;
    virtual bool isCookieSecure() const = 0;
};

} // namespace gateway::settings
