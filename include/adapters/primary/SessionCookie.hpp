#pragma once

#include <IRequest.hpp>
#include "settings/ISessionSettings.hpp"
#include <string>
#include <optional>

namespace gateway::adapters::primary {

/**
 * @brief Чтение и запись session cookie
 *
 * Set-Cookie: session_id=<id>; Path=/; Max-Age=<ttl>; HttpOnly; SameSite=Lax[; Secure]
 */
class SessionCookie {
public:
    /**
     * @brief Значение cookie с именем name из заголовка Cookie
     *
     * Несколько cookie с одним именем и разными значениями -
     * неоднозначно, возвращаем пустую строку.
     */
    static std::string read(const IRequest& req, const std::string& name) {
        std::string header = req.getHeader("Cookie").value_or("");
        std::optional<std::string> found;

        size_t pos = 0;
        while (pos < header.size()) {
            size_t end = header.find(';', pos);
            if (end == std::string::npos) {
                end = header.size();
            }

            std::string pair = trim(header.substr(pos, end - pos));
            size_t eq = pair.find('=');
            if (eq != std::string::npos && trim(pair.substr(0, eq)) == name) {
                std::string value = unquote(trim(pair.substr(eq + 1)));
                if (found && *found != value) {
                    return "";
                }
                found = value;
            }
            pos = end + 1;
        }
        return found.value_or("");
    }

    static std::string issue(const settings::ISessionSettings& settings, const std::string& sessionId) {
        return settings.getCookieName() + "=" + sessionId +
               "; Path=" + settings.getCookiePath() +
               "; Max-Age=" + std::to_string(settings.getSessionTtl().count()) +
               attributes(settings);
    }

    static std::string expire(const settings::ISessionSettings& settings) {
        return settings.getCookieName() + "=" +
               "; Path=" + settings.getCookiePath() +
               "; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT" +
               attributes(settings);
    }

private:
    static std::string attributes(const settings::ISessionSettings& settings) {
        std::string attrs = "; HttpOnly; SameSite=Lax";
        if (settings.isCookieSecure()) {
            attrs += "; Secure";
        }
        return attrs;
    }

    static std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            return "";
        }
        auto end = s.find_last_not_of(" \t");
        return s.substr(begin, end - begin + 1);
    }

    static std::string unquote(const std::string& s) {
        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }
};

} // namespace gateway::adapters::primary
