#pragma once

#include <string>

namespace gateway::domain {

constexpr size_t kMaxSessionTokenLength = 256;

/**
 * @brief Токен похож на session_id: [A-Za-z0-9_-], не длиннее 256 символов
 *
 * Всё остальное в хранилище не ищем.
 */
inline bool isWellFormedSessionToken(const std::string& token) {
    if (token.empty() || token.size() > kMaxSessionTokenLength) {
        return false;
    }
    for (char c : token) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                  || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

/// Для логов: session_id целиком не пишем
inline std::string maskSessionId(const std::string& sessionId) {
    if (sessionId.size() <= 8) {
        return "***";
    }
    return sessionId.substr(0, 8) + "...";
}

} // namespace gateway::domain
