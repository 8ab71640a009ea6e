#pragma once

#include <string>

namespace gateway::domain {

/**
 * @brief Ответ провайдера аутентификации
 */
struct SignInResult {
    bool success = false;
    std::string userId;
    std::string message;
};

/**
 * @brief Результат входа: аутентификация + созданная сессия
 */
struct SignInOutcome {
    bool success = false;
    std::string userId;
    std::string sessionId;
    std::string message;
};

} // namespace gateway::domain
