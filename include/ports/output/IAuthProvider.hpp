#pragma once

#include "domain/SignInResult.hpp"
#include <string>

namespace gateway::ports::output {

/**
 * @brief Внешний провайдер аутентификации
 *
 * Gateway не зависит от конкретного identity provider,
 * только от этого контракта.
 */
class IAuthProvider {
public:
    virtual ~IAuthProvider() = default;

    /**
     * @brief Проверить email и пароль
     * @return success=true и userId при успехе, иначе message с причиной
     */
    virtual domain::SignInResult signIn(const std::string& email, const std::string& password) = 0;
};

} // namespace gateway::ports::output
