#pragma once

#include "domain/DeviceAttributes.hpp"
#include "domain/SignInResult.hpp"
#include <string>

namespace gateway::ports::input {

class ISignInService {
public:
    virtual ~ISignInService() = default;

    /**
     * @brief Аутентифицировать пользователя и открыть сессию для устройства
     */
    virtual domain::SignInOutcome signIn(const std::string& email,
                                         const std::string& password,
                                         const domain::DeviceAttributes& attrs) = 0;
};

} // namespace gateway::ports::input
