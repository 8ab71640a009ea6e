#pragma once

#include "domain/DeviceAttributes.hpp"
#include <string>
#include <cstddef>

namespace gateway::ports::input {

/**
 * @brief Управление жизненным циклом сессий
 *
 * Вызывается только коллаборатором аутентификации,
 * не на пути проверки запросов.
 */
class ISessionLifecycleService {
public:
    virtual ~ISessionLifecycleService() = default;

    /**
     * @brief Открыть новую сессию
     *
     * Каждый вызов создаёт независимую сессию, даже для того же пользователя.
     *
     * @return session_id
     * @throws domain::StoreUnavailableException
     */
    virtual std::string startSession(const std::string& userId,
                                     const domain::DeviceAttributes& attrs) = 0;

    /// Закрыть сессию (logout). Идемпотентно.
    virtual void endSession(const std::string& sessionId) = 0;

    /**
     * @brief Закрыть все сессии пользователя (например, после сброса пароля)
     * @return Количество удалённых session_id
     */
    virtual std::size_t invalidateAllForUser(const std::string& userId) = 0;
};

} // namespace gateway::ports::input
