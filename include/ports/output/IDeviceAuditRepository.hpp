#pragma once

#include "domain/Session.hpp"
#include <string>

namespace gateway::ports::output {

/**
 * @brief Журнал устройств, с которых открывались сессии
 *
 * Реализации не выбрасывают исключений: аудит не должен
 * ломать вход или выход пользователя.
 */
class IDeviceAuditRepository {
public:
    virtual ~IDeviceAuditRepository() = default;

    virtual void recordSessionStart(const domain::Session& session) = 0;

    /// reason: "logout" | "invalidated"
    virtual void recordSessionEnd(const std::string& sessionId, const std::string& reason) = 0;
};

} // namespace gateway::ports::output
