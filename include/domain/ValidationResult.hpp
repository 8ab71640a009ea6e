#pragma once

#include "domain/enums/ValidationOutcome.hpp"
#include <string>

namespace gateway::domain {

/**
 * @brief Результат проверки сессии
 *
 * userId заполнен только для Valid.
 * detail - причина для логов, клиенту не отдаётся.
 */
struct ValidationResult {
    ValidationOutcome outcome = ValidationOutcome::NotFound;
    std::string sessionId;
    std::string userId;
    std::string detail;

    bool isValid() const { return outcome == ValidationOutcome::Valid; }
};

} // namespace gateway::domain
