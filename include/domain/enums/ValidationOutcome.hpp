#pragma once

#include <string>

namespace gateway::domain {

/**
 * @brief Терминальное состояние проверки сессии
 */
enum class ValidationOutcome {
    Valid,
    Expired,
    FingerprintMismatch,
    NotFound,
    StoreError
};

/// Метка для метрик и логов
inline std::string toString(ValidationOutcome outcome) {
    switch (outcome) {
        case ValidationOutcome::Valid:               return "valid";
        case ValidationOutcome::Expired:             return "expired";
        case ValidationOutcome::FingerprintMismatch: return "fingerprint_mismatch";
        case ValidationOutcome::NotFound:            return "not_found";
        case ValidationOutcome::StoreError:          return "store_error";
    }
    return "store_error";
}

} // namespace gateway::domain
