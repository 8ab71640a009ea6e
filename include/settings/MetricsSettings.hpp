#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace gateway::settings {

/**
 * @brief Метрики session gateway
 *
 * gateway_validation_total по outcome позволяет отличить
 * "никто не залогинен" (not_found) от "хранилище лежит" (store_error).
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"gateway_validation_total", "Session validations by outcome", "counter"},
            {"gateway_store_errors_total", "Session store failures by operation", "counter"},
            {"gateway_sessions_created_total", "Sessions started", "counter"},
            {"gateway_sessions_ended_total", "Sessions ended by reason", "counter"},
            {"gateway_signin_total", "Sign-in attempts by result", "counter"},
            {"gateway_proxy_errors_total", "Failed forwards to the protected backend", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // ============================================
            // Проверка сессий
            // ============================================
            "gateway_validation_total{outcome=\"valid\"}",
            "gateway_validation_total{outcome=\"expired\"}",
            "gateway_validation_total{outcome=\"fingerprint_mismatch\"}",
            "gateway_validation_total{outcome=\"not_found\"}",
            "gateway_validation_total{outcome=\"store_error\"}",

            // ============================================
            // Хранилище
            // ============================================
            "gateway_store_errors_total{operation=\"get\"}",
            "gateway_store_errors_total{operation=\"delete\"}",
            "gateway_store_errors_total{operation=\"user_id_cache\"}",

            // ============================================
            // Жизненный цикл
            // ============================================
            "gateway_sessions_created_total",
            "gateway_sessions_ended_total{reason=\"logout\"}",
            "gateway_sessions_ended_total{reason=\"expired\"}",
            "gateway_sessions_ended_total{reason=\"invalidated\"}",

            "gateway_signin_total{result=\"success\"}",
            "gateway_signin_total{result=\"rejected\"}",
            "gateway_signin_total{result=\"error\"}",

            "gateway_proxy_errors_total"
        };
    }
};

} // namespace gateway::settings
