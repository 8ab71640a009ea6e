#pragma once

#include <string>
#include <map>

namespace gateway::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Только counter метрики с опциональными labels, вывод в Prometheus формате.
 *
 * @example
 * ```cpp
 * metrics->increment("gateway_validation_total", {{"outcome", "valid"}});
 * std::string output = metrics->toPrometheusFormat();
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Увеличить счётчик на 1
     *
     * Ключ формируется как name{label1="value1",label2="value2"}.
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace gateway::ports::input
