#pragma once

#include <string>
#include <vector>

namespace gateway::settings {

/**
 * @brief Определение метрики для Prometheus (HELP и TYPE)
 */
struct MetricDefinition {
    std::string name;
    std::string help;
    std::string type;   ///< "counter", "gauge", "histogram"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * @note Все ключи метрик перечисляются заранее в getAllKeys():
 *       только они попадают в вывод /metrics.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /// Ключи в формате "metric_name{label=\"value\"}"
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace gateway::settings
