#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <iostream>

namespace gateway::application {

/**
 * @brief Счётчики в памяти, вывод в Prometheus text format
 *
 * Известные ключи создаются при старте нулями.
 * Инкремент существующего ключа идёт под shared_lock, новый ключ - под unique_lock.
 * В вывод попадают только ключи из IMetricsSettings::getAllKeys().
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_.emplace(key, std::make_unique<Counter>(0));
        }
        std::cout << "[MetricsService] " << counters_.size() << " counters registered" << std::endl;
    }

    void increment(const std::string& name,
                   const std::map<std::string, std::string>& labels = {}) override
    {
        const std::string key = seriesKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> read(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> write(mutex_);
        auto [it, inserted] = counters_.try_emplace(key, nullptr);
        if (inserted) {
            it->second = std::make_unique<Counter>(1);
        } else {
            it->second->fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream out;

        for (const auto& def : settings_->getDefinitions()) {
            out << "# HELP " << def.name << " " << def.help << "\n"
                << "# TYPE " << def.name << " " << def.type << "\n";
        }

        std::shared_lock<std::shared_mutex> read(mutex_);
        for (const auto& key : settings_->getAllKeys()) {
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                out << key << " " << it->second->load(std::memory_order_relaxed) << "\n";
            }
        }
        return out.str();
    }

    /// Текущее значение (для тестов и health)
    int64_t value(const std::string& key) const {
        std::shared_lock<std::shared_mutex> read(mutex_);
        auto it = counters_.find(key);
        return it == counters_.end() ? 0 : it->second->load(std::memory_order_relaxed);
    }

private:
    using Counter = std::atomic<int64_t>;

    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Counter>> counters_;

    static std::string seriesKey(const std::string& name,
                                 const std::map<std::string, std::string>& labels)
    {
        if (labels.empty()) {
            return name;
        }

        std::string key = name + "{";
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            if (it != labels.begin()) {
                key += ",";
            }
            key += it->first + "=\"" + it->second + "\"";
        }
        return key + "}";
    }
};

} // namespace gateway::application
