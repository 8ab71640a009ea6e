#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gateway::settings {

/**
 * @brief Целое число из значения переменной окружения
 *
 * Строка должна целиком состоять из числа: "36x", "" и " 36" отклоняются.
 * @throws std::invalid_argument с именем переменной
 */
inline long parseEnvLong(const std::string& name, const std::string& value) {
    std::size_t pos = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be an integer, got: '" + value + "'");
    }
    if (pos != value.size() || value.empty() || value.front() == ' ' || value.front() == '\t') {
        throw std::invalid_argument(name + " must be an integer, got: '" + value + "'");
    }
    return parsed;
}

} // namespace gateway::settings
