#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace gateway::adapters {

/**
 * @brief user_id из JSON: непустая строка или целое число
 *
 * null, bool, дробные числа, объекты и массивы -> nullopt.
 */
inline std::optional<std::string> userIdFromJson(const nlohmann::json& value) {
    if (value.is_string()) {
        auto id = value.get<std::string>();
        if (id.empty()) {
            return std::nullopt;
        }
        return id;
    }
    if (value.is_number_integer()) {
        return value.dump();
    }
    return std::nullopt;
}

} // namespace gateway::adapters
