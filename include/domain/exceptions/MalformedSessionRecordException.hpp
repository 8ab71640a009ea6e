#pragma once

#include <stdexcept>
#include <string>

namespace gateway::domain {

/**
 * @brief Запись сессии в хранилище не удалось разобрать
 */
class MalformedSessionRecordException : public std::runtime_error {
public:
    explicit MalformedSessionRecordException(const std::string& message)
        : std::runtime_error("Malformed session record: " + message) {}
};

} // namespace gateway::domain
