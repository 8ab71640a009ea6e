#pragma once

#include <stdexcept>
#include <string>

namespace gateway::domain {

/**
 * @brief Сгенерированный session_id уже занят в хранилище
 */
class SessionIdCollisionException : public std::runtime_error {
public:
    explicit SessionIdCollisionException(const std::string& message)
        : std::runtime_error("Session id collision: " + message) {}
};

} // namespace gateway::domain
