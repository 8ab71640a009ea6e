#pragma once

#include <stdexcept>
#include <string>

namespace gateway::domain {

/**
 * @brief Хранилище сессий недоступно
 *
 * Выбрасывается при сетевой ошибке, таймауте команды
 * или исчерпании пула соединений.
 */
class StoreUnavailableException : public std::runtime_error {
public:
    explicit StoreUnavailableException(const std::string& message)
        : std::runtime_error("Session store unavailable: " + message) {}
};

} // namespace gateway::domain
