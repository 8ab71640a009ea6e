#pragma once

#include <chrono>

namespace gateway::ports::output {

/**
 * @brief Источник времени (подменяется в тестах)
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
};

} // namespace gateway::ports::output
