#pragma once

#include <string>

namespace gateway::ports::output {

/**
 * @brief Генератор непредсказуемых session_id (не менее 128 бит энтропии)
 */
class ISessionIdGenerator {
public:
    virtual ~ISessionIdGenerator() = default;

    virtual std::string generate() = 0;
};

} // namespace gateway::ports::output
