#pragma once

#include "domain/DeviceAttributes.hpp"
#include <string>

namespace gateway::ports::output {

/**
 * @brief Генератор отпечатка устройства
 *
 * digest = Hash(ip + "|" + user_agent + "|" + accept_language)
 *
 * Чистая функция: одинаковые атрибуты всегда дают одинаковый digest.
 * Ошибок нет, пустые атрибуты участвуют как пустые строки.
 */
class IFingerprintGenerator {
public:
    virtual ~IFingerprintGenerator() = default;

    virtual std::string fingerprint(const domain::DeviceAttributes& attrs) const = 0;
};

} // namespace gateway::ports::output
