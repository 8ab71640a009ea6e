#pragma once

#include <string>

namespace gateway::domain {

/**
 * @brief Атрибуты устройства, извлечённые из HTTP запроса
 *
 * Отсутствующий заголовок - пустая строка, никогда не "нет значения".
 * forwardedFor хранится только для аудита и в fingerprint не входит.
 */
struct DeviceAttributes {
    std::string ip;
    std::string userAgent;
    std::string acceptLanguage;
    std::string forwardedFor;
};

} // namespace gateway::domain
