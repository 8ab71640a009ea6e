#pragma once

#include "domain/DeviceAttributes.hpp"
#include <string>
#include <chrono>

namespace gateway::domain {

/**
 * @brief Сессия, привязанная к устройству
 *
 * Сессия действительна, пока now < expiresAt и fingerprint текущего
 * запроса совпадает с сохранённым. deviceInfo хранится только для аудита.
 */
struct Session {
    std::string sessionId;
    std::string userId;
    std::string fingerprint;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point expiresAt;
    DeviceAttributes deviceInfo;

    bool isExpiredAt(std::chrono::system_clock::time_point now) const {
        // Запись с expiresAt <= createdAt (сдвиг часов) считается истёкшей
        return now >= expiresAt || expiresAt <= createdAt;
    }
};

} // namespace gateway::domain
