#pragma once

#include <IRequest.hpp>
#include "domain/DeviceAttributes.hpp"
#include <string>

namespace gateway::adapters::primary {

/**
 * @brief Атрибуты устройства из HTTP запроса
 *
 * IP клиента - первый адрес из X-Forwarded-For, иначе адрес сокета.
 * Извлечение детерминировано: при создании сессии и при проверке
 * используется один и тот же код.
 */
class DeviceAttributesExtractor {
public:
    static domain::DeviceAttributes fromRequest(const IRequest& req) {
        domain::DeviceAttributes attrs;
        attrs.userAgent = req.getHeader("User-Agent").value_or("");
        attrs.acceptLanguage = req.getHeader("Accept-Language").value_or("");
        attrs.forwardedFor = req.getHeader("X-Forwarded-For").value_or("");

        std::string firstHop = trim(attrs.forwardedFor.substr(0, attrs.forwardedFor.find(',')));
        attrs.ip = firstHop.empty() ? req.getIp() : firstHop;
        return attrs;
    }

private:
    static std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            return "";
        }
        auto end = s.find_last_not_of(" \t");
        return s.substr(begin, end - begin + 1);
    }
};

} // namespace gateway::adapters::primary
