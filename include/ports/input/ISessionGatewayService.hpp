#pragma once

#include "domain/DeviceAttributes.hpp"
#include "domain/RoutingDecision.hpp"
#include <string>

namespace gateway::ports::input {

/**
 * @brief Решение по входящему запросу на защищённый путь
 *
 * Проверяет сессию, выполняет очистку истёкшей сессии
 * и возвращает действие для HTTP слоя.
 */
class ISessionGatewayService {
public:
    virtual ~ISessionGatewayService() = default;

    virtual domain::RoutingDecision verify(const std::string& sessionToken,
                                           const domain::DeviceAttributes& attrs) = 0;
};

} // namespace gateway::ports::input
