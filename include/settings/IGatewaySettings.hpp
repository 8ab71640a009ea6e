#pragma once

#include <string>

namespace gateway::settings {

/**
 * @brief Маршрутизация gateway: куда редиректить и куда проксировать
 */
class IGatewaySettings {
public:
    virtual ~IGatewaySettings() = default;

    /// Точка входа аутентификации (для всех исходов кроме Valid)
    virtual std::string getAuthUrl() const = 0;

    /// Куда отправить пользователя после успешного входа
    virtual std::string getPostLoginUrl() const = 0;

    /// Префикс защищённых путей, например "/app"
    virtual std::string getProtectedPrefix() const = 0;

    virtual std::string getBackendHost() const = 0;
    virtual int getBackendPort() const = 0;
};

} // namespace gateway::settings
