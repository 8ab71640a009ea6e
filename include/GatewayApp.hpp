#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <memory>
#include <string>

/**
 * @class GatewayApp
 * @brief Session gateway: проверка сессий перед защищённым backend
 *
 * Template Method BoostBeastApplication:
 * 1. loadEnvironment() - config.json / аргументы (порт, потоки)
 * 2. configureInjection() - Boost.DI и регистрация handlers
 * 3. start() - HTTP сервер
 *
 * Хранилище сессий (Redis или память процесса) создаётся один раз
 * при старте и закрывается вместе с приложением.
 */
class GatewayApp : public BoostBeastApplication
{
public:
    GatewayApp();
    ~GatewayApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    void configureInjection() override;

private:
    /// Один и тот же handler на protectedPrefix и protectedPrefix/* для всех методов
    void registerProtected(const std::string& prefix, const std::shared_ptr<IHttpHandler>& handler);
};
