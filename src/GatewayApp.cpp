#include "GatewayApp.hpp"

#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/SessionSettings.hpp"
#include "settings/GatewaySettings.hpp"
#include "settings/StoreSettings.hpp"
#include "settings/AuthProviderSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Application
#include "application/SessionValidator.hpp"
#include "application/RoutingPolicy.hpp"
#include "application/SessionGatewayService.hpp"
#include "application/SessionLifecycleManager.hpp"
#include "application/SignInService.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/RedisKeyValueStore.hpp"
#include "adapters/secondary/LruKeyValueStore.hpp"
#include "adapters/secondary/KeyValueSessionStore.hpp"
#include "adapters/secondary/Sha256FingerprintGenerator.hpp"
#include "adapters/secondary/SecureSessionIdGenerator.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/HttpAuthProvider.hpp"
#include "adapters/secondary/PostgresDeviceAuditRepository.hpp"
#include "adapters/secondary/LoggingDeviceAuditRepository.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/SessionVerificationMiddleware.hpp"
#include "adapters/primary/BackendProxyHandler.hpp"
#include "adapters/primary/SignInHandler.hpp"
#include "adapters/primary/LogoutHandler.hpp"
#include "adapters/primary/AuthRedirectHandler.hpp"
#include "adapters/primary/SessionAdminHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"

#include <iostream>

namespace di = boost::di;

using namespace gateway;

GatewayApp::GatewayApp()
{
    std::cout << "[GatewayApp] Initializing..." << std::endl;
}

GatewayApp::~GatewayApp()
{
    std::cout << "[GatewayApp] Shutting down..." << std::endl;
}

void GatewayApp::loadEnvironment(int argc, char* argv[])
{
    BoostBeastApplication::loadEnvironment(argc, argv);
    std::cout << "[GatewayApp] Environment loaded" << std::endl;
}

void GatewayApp::configureInjection()
{
    std::cout << "[GatewayApp] Configuring DI..." << std::endl;

    // Шаг 1: адаптеры, выбираемые по конфигурации
    auto clock = std::make_shared<adapters::secondary::SystemClock>();

    auto storeSettings = std::make_shared<settings::StoreSettings>();
    std::shared_ptr<ports::output::IKeyValueStore> kvStore;
    if (storeSettings->useRedis()) {
        kvStore = std::make_shared<adapters::secondary::RedisKeyValueStore>(storeSettings);
    } else {
        std::cout << "[GatewayApp] WARNING: in-process session store, sessions are not shared between replicas" << std::endl;
        kvStore = std::make_shared<adapters::secondary::LruKeyValueStore>(storeSettings, clock);
    }

    auto dbSettings = std::make_shared<settings::DbSettings>();
    std::shared_ptr<ports::output::IDeviceAuditRepository> audit;
    if (dbSettings->isEnabled()) {
        audit = std::make_shared<adapters::secondary::PostgresDeviceAuditRepository>(dbSettings);
    } else {
        audit = std::make_shared<adapters::secondary::LoggingDeviceAuditRepository>();
    }

    // Шаг 2: основной injector
    auto injector = di::make_injector(
        di::bind<settings::ISessionSettings>().to<settings::SessionSettings>().in(di::singleton),
        di::bind<settings::IGatewaySettings>().to<settings::GatewaySettings>().in(di::singleton),
        di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),
        di::bind<settings::AuthProviderSettings>().in(di::singleton),

        di::bind<ports::output::IClock>().to(clock),
        di::bind<ports::output::IKeyValueStore>().to(kvStore),
        di::bind<ports::output::IDeviceAuditRepository>().to(audit),
        di::bind<ports::output::ISessionStore>().to<adapters::secondary::KeyValueSessionStore>().in(di::singleton),
        di::bind<ports::output::IFingerprintGenerator>().to<adapters::secondary::Sha256FingerprintGenerator>().in(di::singleton),
        di::bind<ports::output::ISessionIdGenerator>().to<adapters::secondary::SecureSessionIdGenerator>().in(di::singleton),

        di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
        di::bind<ports::output::IAuthProvider>().to<adapters::secondary::HttpAuthProvider>().in(di::singleton),

        di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),
        di::bind<application::RoutingPolicy>().in(di::singleton),
        di::bind<ports::input::ISessionValidator>().to<application::SessionValidator>().in(di::singleton),
        di::bind<ports::input::ISessionGatewayService>().to<application::SessionGatewayService>().in(di::singleton),
        di::bind<ports::input::ISessionLifecycleService>().to<application::SessionLifecycleManager>().in(di::singleton),
        di::bind<ports::input::ISignInService>().to<application::SignInService>().in(di::singleton));

    // Шаг 3: служебные endpoints
    handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
    handlers_[getHandlerKey("GET", "/metrics")] = injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>();

    // Шаг 4: вход и выход
    handlers_[getHandlerKey("GET", "/auth")] = injector.create<std::shared_ptr<adapters::primary::AuthRedirectHandler>>();
    handlers_[getHandlerKey("POST", "/api/v1/auth/signin")] = injector.create<std::shared_ptr<adapters::primary::SignInHandler>>();
    handlers_[getHandlerKey("POST", "/api/v1/auth/logout")] = injector.create<std::shared_ptr<adapters::primary::LogoutHandler>>();

    // Шаг 5: внутренний API жизненного цикла
    auto adminHandler = injector.create<std::shared_ptr<adapters::primary::SessionAdminHandler>>();
    handlers_[getHandlerKey("POST", "/internal/v1/sessions")] = adminHandler;
    handlers_[getHandlerKey("DELETE", "/internal/v1/sessions/*")] = adminHandler;
    handlers_[getHandlerKey("POST", "/internal/v1/users/sessions/invalidate")] = adminHandler;

    // Шаг 6: защищённый backend через проверку сессии
    auto verification = injector.create<std::shared_ptr<adapters::primary::SessionVerificationMiddleware>>();
    auto proxy = injector.create<std::shared_ptr<adapters::primary::BackendProxyHandler>>();
    auto protectedChain = std::make_shared<adapters::primary::ChainHandler>(verification, proxy);

    auto gatewaySettings = injector.create<std::shared_ptr<settings::IGatewaySettings>>();
    registerProtected(gatewaySettings->getProtectedPrefix(), protectedChain);

    std::cout << "[GatewayApp] Ready, protected prefix: " << gatewaySettings->getProtectedPrefix()
              << ", auth url: " << gatewaySettings->getAuthUrl()
              << ", store: " << storeSettings->getBackend() << std::endl;
}

void GatewayApp::registerProtected(const std::string& prefix, const std::shared_ptr<IHttpHandler>& handler)
{
    for (const char* method : {"GET", "POST", "PUT", "PATCH", "DELETE"}) {
        handlers_[getHandlerKey(method, prefix)] = handler;
        handlers_[getHandlerKey(method, prefix + "/*")] = handler;
    }
}
