#pragma once

#include "ports/input/ISessionGatewayService.hpp"
#include "ports/input/ISessionValidator.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ISessionStore.hpp"
#include "application/RoutingPolicy.hpp"
#include "domain/SessionToken.hpp"
#include "domain/exceptions/StoreUnavailableException.hpp"

#include <memory>
#include <iostream>

namespace gateway::application {

/**
 * @brief Путь проверки каждого запроса к защищённому backend
 *
 * validator -> metrics -> policy -> (Expired: удалить сессию) -> решение.
 * Очистка выполняется только тем запросом, который увидел истечение.
 */
class SessionGatewayService : public ports::input::ISessionGatewayService {
public:
    SessionGatewayService(
        std::shared_ptr<ports::input::ISessionValidator> validator,
        std::shared_ptr<RoutingPolicy> policy,
        std::shared_ptr<ports::output::ISessionStore> store,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : validator_(std::move(validator))
      , policy_(std::move(policy))
      , store_(std::move(store))
      , metrics_(std::move(metrics))
    {
        std::cout << "[SessionGatewayService] Created" << std::endl;
    }

    domain::RoutingDecision verify(const std::string& sessionToken,
                                   const domain::DeviceAttributes& attrs) override
    {
        domain::ValidationResult result = validator_->validate(sessionToken, attrs);
        metrics_->increment("gateway_validation_total", {{"outcome", domain::toString(result.outcome)}});

        domain::RoutingDecision decision = policy_->decide(result);

        if (decision.action == domain::RoutingAction::ClearAndRedirect) {
            purgeExpired(decision.sessionId);
        }

        if (result.outcome == domain::ValidationOutcome::StoreError) {
            std::cerr << "[SessionGatewayService] Fail closed: " << result.detail << std::endl;
        }

        return decision;
    }

private:
    std::shared_ptr<ports::input::ISessionValidator> validator_;
    std::shared_ptr<RoutingPolicy> policy_;
    std::shared_ptr<ports::output::ISessionStore> store_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    void purgeExpired(const std::string& sessionId) {
        try {
            if (!store_->remove(sessionId)) {
                return; // уже удалена параллельным запросом
            }
            metrics_->increment("gateway_sessions_ended_total", {{"reason", "expired"}});
            std::cout << "[SessionGatewayService] Expired session removed: "
                      << domain::maskSessionId(sessionId) << std::endl;
        } catch (const domain::StoreUnavailableException& e) {
            // Редирект всё равно отдаём: ключ истечёт по TTL
            metrics_->increment("gateway_store_errors_total", {{"operation", "delete"}});
            std::cerr << "[SessionGatewayService] Failed to remove expired session: " << e.what() << std::endl;
        }
    }
};

} // namespace gateway::application
