#pragma once

#include "domain/ValidationResult.hpp"
#include "domain/RoutingDecision.hpp"
#include "settings/IGatewaySettings.hpp"
#include <memory>

namespace gateway::application {

/**
 * @brief Исход проверки -> действие
 *
 * Valid               -> Forward с user_id
 * NotFound, FingerprintMismatch, StoreError -> RedirectToAuth, cookie не трогаем
 * Expired             -> ClearAndRedirect (сессию удаляет вызывающий)
 *
 * Для клиента все отказы выглядят одинаково.
 */
class RoutingPolicy {
public:
    explicit RoutingPolicy(std::shared_ptr<settings::IGatewaySettings> settings)
        : settings_(std::move(settings)) {}

    domain::RoutingDecision decide(const domain::ValidationResult& result) const {
        domain::RoutingDecision decision;

        switch (result.outcome) {
            case domain::ValidationOutcome::Valid:
                decision.action = domain::RoutingAction::Forward;
                decision.userId = result.userId;
                decision.sessionId = result.sessionId;
                return decision;

            case domain::ValidationOutcome::Expired:
                decision.action = domain::RoutingAction::ClearAndRedirect;
                decision.sessionId = result.sessionId;
                break;

            case domain::ValidationOutcome::NotFound:
            case domain::ValidationOutcome::FingerprintMismatch:
            case domain::ValidationOutcome::StoreError:
                decision.action = domain::RoutingAction::RedirectToAuth;
                break;
        }

        decision.redirectUrl = settings_->getAuthUrl();
        return decision;
    }

private:
    std::shared_ptr<settings::IGatewaySettings> settings_;
};

} // namespace gateway::application
