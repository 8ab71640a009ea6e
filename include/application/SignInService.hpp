#pragma once

#include "ports/input/ISignInService.hpp"
#include "ports/input/ISessionLifecycleService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IAuthProvider.hpp"

#include <memory>
#include <iostream>

namespace gateway::application {

/**
 * @brief Вход: провайдер аутентификации, затем новая сессия для устройства
 */
class SignInService : public ports::input::ISignInService {
public:
    SignInService(
        std::shared_ptr<ports::output::IAuthProvider> authProvider,
        std::shared_ptr<ports::input::ISessionLifecycleService> lifecycle,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : authProvider_(std::move(authProvider))
      , lifecycle_(std::move(lifecycle))
      , metrics_(std::move(metrics))
    {
        std::cout << "[SignInService] Created" << std::endl;
    }

    domain::SignInOutcome signIn(const std::string& email,
                                 const std::string& password,
                                 const domain::DeviceAttributes& attrs) override
    {
        domain::SignInOutcome outcome;

        if (email.empty() || password.empty()) {
            outcome.message = "Email and password are required";
            metrics_->increment("gateway_signin_total", {{"result", "rejected"}});
            return outcome;
        }

        domain::SignInResult auth = authProvider_->signIn(email, password);
        if (!auth.success) {
            std::cout << "[SignInService] Sign-in rejected: " << auth.message << std::endl;
            outcome.message = "Invalid credentials";
            metrics_->increment("gateway_signin_total", {{"result", "rejected"}});
            return outcome;
        }

        try {
            outcome.sessionId = lifecycle_->startSession(auth.userId, attrs);
        } catch (const std::exception& e) {
            std::cerr << "[SignInService] Failed to start session for user " << auth.userId
                      << ": " << e.what() << std::endl;
            outcome.message = "Session could not be created";
            metrics_->increment("gateway_signin_total", {{"result", "error"}});
            return outcome;
        }

        outcome.success = true;
        outcome.userId = auth.userId;
        metrics_->increment("gateway_signin_total", {{"result", "success"}});
        return outcome;
    }

private:
    std::shared_ptr<ports::output::IAuthProvider> authProvider_;
    std::shared_ptr<ports::input::ISessionLifecycleService> lifecycle_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace gateway::application
