#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionGatewayService.hpp"
#include "settings/ISessionSettings.hpp"
#include "settings/IGatewaySettings.hpp"
#include "adapters/primary/SessionCookie.hpp"
#include "adapters/primary/DeviceAttributesExtractor.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace gateway::adapters::primary
{

    /**
     * @brief Middleware проверки сессии на защищённых путях
     *
     * Forward          -> attribute "userId", статус 0 (цепочка продолжается)
     * RedirectToAuth   -> 302 Location: auth_url, cookie не трогаем
     * ClearAndRedirect -> 302 Location: auth_url + Set-Cookie с истёкшим сроком
     *
     * Все отказы выглядят для клиента одинаково.
     */
    class SessionVerificationMiddleware : public IHttpHandler
    {
    public:
        SessionVerificationMiddleware(
            std::shared_ptr<ports::input::ISessionGatewayService> gatewayService,
            std::shared_ptr<settings::ISessionSettings> sessionSettings,
            std::shared_ptr<settings::IGatewaySettings> gatewaySettings)
            : gatewayService_(std::move(gatewayService))
            , sessionSettings_(std::move(sessionSettings))
            , gatewaySettings_(std::move(gatewaySettings))
        {
            std::cout << "[SessionVerificationMiddleware] Created, cookie="
                      << sessionSettings_->getCookieName() << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string token = SessionCookie::read(req, sessionSettings_->getCookieName());
            domain::DeviceAttributes attrs = DeviceAttributesExtractor::fromRequest(req);

            domain::RoutingDecision decision;
            try
            {
                decision = gatewayService_->verify(token, attrs);
            }
            catch (const std::exception &e)
            {
                // fail closed
                std::cerr << "[SessionVerificationMiddleware] verify() failed: " << e.what() << std::endl;
                decision.action = domain::RoutingAction::RedirectToAuth;
                decision.redirectUrl = gatewaySettings_->getAuthUrl();
            }

            switch (decision.action)
            {
            case domain::RoutingAction::Forward:
                req.setAttribute("userId", decision.userId);
                res.setStatus(0); // для middleware
                return;

            case domain::RoutingAction::ClearAndRedirect:
                res.setHeader("Set-Cookie", SessionCookie::expire(*sessionSettings_));
                redirect(res, decision.redirectUrl);
                return;

            case domain::RoutingAction::RedirectToAuth:
                redirect(res, decision.redirectUrl);
                return;
            }
        }

    private:
        std::shared_ptr<ports::input::ISessionGatewayService> gatewayService_;
        std::shared_ptr<settings::ISessionSettings> sessionSettings_;
        std::shared_ptr<settings::IGatewaySettings> gatewaySettings_;

        void redirect(IResponse &res, const std::string &location)
        {
            nlohmann::json body;
            body["error"] = "Authentication required";
            res.setHeader("Location", location);
            res.setHeader("Cache-Control", "no-store");
            res.setResult(302, "application/json", body.dump());
        }
    };

} // namespace gateway::adapters::primary
