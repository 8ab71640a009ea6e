#pragma once

#include "ports/output/IAuthProvider.hpp"
#include "settings/AuthProviderSettings.hpp"
#include "adapters/JsonUserId.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace gateway::adapters::secondary {

/**
 * @brief HTTP клиент к identity provider
 *
 * POST {signin_path} {"email", "password"} -> 200 {"user_id": ...}.
 * Любой другой статус - отказ. user_id: непустая строка или целое число,
 * всё остальное (null, объект, массив) - отказ.
 */
class HttpAuthProvider : public ports::output::IAuthProvider {
public:
    HttpAuthProvider(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::AuthProviderSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpAuthProvider] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << settings_->getSignInPath() << std::endl;
    }

    domain::SignInResult signIn(const std::string& email, const std::string& password) override {
        domain::SignInResult result;

        try {
            nlohmann::json requestBody = {
                {"email", email},
                {"password", password}
            };

            SimpleRequest request(
                "POST",
                settings_->getSignInPath(),
                requestBody.dump(),
                settings_->getHost(),
                settings_->getPort(),
                {{"Content-Type", "application/json"}}
            );

            SimpleResponse response;
            if (!httpClient_->send(request, response)) {
                result.message = "Identity provider unreachable";
                return result;
            }

            if (response.getStatus() != 200) {
                result.message = "Identity provider returned " + std::to_string(response.getStatus());
                return result;
            }

            auto body = nlohmann::json::parse(response.getBody());
            auto userId = body.is_object() && body.contains("user_id")
                ? userIdFromJson(body["user_id"])
                : std::nullopt;
            if (!userId) {
                result.message = "Identity provider returned invalid user_id";
                return result;
            }
            result.userId = *userId;
            result.success = true;

        } catch (const std::exception& e) {
            std::cerr << "[HttpAuthProvider] Error: " << e.what() << std::endl;
            result.success = false;
            result.message = std::string("Identity provider error: ") + e.what();
        }

        return result;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::AuthProviderSettings> settings_;
};

} // namespace gateway::adapters::secondary
