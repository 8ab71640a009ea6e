#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionLifecycleService.hpp"
#include "settings/ISessionSettings.hpp"
#include "adapters/JsonUserId.hpp"
#include "domain/exceptions/StoreUnavailableException.hpp"
#include "domain/exceptions/SessionIdCollisionException.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace gateway::adapters::primary
{

    /**
     * @brief Внутренний API жизненного цикла сессий для сервиса аутентификации
     *
     * POST   /internal/v1/sessions                   {"user_id", "device": {...}} -> 201 {"session_id"}
     * DELETE /internal/v1/sessions/{id}              -> 200 (идемпотентно)
     * POST   /internal/v1/users/sessions/invalidate  {"user_id"} -> 200 {"invalidated": N}
     *
     * Доступ ограничивается на уровне сети (не публикуется наружу).
     */
    class SessionAdminHandler : public IHttpHandler
    {
    public:
        SessionAdminHandler(
            std::shared_ptr<ports::input::ISessionLifecycleService> lifecycle,
            std::shared_ptr<settings::ISessionSettings> settings)
            : lifecycle_(std::move(lifecycle)), settings_(std::move(settings))
        {
            std::cout << "[SessionAdminHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            const std::string method = req.getMethod();
            const std::string path = req.getPath();

            try
            {
                if (method == "POST" && path == "/internal/v1/sessions")
                {
                    startSession(req, res);
                }
                else if (method == "DELETE" && path.rfind("/internal/v1/sessions/", 0) == 0)
                {
                    endSession(req, res);
                }
                else if (method == "POST" && path == "/internal/v1/users/sessions/invalidate")
                {
                    invalidateAll(req, res);
                }
                else
                {
                    sendError(res, 404, "Not found");
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, std::string("Invalid request body: ") + e.what());
            }
            catch (const std::invalid_argument &e)
            {
                sendError(res, 400, e.what());
            }
            catch (const domain::StoreUnavailableException &e)
            {
                std::cerr << "[SessionAdminHandler] " << e.what() << std::endl;
                sendError(res, 503, "Session store unavailable");
            }
            catch (const domain::SessionIdCollisionException &e)
            {
                std::cerr << "[SessionAdminHandler] " << e.what() << std::endl;
                sendError(res, 500, "Session could not be created");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SessionAdminHandler] Unexpected error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ISessionLifecycleService> lifecycle_;
        std::shared_ptr<settings::ISessionSettings> settings_;

        void startSession(IRequest &req, IResponse &res)
        {
            auto body = nlohmann::json::parse(req.getBody());

            domain::DeviceAttributes attrs;
            if (body.contains("device"))
            {
                const auto &d = body.at("device");
                attrs.ip = d.value("ip", "");
                attrs.userAgent = d.value("user_agent", "");
                attrs.acceptLanguage = d.value("accept_language", "");
                attrs.forwardedFor = d.value("forwarded_for", "");
            }

            std::string sessionId = lifecycle_->startSession(userIdOf(body), attrs);

            nlohmann::json response;
            response["session_id"] = sessionId;
            response["expires_in"] = settings_->getSessionTtl().count();
            res.setResult(201, "application/json", response.dump());
        }

        void endSession(IRequest &req, IResponse &res)
        {
            static const std::string prefix = "/internal/v1/sessions/";
            std::string sessionId = req.getPathParam(0).value_or(req.getPath().substr(prefix.size()));
            if (sessionId.empty())
            {
                sendError(res, 400, "Session ID is required");
                return;
            }

            lifecycle_->endSession(sessionId);

            nlohmann::json response;
            response["message"] = "Session ended";
            res.setResult(200, "application/json", response.dump());
        }

        void invalidateAll(IRequest &req, IResponse &res)
        {
            auto body = nlohmann::json::parse(req.getBody());
            std::size_t count = lifecycle_->invalidateAllForUser(userIdOf(body));

            nlohmann::json response;
            response["invalidated"] = count;
            res.setResult(200, "application/json", response.dump());
        }

        /// user_id: непустая строка или целое число
        static std::string userIdOf(const nlohmann::json &body)
        {
            auto userId = userIdFromJson(body.at("user_id"));
            if (!userId)
                throw std::invalid_argument("user_id must be a non-empty string or an integer");
            return *userId;
        }

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace gateway::adapters::primary
