#pragma once

#include <IHttpHandler.hpp>
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include "ports/input/IMetricsService.hpp"
#include "settings/IGatewaySettings.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <iostream>

namespace gateway::adapters::primary
{

    /**
     * @brief Проксирование запроса в защищённый backend
     *
     * Стоит после SessionVerificationMiddleware: user_id берётся из
     * атрибута "userId" и передаётся в заголовке X-User-Id.
     * X-User-Id от клиента отбрасывается.
     * Статус, тело и основные заголовки ответа backend передаются как есть.
     */
    class BackendProxyHandler : public IHttpHandler
    {
    public:
        static constexpr const char *kUserIdHeader = "X-User-Id";

        BackendProxyHandler(
            std::shared_ptr<IHttpClient> httpClient,
            std::shared_ptr<settings::IGatewaySettings> settings,
            std::shared_ptr<ports::input::IMetricsService> metrics)
            : httpClient_(std::move(httpClient))
            , settings_(std::move(settings))
            , metrics_(std::move(metrics))
        {
            std::cout << "[BackendProxyHandler] Created, target: "
                      << settings_->getBackendHost() << ":" << settings_->getBackendPort() << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            auto userId = req.getAttribute("userId");
            if (!userId || userId->empty())
            {
                // Без проверенной сессии в backend не ходим
                std::cerr << "[BackendProxyHandler] No userId attribute, refusing to forward" << std::endl;
                sendError(res, 500, "Internal server error");
                return;
            }

            std::map<std::string, std::string> headers;
            for (const auto &[name, value] : req.getHeaders())
            {
                if (!isDropped(name))
                    headers[name] = value;
            }
            headers[kUserIdHeader] = *userId;

            SimpleRequest upstream(
                req.getMethod(),
                targetOf(req),
                req.getBody(),
                settings_->getBackendHost(),
                settings_->getBackendPort(),
                headers);

            SimpleResponse response;
            try
            {
                if (!httpClient_->send(upstream, response))
                {
                    badGateway(res, "send() returned false");
                    return;
                }
            }
            catch (const std::exception &e)
            {
                badGateway(res, e.what());
                return;
            }

            for (const char *name : {"Location", "Cache-Control", "ETag", "Last-Modified",
                                     "Set-Cookie", "Content-Disposition"})
            {
                if (auto value = response.getHeader(name))
                    res.setHeader(name, *value);
            }
            res.setResult(response.getStatus(),
                          response.getHeader("Content-Type").value_or("application/octet-stream"),
                          response.getBody());
        }

    private:
        std::shared_ptr<IHttpClient> httpClient_;
        std::shared_ptr<settings::IGatewaySettings> settings_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;

        static std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        /// Hop-by-hop заголовки и X-User-Id от клиента
        static bool isDropped(const std::string &name)
        {
            const std::string n = lower(name);
            return n == "x-user-id" || n == "host" || n == "connection" || n == "content-length"
                   || n == "keep-alive" || n == "transfer-encoding" || n == "upgrade";
        }

        /// Процентное кодирование всего, кроме unreserved (RFC 3986)
        static std::string encode(const std::string &s)
        {
            static const char *hex = "0123456789ABCDEF";
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s)
            {
                if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~')
                {
                    out += static_cast<char>(c);
                }
                else
                {
                    out += '%';
                    out += hex[c >> 4];
                    out += hex[c & 0x0F];
                }
            }
            return out;
        }

        /// getParams() - map: повторяющиеся ключи сервер уже свёл к одному значению
        static std::string targetOf(const IRequest &req)
        {
            std::string target = req.getPath();
            auto params = req.getParams();
            if (!params.empty())
            {
                target += "?";
                bool first = true;
                for (const auto &[k, v] : params)
                {
                    if (!first)
                        target += "&";
                    target += encode(k) + "=" + encode(v);
                    first = false;
                }
            }
            return target;
        }

        void badGateway(IResponse &res, const std::string &reason)
        {
            std::cerr << "[BackendProxyHandler] Backend unavailable: " << reason << std::endl;
            metrics_->increment("gateway_proxy_errors_total");
            sendError(res, 502, "Bad gateway");
        }

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace gateway::adapters::primary
