#pragma once

#include <IHttpHandler.hpp>
#include <memory>
#include <vector>
#include <iostream>
#include <nlohmann/json.hpp>

namespace gateway::adapters::primary
{

    /**
     * @brief Цепочка middleware + handler
     *
     * Middleware, пропускающий запрос дальше, ставит статус 0.
     * Любой ненулевой статус завершает цепочку.
     */
    class ChainHandler : public IHttpHandler
    {
    public:
        template <typename... Handlers>
        explicit ChainHandler(Handlers &&...handlers)
        {
            (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
        }

        void handle(IRequest &req, IResponse &res) override
        {
            for (auto &h : handlers_)
            {
                res.setStatus(0);
                h->handle(req, res);
                if (res.getStatus() != 0)
                    return;
            }

            std::cerr << "[ChainHandler] Chain finished without a response" << std::endl;
            nlohmann::json error;
            error["error"] = "Internal server error";
            res.setResult(500, "application/json", error.dump());
        }

    private:
        std::vector<std::shared_ptr<IHttpHandler>> handlers_;
    };

} // namespace gateway::adapters::primary
