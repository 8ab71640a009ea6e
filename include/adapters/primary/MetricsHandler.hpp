#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"
#include <memory>

namespace gateway::adapters::primary {

/**
 * @brief GET /metrics - Prometheus text format 0.0.4
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics)) {}

    void handle(IRequest& req, IResponse& res) override {
        res.setResult(200, "text/plain; version=0.0.4; charset=utf-8", metrics_->toPrometheusFormat());
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace gateway::adapters::primary
