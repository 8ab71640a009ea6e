#pragma once

#include "ports/input/ISessionLifecycleService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ISessionStore.hpp"
#include "ports/output/IFingerprintGenerator.hpp"
#include "ports/output/ISessionIdGenerator.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IDeviceAuditRepository.hpp"
#include "settings/ISessionSettings.hpp"
#include "domain/SessionToken.hpp"

#include <memory>
#include <stdexcept>
#include <iostream>

namespace gateway::application {

/**
 * @brief Создание и закрытие сессий
 *
 * Сессии ключуются по session_id: у одного пользователя может быть
 * сколько угодно параллельных сессий с разных устройств.
 * Общего состояния кроме хранилища нет, блокировок нет.
 */
class SessionLifecycleManager : public ports::input::ISessionLifecycleService {
public:
    SessionLifecycleManager(
        std::shared_ptr<ports::output::ISessionStore> store,
        std::shared_ptr<ports::output::IFingerprintGenerator> fingerprints,
        std::shared_ptr<ports::output::ISessionIdGenerator> idGenerator,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IDeviceAuditRepository> audit,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::ISessionSettings> settings
    ) : store_(std::move(store))
      , fingerprints_(std::move(fingerprints))
      , idGenerator_(std::move(idGenerator))
      , clock_(std::move(clock))
      , audit_(std::move(audit))
      , metrics_(std::move(metrics))
      , settings_(std::move(settings))
    {
        std::cout << "[SessionLifecycleManager] Created" << std::endl;
    }

    std::string startSession(const std::string& userId,
                             const domain::DeviceAttributes& attrs) override
    {
        if (userId.empty()) {
            throw std::invalid_argument("user_id is required");
        }

        domain::Session session;
        session.sessionId = idGenerator_->generate();
        session.userId = userId;
        session.fingerprint = fingerprints_->fingerprint(attrs);
        session.createdAt = clock_->now();
        session.expiresAt = session.createdAt + settings_->getSessionTtl();
        session.deviceInfo = attrs;

        store_->create(session);
        audit_->recordSessionStart(session);
        metrics_->increment("gateway_sessions_created_total");

        std::cout << "[SessionLifecycleManager] Session started: user=" << userId
                  << " session=" << domain::maskSessionId(session.sessionId)
                  << " ip=" << attrs.ip << std::endl;
        return session.sessionId;
    }

    void endSession(const std::string& sessionId) override {
        if (sessionId.empty()) {
            return;
        }

        if (!store_->remove(sessionId)) {
            return;
        }
        audit_->recordSessionEnd(sessionId, "logout");
        metrics_->increment("gateway_sessions_ended_total", {{"reason", "logout"}});

        std::cout << "[SessionLifecycleManager] Session ended: "
                  << domain::maskSessionId(sessionId) << std::endl;
    }

    std::size_t invalidateAllForUser(const std::string& userId) override {
        if (userId.empty()) {
            throw std::invalid_argument("user_id is required");
        }

        std::size_t removed = 0;
        for (const auto& sessionId : store_->sessionsOfUser(userId)) {
            // Индекс может хранить id уже истёкших сессий
            if (!store_->remove(sessionId)) {
                continue;
            }
            audit_->recordSessionEnd(sessionId, "invalidated");
            metrics_->increment("gateway_sessions_ended_total", {{"reason", "invalidated"}});
            ++removed;
        }

        std::cout << "[SessionLifecycleManager] Invalidated " << removed
                  << " session(s) of user " << userId << std::endl;
        return removed;
    }

private:
    std::shared_ptr<ports::output::ISessionStore> store_;
    std::shared_ptr<ports::output::IFingerprintGenerator> fingerprints_;
    std::shared_ptr<ports::output::ISessionIdGenerator> idGenerator_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IDeviceAuditRepository> audit_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::shared_ptr<settings::ISessionSettings> settings_;
};

} // namespace gateway::application
