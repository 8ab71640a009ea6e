#pragma once

#include "ports/output/IDeviceAuditRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <memory>
#include <mutex>
#include <iostream>

namespace gateway::adapters::secondary {

/**
 * @brief Журнал устройств в PostgreSQL
 *
 * Таблица session_audit (см. sql/001_session_audit.sql):
 * одна строка на сессию, ended_at/end_reason заполняются при закрытии.
 * Ошибки записи логируются и не пробрасываются.
 */
class PostgresDeviceAuditRepository : public ports::output::IDeviceAuditRepository {
public:
    explicit PostgresDeviceAuditRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresDeviceAuditRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresDeviceAuditRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresDeviceAuditRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresDeviceAuditRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void recordSessionStart(const domain::Session& session) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO session_audit
                        (session_id, user_id, fingerprint, ip, user_agent, accept_language,
                         forwarded_for, created_at, expires_at)
                    VALUES ($1, $2, $3, $4, $5, $6, $7, to_timestamp($8), to_timestamp($9))
                    ON CONFLICT (session_id) DO NOTHING
                )",
                session.sessionId,
                session.userId,
                session.fingerprint,
                session.deviceInfo.ip,
                session.deviceInfo.userAgent,
                session.deviceInfo.acceptLanguage,
                session.deviceInfo.forwardedFor,
                toEpochSeconds(session.createdAt),
                toEpochSeconds(session.expiresAt)
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresDeviceAuditRepository] recordSessionStart() failed: " << e.what() << std::endl;
        }
    }

    void recordSessionEnd(const std::string& sessionId, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    UPDATE session_audit
                    SET ended_at = NOW(), end_reason = $2
                    WHERE session_id = $1 AND ended_at IS NULL
                )",
                sessionId,
                reason
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresDeviceAuditRepository] recordSessionEnd() failed: " << e.what() << std::endl;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    static long long toEpochSeconds(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }
};

} // namespace gateway::adapters::secondary
