#pragma once

#include "ports/input/ISessionValidator.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ISessionStore.hpp"
#include "ports/output/IFingerprintGenerator.hpp"
#include "ports/output/IClock.hpp"
#include "domain/SessionToken.hpp"
#include "domain/exceptions/StoreUnavailableException.hpp"
#include "domain/exceptions/MalformedSessionRecordException.hpp"

#include <memory>
#include <iostream>

namespace gateway::application {

/**
 * @brief Проверка сессии: хранилище + fingerprint + срок действия
 *
 * Порядок:
 * 1. Нет токена (или токен некорректный) -> NotFound, хранилище не трогаем
 * 2. get(session_id); недоступность или битая запись -> StoreError
 * 3. now >= expires_at -> Expired (даже если хранилище ещё не вытеснило ключ)
 * 4. fingerprint запроса != сохранённого -> FingerprintMismatch
 * 5. Valid; user_id сначала из кэша user_id:{id}, при расхождении побеждает запись сессии
 *
 * Любая неоднозначность трактуется как невалидная сессия (fail closed).
 */
class SessionValidator : public ports::input::ISessionValidator {
public:
    SessionValidator(
        std::shared_ptr<ports::output::ISessionStore> store,
        std::shared_ptr<ports::output::IFingerprintGenerator> fingerprints,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : store_(std::move(store))
      , fingerprints_(std::move(fingerprints))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
    {
        std::cout << "[SessionValidator] Created" << std::endl;
    }

    domain::ValidationResult validate(
        const std::string& sessionToken,
        const domain::DeviceAttributes& attrs) override
    {
        domain::ValidationResult result;
        result.sessionId = sessionToken;

        if (!domain::isWellFormedSessionToken(sessionToken)) {
            return finish(result, domain::ValidationOutcome::NotFound,
                          sessionToken.empty() ? "no session token" : "malformed session token");
        }

        std::optional<domain::Session> session;
        try {
            session = store_->get(sessionToken);
        } catch (const domain::StoreUnavailableException& e) {
            return storeError(result, "get", e.what());
        } catch (const domain::MalformedSessionRecordException& e) {
            return storeError(result, "get", e.what());
        } catch (const std::exception& e) {
            return storeError(result, "get", e.what());
        }

        if (!session) {
            return finish(result, domain::ValidationOutcome::NotFound, "session not in store");
        }

        if (session->isExpiredAt(clock_->now())) {
            return finish(result, domain::ValidationOutcome::Expired, "session expired");
        }

        std::string presented;
        try {
            presented = fingerprints_->fingerprint(attrs);
        } catch (const std::exception& e) {
            std::cerr << "[SessionValidator] fingerprint failed: " << e.what() << std::endl;
            return finish(result, domain::ValidationOutcome::FingerprintMismatch, "fingerprint unavailable");
        }

        if (!constantTimeEquals(presented, session->fingerprint)) {
            std::cerr << "[SessionValidator] SECURITY: fingerprint mismatch for session "
                      << domain::maskSessionId(sessionToken)
                      << " user=" << session->userId
                      << " ip=" << attrs.ip << std::endl;
            return finish(result, domain::ValidationOutcome::FingerprintMismatch, "fingerprint mismatch");
        }

        try {
            result.userId = resolveUserId(*session);
        } catch (const std::exception& e) {
            return storeError(result, "user_id_cache", e.what());
        }

        return finish(result, domain::ValidationOutcome::Valid, "");
    }

private:
    std::shared_ptr<ports::output::ISessionStore> store_;
    std::shared_ptr<ports::output::IFingerprintGenerator> fingerprints_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    /// Кэш user_id не авторитетен: при промахе заполняем, при расхождении перезаписываем
    std::string resolveUserId(const domain::Session& session) {
        auto cached = store_->getCachedUserId(session.sessionId);
        if (cached && *cached == session.userId) {
            return *cached;
        }

        if (cached) {
            std::cerr << "[SessionValidator] user_id cache disagrees with session record for "
                      << domain::maskSessionId(session.sessionId) << ", refreshing" << std::endl;
        }
        store_->cacheUserId(session.sessionId, session.userId);
        return session.userId;
    }

    domain::ValidationResult storeError(domain::ValidationResult& result,
                                        const std::string& operation,
                                        const std::string& message)
    {
        std::cerr << "[SessionValidator] Store error on " << operation << ": " << message << std::endl;
        metrics_->increment("gateway_store_errors_total", {{"operation", operation}});
        return finish(result, domain::ValidationOutcome::StoreError, message);
    }

    static domain::ValidationResult finish(domain::ValidationResult& result,
                                           domain::ValidationOutcome outcome,
                                           const std::string& detail)
    {
        result.outcome = outcome;
        result.detail = detail;
        if (outcome != domain::ValidationOutcome::Valid) {
            result.userId.clear();
        }
        return result;
    }

    static bool constantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        unsigned char diff = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            diff |= static_cast<unsigned char>(a[i] ^ b[i]);
        }
        return diff == 0;
    }
};

} // namespace gateway::application
