#pragma once

#include "ports/output/ISessionStore.hpp"
#include "ports/output/IKeyValueStore.hpp"
#include "settings/ISessionSettings.hpp"
#include "adapters/secondary/SessionRecordCodec.hpp"
#include "domain/exceptions/SessionIdCollisionException.hpp"
#include "domain/exceptions/MalformedSessionRecordException.hpp"
#include <memory>
#include <iostream>

namespace gateway::adapters::secondary {

/**
 * @brief Хранилище сессий поверх IKeyValueStore
 *
 * Ключи:
 * - session:{id}         JSON запись, TTL = session_ttl, пишется через SET NX
 * - user_id:{id}         user_id, TTL = user_id_cache_ttl
 * - user_sessions:{uid}  множество session_id, TTL продлевается при каждом create
 *
 * Кросс-ключевых транзакций нет: каждая операция атомарна по одному ключу.
 * StoreUnavailableException от IKeyValueStore пробрасывается как есть.
 */
class KeyValueSessionStore : public ports::output::ISessionStore {
public:
    KeyValueSessionStore(
        std::shared_ptr<ports::output::IKeyValueStore> kv,
        std::shared_ptr<settings::ISessionSettings> settings
    ) : kv_(std::move(kv))
      , settings_(std::move(settings))
    {
        std::cout << "[KeyValueSessionStore] Created, session_ttl=" << settings_->getSessionTtl().count()
                  << "s, user_id_cache_ttl=" << settings_->getUserIdCacheTtl().count() << "s" << std::endl;
    }

    static std::string sessionKey(const std::string& sessionId) { return "session:" + sessionId; }
    static std::string userIdKey(const std::string& sessionId) { return "user_id:" + sessionId; }
    static std::string userSessionsKey(const std::string& userId) { return "user_sessions:" + userId; }

    void create(const domain::Session& session) override {
        bool written = kv_->setValue(
            sessionKey(session.sessionId),
            SessionRecordCodec::encode(session),
            settings_->getSessionTtl(),
            true);
        if (!written) {
            throw domain::SessionIdCollisionException("key already present for new session");
        }

        kv_->setValue(userIdKey(session.sessionId), session.userId, settings_->getUserIdCacheTtl());
        kv_->addToSet(userSessionsKey(session.userId), session.sessionId, settings_->getSessionTtl());
    }

    std::optional<domain::Session> get(const std::string& sessionId) override {
        auto raw = kv_->getValue(sessionKey(sessionId));
        if (!raw) {
            return std::nullopt;
        }

        domain::Session session = SessionRecordCodec::decode(*raw);
        if (session.sessionId != sessionId) {
            throw domain::MalformedSessionRecordException("session_id does not match its key");
        }
        return session;
    }

    bool remove(const std::string& sessionId) override {
        // user_id нужен только для чистки обратного индекса
        std::optional<std::string> userId = kv_->getValue(userIdKey(sessionId));
        if (!userId) {
            auto raw = kv_->getValue(sessionKey(sessionId));
            if (raw) {
                try {
                    userId = SessionRecordCodec::decode(*raw).userId;
                } catch (const domain::MalformedSessionRecordException& e) {
                    std::cerr << "[KeyValueSessionStore] remove(): " << e.what() << std::endl;
                }
            }
        }

        bool removed = kv_->remove(sessionKey(sessionId));
        kv_->remove(userIdKey(sessionId));
        if (userId) {
            kv_->removeFromSet(userSessionsKey(*userId), sessionId);
        }
        return removed;
    }

    std::optional<std::string> getCachedUserId(const std::string& sessionId) override {
        return kv_->getValue(userIdKey(sessionId));
    }

    void cacheUserId(const std::string& sessionId, const std::string& userId) override {
        kv_->setValue(userIdKey(sessionId), userId, settings_->getUserIdCacheTtl());
    }

    void evictCachedUserId(const std::string& sessionId) override {
        kv_->remove(userIdKey(sessionId));
    }

    std::vector<std::string> sessionsOfUser(const std::string& userId) override {
        return kv_->setMembers(userSessionsKey(userId));
    }

    bool isReachable() override {
        return kv_->ping();
    }

private:
    std::shared_ptr<ports::output::IKeyValueStore> kv_;
    std::shared_ptr<settings::ISessionSettings> settings_;
};

} // namespace gateway::adapters::secondary
