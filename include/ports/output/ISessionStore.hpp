#pragma once

#include "domain/Session.hpp"
#include <string>
#include <vector>
#include <optional>

namespace gateway::ports::output {

/**
 * @brief Хранилище сессий
 *
 * Ключи:
 * - session:{session_id}      -> запись сессии, TTL = session_ttl
 * - user_id:{session_id}      -> user_id, TTL = user_id_cache_ttl
 * - user_sessions:{user_id}   -> множество session_id (обратный индекс)
 *
 * Все операции выбрасывают domain::StoreUnavailableException,
 * если хранилище недоступно.
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /**
     * @brief Сохранить новую сессию
     * @throws domain::SessionIdCollisionException если session_id уже занят
     */
    virtual void create(const domain::Session& session) = 0;

    /**
     * @brief Получить сессию
     * @return nullopt если ключа нет (удалён или истёк - не различаем)
     * @throws domain::MalformedSessionRecordException если запись повреждена
     */
    virtual std::optional<domain::Session> get(const std::string& sessionId) = 0;

    /**
     * @brief Удалить сессию и её запись в кэше user_id. Идемпотентно.
     * @return true если запись сессии существовала и удалена
     */
    virtual bool remove(const std::string& sessionId) = 0;

    /// Быстрый путь: только вторичный индекс session_id -> user_id
    virtual std::optional<std::string> getCachedUserId(const std::string& sessionId) = 0;

    virtual void cacheUserId(const std::string& sessionId, const std::string& userId) = 0;

    virtual void evictCachedUserId(const std::string& sessionId) = 0;

    /// session_id всех сессий пользователя (могут быть уже истёкшие)
    virtual std::vector<std::string> sessionsOfUser(const std::string& userId) = 0;

    virtual bool isReachable() = 0;
};

} // namespace gateway::ports::output
