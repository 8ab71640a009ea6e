#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace gateway::ports::output {

/**
 * @brief Интерфейс распределённого key-value хранилища с TTL
 *
 * Каждая операция атомарна на уровне одного ключа.
 * Любой вызов либо завершается за ограниченное время,
 * либо выбрасывает domain::StoreUnavailableException.
 *
 * Реализации:
 * - RedisKeyValueStore (production)
 * - LruKeyValueStore (один инстанс, разработка)
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /**
     * @brief Записать значение
     * @param ttl Время жизни ключа
     * @param onlyIfAbsent Записать только если ключа нет (SET NX)
     * @return false если onlyIfAbsent и ключ уже существует
     */
    virtual bool setValue(const std::string& key, const std::string& value,
                          std::chrono::seconds ttl, bool onlyIfAbsent = false) = 0;

    virtual std::optional<std::string> getValue(const std::string& key) = 0;

    /**
     * @brief Удалить ключ
     * @return true если ключ существовал
     */
    virtual bool remove(const std::string& key) = 0;

    /// Добавить элемент в множество и продлить TTL множества
    virtual void addToSet(const std::string& key, const std::string& member,
                          std::chrono::seconds ttl) = 0;

    virtual void removeFromSet(const std::string& key, const std::string& member) = 0;

    virtual std::vector<std::string> setMembers(const std::string& key) = 0;

    /// Проверка доступности (не выбрасывает)
    virtual bool ping() = 0;
};

} // namespace gateway::ports::output
