#pragma once

#include "ports/output/IKeyValueStore.hpp"
#include "settings/StoreSettings.hpp"
#include "adapters/secondary/ConnectionPool.hpp"

#include <Poco/Redis/Client.h>

#include <memory>
#include <vector>

namespace gateway::adapters::secondary {

/**
 * @brief IKeyValueStore поверх Redis (Poco::Redis)
 *
 * Пул соединений фиксированного размера:
 * - соединения открываются лениво, при первом заимствовании
 * - ожидание свободного соединения ограничено REDIS_POOL_WAIT_MS
 * - каждая команда ограничена REDIS_COMMAND_TIMEOUT_MS (send и receive timeout сокета)
 * - соединение, на котором произошла ошибка, закрывается и не возвращается в пул
 *
 * Любая ошибка сети, протокола или таймаут -> domain::StoreUnavailableException.
 * Повторов нет: решение о повторе принимает вызывающая сторона.
 */
class RedisKeyValueStore : public ports::output::IKeyValueStore {
public:
    explicit RedisKeyValueStore(std::shared_ptr<settings::StoreSettings> settings);
    ~RedisKeyValueStore() override;

    RedisKeyValueStore(const RedisKeyValueStore&) = delete;
    RedisKeyValueStore& operator=(const RedisKeyValueStore&) = delete;

    bool setValue(const std::string& key, const std::string& value,
                  std::chrono::seconds ttl, bool onlyIfAbsent = false) override;
    std::optional<std::string> getValue(const std::string& key) override;
    bool remove(const std::string& key) override;
    void addToSet(const std::string& key, const std::string& member,
                  std::chrono::seconds ttl) override;
    void removeFromSet(const std::string& key, const std::string& member) override;
    std::vector<std::string> setMembers(const std::string& key) override;
    bool ping() override;

private:
    using Pool = ConnectionPool<Poco::Redis::Client>;

    std::unique_ptr<Poco::Redis::Client> connect();

    /// Выполнить операцию на соединении из пула, ошибки -> StoreUnavailableException
    template <typename Fn>
    auto withClient(const char* operation, Fn&& fn) -> decltype(fn(std::declval<Poco::Redis::Client&>()));

    std::shared_ptr<settings::StoreSettings> settings_;
    Pool pool_;
};

} // namespace gateway::adapters::secondary
