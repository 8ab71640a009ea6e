#pragma once

#include "ports/output/IKeyValueStore.hpp"
#include "ports/output/IClock.hpp"
#include "settings/StoreSettings.hpp"
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>
#include <iostream>

namespace gateway::adapters::secondary
{

    /**
     * @brief IKeyValueStore в памяти процесса на основе cpp-cache (LRU)
     *
     * Для одного инстанса и локальной разработки
     * (SESSION_STORE_BACKEND=memory). Сессии не переживают рестарт
     * и не разделяются между репликами.
     *
     * TTL у каждого ключа свой: срок хранится в записи и проверяется
     * при чтении по IClock (пассивное вытеснение, как в Redis).
     * При переполнении вытесняется давно не использованный строковый ключ.
     * Множества (user_sessions:*) хранятся отдельно и вытесняются только по TTL.
     */
    class LruKeyValueStore : public ports::output::IKeyValueStore
    {
    public:
        LruKeyValueStore(std::shared_ptr<settings::StoreSettings> settings,
                         std::shared_ptr<ports::output::IClock> clock)
            : LruKeyValueStore(settings->getMemoryCapacity(), std::move(clock))
        {
        }

        LruKeyValueStore(size_t capacity, std::shared_ptr<ports::output::IClock> clock)
            : clock_(std::move(clock))
        {
            auto innerCache = std::make_unique<CacheType>(
                capacity,
                std::make_unique<LRUPolicy<std::string>>());
            cache_ = std::make_unique<ThreadSafeCacheType>(std::move(innerCache));
            std::cout << "[LruKeyValueStore] Created, capacity=" << capacity << std::endl;
        }

        bool setValue(const std::string &key, const std::string &value,
                      std::chrono::seconds ttl, bool onlyIfAbsent = false) override
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            if (onlyIfAbsent && liveValue(key))
                return false;

            Entry entry;
            entry.value = value;
            entry.expiresAt = clock_->now() + ttl;
            cache_->put(key, entry);
            return true;
        }

        std::optional<std::string> getValue(const std::string &key) override
        {
            auto entry = cache_->get(key);
            if (!entry)
                return std::nullopt;
            if (clock_->now() >= entry->expiresAt)
            {
                std::lock_guard<std::mutex> lock(writeMutex_);
                purgeExpired(key);
                return std::nullopt;
            }
            return entry->value;
        }

        bool remove(const std::string &key) override
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            bool existed = liveValue(key).has_value();
            cache_->remove(key);
            return existed;
        }

        void addToSet(const std::string &key, const std::string &member,
                      std::chrono::seconds ttl) override
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            SetEntry &entry = sets_[key];
            if (clock_->now() >= entry.expiresAt)
                entry.members.clear();
            entry.members.insert(member);
            entry.expiresAt = clock_->now() + ttl;
        }

        void removeFromSet(const std::string &key, const std::string &member) override
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            auto it = liveSet(key);
            if (it == sets_.end())
                return;

            it->second.members.erase(member);
            if (it->second.members.empty())
                sets_.erase(it);
        }

        std::vector<std::string> setMembers(const std::string &key) override
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            auto it = liveSet(key);
            if (it == sets_.end())
                return {};
            return {it->second.members.begin(), it->second.members.end()};
        }

        bool ping() override { return true; }

        /// Число строковых ключей в LRU кэше
        size_t size() const { return cache_->size(); }

        size_t setCount()
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            return sets_.size();
        }

    private:
        struct Entry
        {
            std::string value;
            std::chrono::system_clock::time_point expiresAt;
        };

        struct SetEntry
        {
            std::set<std::string> members;
            std::chrono::system_clock::time_point expiresAt;
        };

        using CacheType = Cache<std::string, Entry>;
        using ThreadSafeCacheType = ThreadSafeCache<std::string, Entry>;

        std::shared_ptr<ports::output::IClock> clock_;
        std::unique_ptr<ThreadSafeCacheType> cache_;

        // Множества (обратные индексы) не вытесняются по LRU: только по TTL
        std::map<std::string, SetEntry> sets_;
        std::mutex writeMutex_; // все изменения cache_ и любой доступ к sets_

        /// Под writeMutex_: запись, если она есть и не истекла; истёкшая удаляется
        std::optional<Entry> liveValue(const std::string &key)
        {
            auto entry = cache_->get(key);
            if (!entry)
                return std::nullopt;
            if (clock_->now() >= entry->expiresAt)
            {
                cache_->remove(key);
                return std::nullopt;
            }
            return entry;
        }

        /// Под writeMutex_: удалить ключ, если он всё ещё истёкший
        void purgeExpired(const std::string &key)
        {
            auto current = cache_->get(key);
            if (current && clock_->now() >= current->expiresAt)
                cache_->remove(key);
        }

        /// Под writeMutex_
        std::map<std::string, SetEntry>::iterator liveSet(const std::string &key)
        {
            auto it = sets_.find(key);
            if (it != sets_.end() && clock_->now() >= it->second.expiresAt)
            {
                sets_.erase(it);
                return sets_.end();
            }
            return it;
        }
    };

} // namespace gateway::adapters::secondary
