#pragma once

#include "domain/exceptions/StoreUnavailableException.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace gateway::adapters::secondary {

/**
 * @brief Пул соединений фиксированного размера
 *
 * - соединения открываются лениво через factory, при первом заимствовании
 * - не больше maxSize открытых соединений одновременно
 * - ожидание свободного соединения ограничено maxWait,
 *   по истечении -> domain::StoreUnavailableException
 * - соединение, помеченное broken, закрывается через disposer и не возвращается в пул
 *
 * Исключение из factory пробрасывается как есть, место в пуле освобождается.
 */
template <typename Connection>
class ConnectionPool {
public:
    using ConnectionPtr = std::unique_ptr<Connection>;
    using Factory = std::function<ConnectionPtr()>;
    using Disposer = std::function<void(Connection&)>;

    /**
     * @brief Соединение, взятое из пула (RAII)
     *
     * В деструкторе возвращается в пул, если не было помечено broken.
     */
    class Lease {
    public:
        Lease(ConnectionPool& pool, ConnectionPtr connection)
            : pool_(&pool), connection_(std::move(connection)) {}

        ~Lease() {
            if (pool_) {
                pool_->release(std::move(connection_), broken_);
            }
        }

        Lease(Lease&& other) noexcept
            : pool_(other.pool_), connection_(std::move(other.connection_)), broken_(other.broken_) {
            other.pool_ = nullptr;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        Connection& operator*() { return *connection_; }
        Connection* operator->() { return connection_.get(); }

        void markBroken() { broken_ = true; }

    private:
        ConnectionPool* pool_;
        ConnectionPtr connection_;
        bool broken_ = false;
    };

    ConnectionPool(size_t maxSize, std::chrono::milliseconds maxWait, Factory factory, Disposer disposer = {})
        : maxSize_(maxSize)
        , maxWait_(maxWait)
        , factory_(std::move(factory))
        , disposer_(std::move(disposer))
    {
    }

    ~ConnectionPool() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& connection : idle_) {
            dispose(*connection);
        }
        idle_.clear();
    }

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Lease acquire() {
        std::unique_lock<std::mutex> lock(mutex_);

        bool ready = available_.wait_for(lock, maxWait_, [this] {
            return !idle_.empty() || opened_ < maxSize_;
        });
        if (!ready) {
            throw domain::StoreUnavailableException("connection pool exhausted");
        }

        if (!idle_.empty()) {
            ConnectionPtr connection = std::move(idle_.back());
            idle_.pop_back();
            ++leased_;
            return Lease(*this, std::move(connection));
        }

        // Новое соединение открываем вне блокировки
        ++opened_;
        ++leased_;
        lock.unlock();

        ConnectionPtr connection;
        try {
            connection = factory_();
        } catch (...) {
            lock.lock();
            --opened_;
            --leased_;
            available_.notify_one();
            throw;
        }
        return Lease(*this, std::move(connection));
    }

    size_t opened() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_;
    }

    size_t leased() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return leased_;
    }

    size_t idle() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_.size();
    }

private:
    void release(ConnectionPtr connection, bool broken) {
        std::lock_guard<std::mutex> lock(mutex_);
        --leased_;
        if (broken || !connection) {
            --opened_;
            if (connection) {
                dispose(*connection);
            }
        } else {
            idle_.push_back(std::move(connection));
        }
        available_.notify_one();
    }

    void dispose(Connection& connection) {
        if (disposer_) {
            disposer_(connection);
        }
    }

    const size_t maxSize_;
    const std::chrono::milliseconds maxWait_;
    Factory factory_;
    Disposer disposer_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<ConnectionPtr> idle_;
    size_t leased_ = 0;
    size_t opened_ = 0;
};

} // namespace gateway::adapters::secondary
