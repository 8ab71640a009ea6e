#pragma once

#include "settings/EnvNumber.hpp"
#include <cstdlib>
#include <string>
#include <chrono>
#include <stdexcept>

namespace gateway::settings {

/**
 * @brief Настройки хранилища сессий
 *
 * Читает из ENV:
 * - SESSION_STORE_BACKEND: "redis" | "memory" (default: "redis")
 * - REDIS_HOST (default: "redis"), REDIS_PORT (default: 6379)
 * - REDIS_PASSWORD (default: пусто), REDIS_DB (default: 0)
 * - REDIS_CONNECT_TIMEOUT_MS (default: 500)
 * - REDIS_COMMAND_TIMEOUT_MS (default: 250)
 * - REDIS_POOL_SIZE (default: 8)
 * - REDIS_POOL_WAIT_MS (default: 100) - ожидание свободного соединения
 * - MEMORY_STORE_CAPACITY (default: 100000)
 */
class StoreSettings {
public:
    StoreSettings() {
        if (const char* val = std::getenv("SESSION_STORE_BACKEND")) {
            backend_ = val;
        }
        if (const char* val = std::getenv("REDIS_HOST")) {
            host_ = val;
        }
        if (const char* val = std::getenv("REDIS_PORT")) {
            port_ = static_cast<int>(parseEnvLong("REDIS_PORT", val));
        }
        if (const char* val = std::getenv("REDIS_PASSWORD")) {
            password_ = val;
        }
        if (const char* val = std::getenv("REDIS_DB")) {
            database_ = static_cast<int>(parseEnvLong("REDIS_DB", val));
        }
        if (const char* val = std::getenv("REDIS_CONNECT_TIMEOUT_MS")) {
            connectTimeout_ = std::chrono::milliseconds(parseEnvLong("REDIS_CONNECT_TIMEOUT_MS", val));
        }
        if (const char* val = std::getenv("REDIS_COMMAND_TIMEOUT_MS")) {
            commandTimeout_ = std::chrono::milliseconds(parseEnvLong("REDIS_COMMAND_TIMEOUT_MS", val));
        }
        if (const char* val = std::getenv("REDIS_POOL_SIZE")) {
            poolSize_ = positive("REDIS_POOL_SIZE", parseEnvLong("REDIS_POOL_SIZE", val));
        }
        if (const char* val = std::getenv("REDIS_POOL_WAIT_MS")) {
            poolWait_ = std::chrono::milliseconds(parseEnvLong("REDIS_POOL_WAIT_MS", val));
        }
        if (const char* val = std::getenv("MEMORY_STORE_CAPACITY")) {
            memoryCapacity_ = positive("MEMORY_STORE_CAPACITY", parseEnvLong("MEMORY_STORE_CAPACITY", val));
        }

        if (backend_ != "redis" && backend_ != "memory") {
            throw std::invalid_argument("SESSION_STORE_BACKEND must be 'redis' or 'memory', got: " + backend_);
        }
        if (poolWait_.count() < 0) {
            throw std::invalid_argument("REDIS_POOL_WAIT_MS must not be negative");
        }
        if (commandTimeout_.count() <= 0 || connectTimeout_.count() <= 0) {
            throw std::invalid_argument("Redis timeouts must be positive");
        }
    }

    std::string getBackend() const { return backend_; }
    bool useRedis() const { return backend_ == "redis"; }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getPassword() const { return password_; }
    int getDatabase() const { return database_; }
    std::chrono::milliseconds getConnectTimeout() const { return connectTimeout_; }
    std::chrono::milliseconds getCommandTimeout() const { return commandTimeout_; }
    size_t getPoolSize() const { return poolSize_; }
    std::chrono::milliseconds getPoolWait() const { return poolWait_; }

    size_t getMemoryCapacity() const { return memoryCapacity_; }

private:
    static size_t positive(const char* name, long value) {
        if (value <= 0) {
            throw std::invalid_argument(std::string(name) + " must be positive");
        }
        return static_cast<size_t>(value);
    }

    std::string backend_ = "redis";
    std::string host_ = "redis";
    int port_ = 6379;
    std::string password_;
    int database_ = 0;
    std::chrono::milliseconds connectTimeout_{500};
    std::chrono::milliseconds commandTimeout_{250};
    size_t poolSize_ = 8;
    std::chrono::milliseconds poolWait_{100};
    size_t memoryCapacity_ = 100000;
};

} // namespace gateway::settings
