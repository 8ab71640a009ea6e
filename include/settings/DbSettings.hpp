#pragma once

#include "settings/EnvNumber.hpp"
#include <string>
#include <cstdlib>

namespace gateway::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL (журнал устройств)
     *
     * Читает параметры из переменных окружения AUDIT_DB_*.
     * AUDIT_ENABLED=false отключает запись в БД (журнал только в лог).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("AUDIT_DB_HOST", "gateway-postgres");
            port_ = static_cast<int>(parseEnvLong("AUDIT_DB_PORT", getEnvOrDefault("AUDIT_DB_PORT", "5432")));
            name_ = getEnvOrDefault("AUDIT_DB_NAME", "gateway_db");
            user_ = getEnvOrDefault("AUDIT_DB_USER", "gateway_user");
            password_ = getEnvOrDefault("AUDIT_DB_PASSWORD", "");

            std::string enabled = getEnvOrDefault("AUDIT_ENABLED", "true");
            enabled_ = !(enabled == "0" || enabled == "false" || enabled == "no");
        }

        bool isEnabled() const { return enabled_; }

        std::string getConnectionString() const
        {
            std::string conn = "host=" + host_ + " port=" + std::to_string(port_) +
                               " dbname=" + name_ + " user=" + user_;
            if (!password_.empty())
                conn += " password=" + password_;
            return conn;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        bool enabled_ = true;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace gateway::settings
