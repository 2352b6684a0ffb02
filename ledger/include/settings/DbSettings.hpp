// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace ledger::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения LEDGER_DB_*.
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("LEDGER_DB_HOST", "localhost");
            port_ = std::stoi(getEnvOrDefault("LEDGER_DB_PORT", "5432"));
            name_ = getEnvOrDefault("LEDGER_DB_NAME", "ledger_db");
            user_ = getEnvOrDefault("LEDGER_DB_USER", "ledger_user");
            password_ = getEnvOrDefault("LEDGER_DB_PASSWORD", "ledger_password");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace ledger::settings
