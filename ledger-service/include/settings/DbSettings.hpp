#pragma once

#include <cstdlib>
#include <string>

namespace ledger::settings {

/**
 * @brief Подключение к базе леджера (счета и журнал транзакций)
 *
 * ENV: LEDGER_DB_HOST, LEDGER_DB_PORT, LEDGER_DB_NAME, LEDGER_DB_USER,
 * LEDGER_DB_PASSWORD, LEDGER_DB_CONNECT_TIMEOUT (секунды).
 * Строка подключения в формате libpq keyword=value.
 */
class DbSettings {
public:
    DbSettings()
        : host_(env("LEDGER_DB_HOST", "ledger-postgres"))
        , port_(std::stoi(env("LEDGER_DB_PORT", "5432")))
        , database_(env("LEDGER_DB_NAME", "ledger_db"))
        , user_(env("LEDGER_DB_USER", "ledger_user"))
        , password_(env("LEDGER_DB_PASSWORD", "ledger_secret_password"))
        , connectTimeoutSec_(std::stoi(env("LEDGER_DB_CONNECT_TIMEOUT", "5")))
    {}

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    const std::string& getDatabase() const { return database_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + database_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeoutSec_) +
               " application_name=ledger-service";
    }

private:
    static std::string env(const char* name, const char* fallback) {
        const char* value = std::getenv(name);
        return value && *value ? std::string(value) : std::string(fallback);
    }

    std::string host_;
    int port_;
    std::string database_;
    std::string user_;
    std::string password_;
    int connectTimeoutSec_;
};

} // namespace ledger::settings
