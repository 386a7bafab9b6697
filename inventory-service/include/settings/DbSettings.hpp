// include/settings/DbSettings.hpp
#pragma once

#include "settings/Env.hpp"
#include <string>

namespace inventory::settings {

/**
 * @brief PostgreSQL для PostgresLedgerStore (INVENTORY_STORAGE=postgres)
 *
 * - INVENTORY_DB_HOST / INVENTORY_DB_PORT
 * - INVENTORY_DB_NAME / INVENTORY_DB_USER / INVENTORY_DB_PASSWORD
 * - INVENTORY_DB_CONNECT_TIMEOUT: секунды (по умолчанию 5)
 *
 * @throws std::invalid_argument при некорректном порте или таймауте
 */
class DbSettings {
public:
    DbSettings()
        : host_(env::getOrDefault("INVENTORY_DB_HOST", "inventory-postgres"))
        , port_(env::getIntInRange("INVENTORY_DB_PORT", 5432, 1, 65535))
        , database_(env::getOrDefault("INVENTORY_DB_NAME", "inventory_db"))
        , user_(env::getOrDefault("INVENTORY_DB_USER", "inventory_user"))
        , password_(env::getOrDefault("INVENTORY_DB_PASSWORD", "inventory_secret_password"))
        , connectTimeoutSec_(env::getIntInRange("INVENTORY_DB_CONNECT_TIMEOUT", 5, 1, 300))
    {}

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    const std::string& getDatabase() const { return database_; }
    int getConnectTimeoutSec() const { return connectTimeoutSec_; }

    /**
     * @brief libpq conninfo; application_name помечает сессии движка в pg_stat_activity
     */
    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + database_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeoutSec_) +
               " application_name=inventory-engine";
    }

private:
    std::string host_;
    int port_;
    std::string database_;
    std::string user_;
    std::string password_;
    int connectTimeoutSec_;
};

} // namespace inventory::settings
