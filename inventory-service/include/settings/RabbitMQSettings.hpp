#pragma once

#include "settings/Env.hpp"
#include <string>

namespace inventory::settings {

/**
 * @brief Шина аудита (INVENTORY_AUDIT_SINK=rabbitmq)
 *
 * RABBITMQ_HOST, RABBITMQ_PORT, RABBITMQ_USER, RABBITMQ_PASSWORD,
 * RABBITMQ_VHOST (по умолчанию "/"), RABBITMQ_EXCHANGE (по умолчанию "inventory.events").
 */
class RabbitMQSettings {
public:
    RabbitMQSettings()
        : host_(env::getOrDefault("RABBITMQ_HOST", "rabbitmq"))
        , port_(env::getIntInRange("RABBITMQ_PORT", 5672, 1, 65535))
        , user_(env::getOrDefault("RABBITMQ_USER", "guest"))
        , password_(env::getOrDefault("RABBITMQ_PASSWORD", "guest"))
        , vhost_(env::getOrDefault("RABBITMQ_VHOST", "/"))
        , exchange_(env::getOrDefault("RABBITMQ_EXCHANGE", "inventory.events"))
    {}

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    const std::string& getUser() const { return user_; }
    const std::string& getPassword() const { return password_; }
    const std::string& getVhost() const { return vhost_; }
    const std::string& getExchange() const { return exchange_; }

private:
    std::string host_;
    int port_;
    std::string user_;
    std::string password_;
    std::string vhost_;
    std::string exchange_;
};

} // namespace inventory::settings
