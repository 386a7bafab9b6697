#pragma once

#include <string>

namespace inventory::ports::output {

/**
 * @brief Интерфейс для публикации аудит-событий
 *
 * Реализуется LoggingEventPublisher и RabbitMQEventPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "stock.moved")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace inventory::ports::output
