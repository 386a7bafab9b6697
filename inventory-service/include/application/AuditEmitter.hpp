#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "domain/JournalEntry.hpp"
#include "domain/StockEntry.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace inventory::application {

/**
 * @brief Формирует и публикует аудит-события движка
 *
 * Публикация идёт после фиксации изменения. Ошибка публикации
 * логируется и не влияет на результат операции: хранение и
 * выборка аудит-лога — забота внешнего потребителя.
 *
 * Routing keys:
 * - stock.moved — каждая запись журнала
 * - stock.reserved / stock.released — изменение резерва
 * - transfer.<status>, purchase_order.<status>, sales_order.<status>
 */
class AuditEmitter {
public:
    explicit AuditEmitter(std::shared_ptr<ports::output::IEventPublisher> publisher)
        : publisher_(std::move(publisher))
    {}

    void stockMoved(const domain::JournalEntry& entry, const domain::StockEntry& after) {
        nlohmann::json event;
        event["journal_id"] = entry.id;
        event["product_id"] = entry.key.productId;
        event["location_id"] = entry.key.locationId;
        event["kind"] = domain::toString(entry.kind);
        event["delta"] = entry.delta;
        event["reference_type"] = domain::toString(entry.referenceKind);
        event["reference_id"] = entry.referenceId;
        event["actor"] = entry.actor;
        event["on_hand"] = after.onHand;
        event["reserved"] = after.reserved;
        event["timestamp"] = entry.timestamp.toString();
        emit("stock.moved", event);
    }

    void reservationChanged(const std::string& routingKey, const domain::StockEntry& after, int64_t quantity) {
        nlohmann::json event;
        event["product_id"] = after.productId;
        event["location_id"] = after.locationId;
        event["quantity"] = quantity;
        event["on_hand"] = after.onHand;
        event["reserved"] = after.reserved;
        event["available"] = after.available();
        event["timestamp"] = domain::Timestamp::now().toString();
        emit(routingKey, event);
    }

    /**
     * @brief Смена статуса сущности ("transfer", "purchase_order", "sales_order")
     */
    void statusChanged(const std::string& entityType,
                       const std::string& entityId,
                       const std::string& status,
                       const std::string& actor) {
        nlohmann::json event;
        event["entity_type"] = entityType;
        event["entity_id"] = entityId;
        event["status"] = status;
        event["actor"] = actor;
        event["timestamp"] = domain::Timestamp::now().toString();
        emit(entityType + "." + status, event);
    }

private:
    std::shared_ptr<ports::output::IEventPublisher> publisher_;

    void emit(const std::string& routingKey, const nlohmann::json& event) {
        if (!publisher_) {
            return;
        }
        try {
            publisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[AuditEmitter] Failed to publish " << routingKey << ": " << e.what() << std::endl;
        }
    }
};

} // namespace inventory::application
