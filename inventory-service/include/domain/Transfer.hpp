#pragma once

#include "StockKey.hpp"
#include "Timestamp.hpp"
#include "enums/TransferStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Перемещение товара между складами
 *
 * Сток списывается с источника при dispatch и зачисляется
 * получателю при complete; между ними товар "в пути".
 */
struct Transfer {
    std::string id;
    int64_t productId = 0;
    int64_t sourceLocationId = 0;
    int64_t destinationLocationId = 0;
    int64_t quantity = 0;
    TransferStatus status = TransferStatus::PENDING;
    Timestamp requestedAt;
    std::optional<Timestamp> dispatchedAt;
    std::optional<Timestamp> completedAt;
    std::string notes;
    std::string createdBy;

    StockKey sourceKey() const { return StockKey{productId, sourceLocationId}; }
    StockKey destinationKey() const { return StockKey{productId, destinationLocationId}; }

    void updateStatus(TransferStatus newStatus) {
        status = newStatus;
        if (newStatus == TransferStatus::IN_TRANSIT) {
            dispatchedAt = Timestamp::now();
        } else if (newStatus == TransferStatus::COMPLETED) {
            completedAt = Timestamp::now();
        }
    }
};

} // namespace inventory::domain
