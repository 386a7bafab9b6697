#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/PurchaseOrderStatus.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Строка заказа поставщику
 *
 * Инвариант: 0 <= quantityReceived <= quantityOrdered.
 */
struct PurchaseLine {
    int64_t lineId = 0;
    int64_t productId = 0;
    int64_t quantityOrdered = 0;
    int64_t quantityReceived = 0;
    Money unitPrice;

    Money lineTotal() const { return unitPrice * quantityOrdered; }
    int64_t outstanding() const { return quantityOrdered - quantityReceived; }
    bool isFullyReceived() const { return quantityReceived == quantityOrdered; }
};

/**
 * @brief Заказ поставщику (purchase order)
 *
 * total() считается по строкам, поэтому после любого редактирования
 * строк сумма заказа согласована с ними.
 */
class PurchaseOrder {
public:
    std::string id;
    int64_t supplierId = 0;
    PurchaseOrderStatus status = PurchaseOrderStatus::DRAFT;
    std::vector<PurchaseLine> lines;
    Timestamp orderDate;
    std::optional<Timestamp> expectedDeliveryDate;
    std::optional<Timestamp> actualDeliveryDate;
    std::string notes;
    std::string createdBy;
    Timestamp updatedAt;

    Money total() const {
        Money sum(0, lines.empty() ? "USD" : lines.front().unitPrice.currency);
        for (const auto& line : lines) {
            sum = sum + line.lineTotal();
        }
        return sum;
    }

    PurchaseLine* findLine(int64_t lineId) {
        auto it = std::find_if(lines.begin(), lines.end(),
            [lineId](const PurchaseLine& l) { return l.lineId == lineId; });
        return it != lines.end() ? &*it : nullptr;
    }

    const PurchaseLine* findLine(int64_t lineId) const {
        auto it = std::find_if(lines.begin(), lines.end(),
            [lineId](const PurchaseLine& l) { return l.lineId == lineId; });
        return it != lines.end() ? &*it : nullptr;
    }

    bool isFullyReceived() const {
        return !lines.empty() && std::all_of(lines.begin(), lines.end(),
            [](const PurchaseLine& l) { return l.isFullyReceived(); });
    }

    int64_t nextLineId() const {
        int64_t maxId = 0;
        for (const auto& line : lines) maxId = std::max(maxId, line.lineId);
        return maxId + 1;
    }

    void updateStatus(PurchaseOrderStatus newStatus) {
        status = newStatus;
        updatedAt = Timestamp::now();
    }
};

} // namespace inventory::domain
