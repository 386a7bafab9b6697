#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/SalesOrderStatus.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Строка заказа покупателя
 */
struct SalesLine {
    int64_t lineId = 0;
    int64_t productId = 0;
    int64_t quantity = 0;
    Money unitPrice;
    std::optional<int64_t> preferredLocationId;  ///< Если задан, резерв только с этого склада
    int64_t quantityReturned = 0;

    Money lineTotal() const { return unitPrice * quantity; }
};

/**
 * @brief Заказ покупателя (sales order)
 */
class SalesOrder {
public:
    std::string id;
    int64_t customerId = 0;
    SalesOrderStatus status = SalesOrderStatus::PENDING;
    std::vector<SalesLine> lines;
    Timestamp orderDate;
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

    SalesLine* findLine(int64_t lineId) {
        auto it = std::find_if(lines.begin(), lines.end(),
            [lineId](const SalesLine& l) { return l.lineId == lineId; });
        return it != lines.end() ? &*it : nullptr;
    }

    const SalesLine* findLine(int64_t lineId) const {
        auto it = std::find_if(lines.begin(), lines.end(),
            [lineId](const SalesLine& l) { return l.lineId == lineId; });
        return it != lines.end() ? &*it : nullptr;
    }

    void updateStatus(SalesOrderStatus newStatus) {
        status = newStatus;
        updatedAt = Timestamp::now();
    }
};

} // namespace inventory::domain
