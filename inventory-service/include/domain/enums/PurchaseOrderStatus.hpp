#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Статус заказа поставщику
 *
 * DRAFT → SUBMITTED → APPROVED → SHIPPED → RECEIVED,
 * CANCELLED из любого нефинального статуса.
 */
enum class PurchaseOrderStatus {
    DRAFT,
    SUBMITTED,
    APPROVED,
    SHIPPED,     ///< В пути; частичная приёмка оставляет заказ здесь
    RECEIVED,
    CANCELLED
};

inline std::string toString(PurchaseOrderStatus status) {
    switch (status) {
        case PurchaseOrderStatus::DRAFT:     return "draft";
        case PurchaseOrderStatus::SUBMITTED: return "submitted";
        case PurchaseOrderStatus::APPROVED:  return "approved";
        case PurchaseOrderStatus::SHIPPED:   return "shipped";
        case PurchaseOrderStatus::RECEIVED:  return "received";
        case PurchaseOrderStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline PurchaseOrderStatus purchaseOrderStatusFromString(const std::string& str) {
    if (str == "draft")     return PurchaseOrderStatus::DRAFT;
    if (str == "submitted") return PurchaseOrderStatus::SUBMITTED;
    if (str == "approved")  return PurchaseOrderStatus::APPROVED;
    if (str == "shipped")   return PurchaseOrderStatus::SHIPPED;
    if (str == "received")  return PurchaseOrderStatus::RECEIVED;
    if (str == "cancelled") return PurchaseOrderStatus::CANCELLED;
    throw std::invalid_argument("Unknown PurchaseOrderStatus: " + str);
}

inline bool isFinalStatus(PurchaseOrderStatus status) {
    return status == PurchaseOrderStatus::RECEIVED ||
           status == PurchaseOrderStatus::CANCELLED;
}

} // namespace inventory::domain
