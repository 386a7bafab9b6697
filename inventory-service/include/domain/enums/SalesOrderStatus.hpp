#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Статус заказа покупателя
 *
 * PENDING → PROCESSING → SHIPPED → DELIVERED,
 * CANCELLED только из PENDING | PROCESSING.
 */
enum class SalesOrderStatus {
    PENDING,      ///< Создан, ничего не зарезервировано
    PROCESSING,   ///< Товар зарезервирован
    SHIPPED,      ///< Резерв списан со склада
    DELIVERED,
    CANCELLED
};

inline std::string toString(SalesOrderStatus status) {
    switch (status) {
        case SalesOrderStatus::PENDING:    return "pending";
        case SalesOrderStatus::PROCESSING: return "processing";
        case SalesOrderStatus::SHIPPED:    return "shipped";
        case SalesOrderStatus::DELIVERED:  return "delivered";
        case SalesOrderStatus::CANCELLED:  return "cancelled";
    }
    return "unknown";
}

inline SalesOrderStatus salesOrderStatusFromString(const std::string& str) {
    if (str == "pending")    return SalesOrderStatus::PENDING;
    if (str == "processing") return SalesOrderStatus::PROCESSING;
    if (str == "shipped")    return SalesOrderStatus::SHIPPED;
    if (str == "delivered")  return SalesOrderStatus::DELIVERED;
    if (str == "cancelled")  return SalesOrderStatus::CANCELLED;
    throw std::invalid_argument("Unknown SalesOrderStatus: " + str);
}

inline bool isFinalStatus(SalesOrderStatus status) {
    return status == SalesOrderStatus::DELIVERED ||
           status == SalesOrderStatus::CANCELLED;
}

} // namespace inventory::domain
