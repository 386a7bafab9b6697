#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Строка нового заказа поставщику
 */
struct PurchaseLineRequest {
    int64_t productId = 0;
    int64_t quantityOrdered = 0;    ///< > 0
    Money unitPrice;
};

/**
 * @brief Запрос на создание заказа поставщику (в статусе DRAFT)
 */
struct PurchaseOrderRequest {
    int64_t supplierId = 0;
    std::vector<PurchaseLineRequest> lines;
    std::optional<Timestamp> expectedDeliveryDate;
    std::string notes;
    std::string createdBy;
};

/**
 * @brief Поступление по строке заказа
 */
struct Receipt {
    int64_t lineId = 0;
    int64_t quantity = 0;
};

} // namespace inventory::domain
