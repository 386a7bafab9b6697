#pragma once

#include "Money.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

struct SalesLineRequest {
    int64_t productId = 0;
    int64_t quantity = 0;                        ///< > 0
    Money unitPrice;
    std::optional<int64_t> preferredLocationId;
};

/**
 * @brief Запрос на создание заказа покупателя (в статусе PENDING)
 */
struct SalesOrderRequest {
    int64_t customerId = 0;
    std::vector<SalesLineRequest> lines;
    std::string notes;
    std::string createdBy;
};

} // namespace inventory::domain
