#pragma once

#include "StockKey.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Строка заказа, которую нужно зарезервировать
 */
struct ReservationLine {
    int64_t lineId = 0;
    int64_t productId = 0;
    int64_t quantity = 0;
    std::optional<int64_t> locationId;  ///< Пусто — склад выбирает ReservationManager
};

/**
 * @brief Удерживаемое количество под строку заказа на конкретном складе
 */
struct Reservation {
    std::string orderId;
    int64_t lineId = 0;
    StockKey key;
    int64_t quantity = 0;

    /**
     * @brief Ссылка для журнала: "<orderId>:<lineId>"
     */
    std::string lineReference() const {
        return orderId + ":" + std::to_string(lineId);
    }
};

} // namespace inventory::domain
