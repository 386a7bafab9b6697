#pragma once

#include "StockKey.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>

namespace inventory::domain {

/**
 * @brief Складская позиция: остаток товара на складе
 *
 * - onHand: физически на складе
 * - reserved: удерживается под открытые заказы
 * - available = onHand - reserved: вычисляется, не хранится
 *
 * Инварианты (поддерживает StockLedger):
 * ```
 * onHand >= 0
 * 0 <= reserved <= onHand
 * onHand - initialOnHand == сумма delta в журнале
 * ```
 *
 * @example
 * ```
 * onHand=150, reserved=25 → available=125
 * reserve(30)  → reserved=55, available=95
 * reserve(200) → INSUFFICIENT_AVAILABLE, ничего не меняется
 * ```
 */
struct StockEntry {
    int64_t productId = 0;
    int64_t locationId = 0;
    int64_t onHand = 0;
    int64_t reserved = 0;
    int64_t initialOnHand = 0;              ///< Остаток на момент регистрации позиции
    std::optional<Timestamp> lastCheckedAt; ///< Дата последней инвентаризации

    StockKey key() const { return StockKey{productId, locationId}; }

    int64_t available() const { return onHand - reserved; }

    bool isConsistent() const {
        return onHand >= 0 && reserved >= 0 && reserved <= onHand;
    }

    static StockEntry empty(const StockKey& key) {
        StockEntry e;
        e.productId = key.productId;
        e.locationId = key.locationId;
        return e;
    }

    bool operator==(const StockEntry& other) const {
        return productId == other.productId && locationId == other.locationId &&
               onHand == other.onHand && reserved == other.reserved &&
               initialOnHand == other.initialOnHand;
    }
};

} // namespace inventory::domain
