#pragma once

#include "domain/StockEntry.hpp"
#include "domain/OperationResult.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Интерфейс регистрации позиций и инвентаризации
 */
class IStockCountService {
public:
    virtual ~IStockCountService() = default;

    /**
     * @brief Зарегистрировать позицию с начальным остатком
     */
    virtual domain::Result<domain::StockEntry> provision(
        int64_t productId,
        int64_t locationId,
        int64_t onHand,
        int64_t reserved,
        std::optional<domain::Timestamp> lastCheckedAt = std::nullopt
    ) = 0;

    /**
     * @brief Зафиксировать фактический остаток по итогам пересчёта
     *
     * @note Разница пишется в журнал как adjustment
     */
    virtual domain::Result<domain::StockEntry> recordCount(
        int64_t productId,
        int64_t locationId,
        int64_t countedOnHand,
        const std::string& actor,
        const std::string& notes = ""
    ) = 0;

    /**
     * @brief Текущий остаток позиции
     *
     * UNKNOWN_ENTITY если позиция не зарегистрирована,
     * STORAGE_FAILURE если хранилище недоступно.
     */
    virtual domain::Result<domain::StockEntry> get(int64_t productId, int64_t locationId) = 0;

    virtual domain::Result<std::vector<domain::StockEntry>> entriesForProduct(int64_t productId) = 0;
};

} // namespace inventory::ports::input
