#pragma once

#include "domain/Transfer.hpp"
#include "domain/OperationResult.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Интерфейс перемещений товара между складами
 *
 * Input Port. Сток списывается с источника при dispatch
 * и зачисляется получателю при complete.
 */
class ITransferCoordinator {
public:
    virtual ~ITransferCoordinator() = default;

    /**
     * @brief Создать перемещение в статусе PENDING
     *
     * @return Transfer или INVALID_ARGUMENT / UNKNOWN_ENTITY / INSUFFICIENT_AVAILABLE
     * @note Сток не двигается
     */
    virtual domain::Result<domain::Transfer> create(
        int64_t productId,
        int64_t sourceLocationId,
        int64_t destinationLocationId,
        int64_t quantity,
        const std::string& actor,
        const std::string& notes = ""
    ) = 0;

    /**
     * @brief PENDING → IN_TRANSIT, списание с источника (transfer_out)
     */
    virtual domain::Result<domain::Transfer> dispatch(const std::string& transferId, const std::string& actor) = 0;

    /**
     * @brief IN_TRANSIT → COMPLETED, зачисление получателю (transfer_in)
     *
     * @note Для COMPLETED перемещения — успешный no-op
     * @note Если зачисление не удалось, перемещение остаётся IN_TRANSIT
     *       и повторный вызов безопасен
     */
    virtual domain::Result<domain::Transfer> complete(const std::string& transferId, const std::string& actor) = 0;

    /**
     * @brief PENDING | IN_TRANSIT → CANCELLED
     *
     * @note Для IN_TRANSIT списанное количество возвращается на источник
     */
    virtual domain::Result<domain::Transfer> cancel(const std::string& transferId, const std::string& actor) = 0;

    virtual std::optional<domain::Transfer> findById(const std::string& transferId) = 0;

    virtual std::vector<domain::Transfer> findByStatus(domain::TransferStatus status) = 0;
};

} // namespace inventory::ports::input
