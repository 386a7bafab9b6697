#pragma once

#include "domain/SalesOrder.hpp"
#include "domain/SalesOrderRequest.hpp"
#include "domain/OperationResult.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Интерфейс жизненного цикла заказа покупателя
 *
 * PENDING → PROCESSING → SHIPPED → DELIVERED;
 * CANCELLED из PENDING | PROCESSING.
 */
class ISalesWorkflow {
public:
    virtual ~ISalesWorkflow() = default;

    virtual domain::Result<domain::SalesOrder> createOrder(const domain::SalesOrderRequest& request) = 0;

    /**
     * @brief PENDING → PROCESSING, резерв всех строк
     *
     * @return PARTIAL_RESERVATION_FAILURE с lineId строки-виновника;
     *         заказ остаётся PENDING
     */
    virtual domain::Result<domain::SalesOrder> confirm(const std::string& orderId, const std::string& actor) = 0;

    /**
     * @brief PROCESSING → SHIPPED, списание зарезервированного
     */
    virtual domain::Result<domain::SalesOrder> ship(const std::string& orderId, const std::string& actor) = 0;

    virtual domain::Result<domain::SalesOrder> deliver(const std::string& orderId, const std::string& actor) = 0;

    /**
     * @brief PENDING | PROCESSING → CANCELLED, снятие резервов
     * @note onHand не меняется
     */
    virtual domain::Result<domain::SalesOrder> cancel(const std::string& orderId, const std::string& actor) = 0;

    /**
     * @brief Возврат по строке отгруженного заказа (journal kind = return)
     */
    virtual domain::Result<domain::SalesOrder> recordReturn(const std::string& orderId,
                                                            int64_t lineId,
                                                            int64_t locationId,
                                                            int64_t quantity,
                                                            const std::string& actor) = 0;

    virtual std::optional<domain::SalesOrder> findById(const std::string& orderId) = 0;

    virtual std::vector<domain::SalesOrder> findByStatus(domain::SalesOrderStatus status) = 0;
};

} // namespace inventory::ports::input
