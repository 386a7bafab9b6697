#pragma once

#include "domain/PurchaseOrder.hpp"
#include "domain/PurchaseOrderRequest.hpp"
#include "domain/OperationResult.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Интерфейс жизненного цикла заказа поставщику
 *
 * DRAFT → SUBMITTED → APPROVED → SHIPPED → RECEIVED;
 * CANCELLED из любого незавершённого статуса.
 */
class IPurchaseWorkflow {
public:
    virtual ~IPurchaseWorkflow() = default;

    virtual domain::Result<domain::PurchaseOrder> createOrder(const domain::PurchaseOrderRequest& request) = 0;

    /**
     * @name Редактирование строк (только DRAFT)
     */
    ///@{
    virtual domain::Result<domain::PurchaseOrder> addLine(const std::string& poId,
                                                          const domain::PurchaseLineRequest& line,
                                                          const std::string& actor) = 0;

    virtual domain::Result<domain::PurchaseOrder> updateLine(const std::string& poId,
                                                             int64_t lineId,
                                                             int64_t quantityOrdered,
                                                             const domain::Money& unitPrice,
                                                             const std::string& actor) = 0;

    virtual domain::Result<domain::PurchaseOrder> removeLine(const std::string& poId,
                                                             int64_t lineId,
                                                             const std::string& actor) = 0;
    ///@}

    virtual domain::Result<domain::PurchaseOrder> submit(const std::string& poId, const std::string& actor) = 0;

    virtual domain::Result<domain::PurchaseOrder> approve(const std::string& poId, const std::string& actor) = 0;

    virtual domain::Result<domain::PurchaseOrder> markShipped(const std::string& poId, const std::string& actor) = 0;

    virtual domain::Result<domain::PurchaseOrder> cancel(const std::string& poId, const std::string& actor) = 0;

    /**
     * @brief Принять поставку на склад
     *
     * @param receipts Количества по строкам; повторы строки суммируются
     * @return OVER_RECEIPT если received + qty > ordered для любой строки,
     *         при этом ничего не применяется
     * @note Частичная приёмка оставляет заказ в SHIPPED
     */
    virtual domain::Result<domain::PurchaseOrder> receive(const std::string& poId,
                                                          int64_t locationId,
                                                          const std::vector<domain::Receipt>& receipts,
                                                          const std::string& actor) = 0;

    virtual std::optional<domain::PurchaseOrder> findById(const std::string& poId) = 0;
};

} // namespace inventory::ports::input
