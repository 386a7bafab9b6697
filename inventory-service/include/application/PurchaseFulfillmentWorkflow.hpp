#pragma once

#include "ports/input/IPurchaseWorkflow.hpp"
#include "ports/output/IPurchaseOrderRepository.hpp"
#include "application/StockLedger.hpp"
#include "application/AuditEmitter.hpp"
#include "application/StorageGuard.hpp"
#include "utils/IdGenerator.hpp"
#include <KeyedMutex.hpp>
#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <utility>

namespace inventory::application {

/**
 * @brief Жизненный цикл заказа поставщику
 *
 * Реализует IPurchaseWorkflow. Сток меняется только в receive():
 * поступление зачисляется на склад приёмки (kind=purchase,
 * reference=po_item "<poId>:<lineId>").
 *
 * @example
 * ```
 * ordered=100
 * receive(60) → received=60, статус SHIPPED
 * receive(60) → OVER_RECEIPT, received=60, сток не меняется
 * receive(40) → received=100, статус RECEIVED
 * ```
 *
 * Все строки заказа в одной валюте: строка в другой валюте
 * отклоняется INVALID_ARGUMENT до сохранения.
 */
class PurchaseFulfillmentWorkflow : public ports::input::IPurchaseWorkflow {
public:
    PurchaseFulfillmentWorkflow(
        std::shared_ptr<StockLedger> ledger,
        std::shared_ptr<ports::output::IPurchaseOrderRepository> orderRepository,
        std::shared_ptr<AuditEmitter> audit
    ) : ledger_(std::move(ledger))
      , orderRepository_(std::move(orderRepository))
      , audit_(std::move(audit))
    {}

    static constexpr int kMaxIdAttempts = 3;

    domain::Result<domain::PurchaseOrder> createOrder(const domain::PurchaseOrderRequest& request) override {
        return guarded("createOrder", [&]() { return doCreateOrder(request); });
    }

    domain::Result<domain::PurchaseOrder> addLine(const std::string& poId,
                                                  const domain::PurchaseLineRequest& line,
                                                  const std::string& actor) override {
        return editDraft(poId, actor, [&](domain::PurchaseOrder& order) {
            int64_t lineId = order.nextLineId();
            auto check = validateLine(order, lineId, line.productId, line.quantityOrdered, line.unitPrice);
            if (check.isSuccess()) {
                order.lines.push_back(makeLine(lineId, line));
            }
            return check;
        });
    }

    domain::Result<domain::PurchaseOrder> updateLine(const std::string& poId,
                                                     int64_t lineId,
                                                     int64_t quantityOrdered,
                                                     const domain::Money& unitPrice,
                                                     const std::string& actor) override {
        return editDraft(poId, actor, [&](domain::PurchaseOrder& order) {
            auto* line = order.findLine(lineId);
            if (!line) {
                return unknownLine(poId, lineId);
            }
            auto check = validateLine(order, lineId, line->productId, quantityOrdered, unitPrice);
            if (check.isSuccess()) {
                line->quantityOrdered = quantityOrdered;
                line->unitPrice = unitPrice;
            }
            return check;
        });
    }

    domain::Result<domain::PurchaseOrder> removeLine(const std::string& poId,
                                                     int64_t lineId,
                                                     const std::string& actor) override {
        return editDraft(poId, actor, [&](domain::PurchaseOrder& order) {
            auto it = std::find_if(order.lines.begin(), order.lines.end(),
                [lineId](const domain::PurchaseLine& l) { return l.lineId == lineId; });
            if (it == order.lines.end()) {
                return unknownLine(poId, lineId);
            }
            order.lines.erase(it);
            return domain::OperationResult::ok();
        });
    }

    domain::Result<domain::PurchaseOrder> submit(const std::string& poId, const std::string& actor) override {
        return guarded("submit " + poId, [&]() {
            auto guard = orderLocks_.lock(poId);
            auto order = orderRepository_->findById(poId);
            if (!order) {
                return unknownOrder(poId);
            }
            if (order->status == domain::PurchaseOrderStatus::DRAFT && order->lines.empty()) {
                return domain::Result<domain::PurchaseOrder>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                    "Purchase order " + poId + " has no lines");
            }
            return transition(*order, {domain::PurchaseOrderStatus::DRAFT},
                              domain::PurchaseOrderStatus::SUBMITTED, actor);
        });
    }

    domain::Result<domain::PurchaseOrder> approve(const std::string& poId, const std::string& actor) override {
        return transitionById(poId, {domain::PurchaseOrderStatus::SUBMITTED},
                              domain::PurchaseOrderStatus::APPROVED, actor);
    }

    domain::Result<domain::PurchaseOrder> markShipped(const std::string& poId, const std::string& actor) override {
        return transitionById(poId, {domain::PurchaseOrderStatus::APPROVED},
                              domain::PurchaseOrderStatus::SHIPPED, actor);
    }

    domain::Result<domain::PurchaseOrder> cancel(const std::string& poId, const std::string& actor) override {
        return transitionById(poId,
                              {domain::PurchaseOrderStatus::DRAFT, domain::PurchaseOrderStatus::SUBMITTED,
                               domain::PurchaseOrderStatus::APPROVED, domain::PurchaseOrderStatus::SHIPPED},
                              domain::PurchaseOrderStatus::CANCELLED, actor);
    }

    domain::Result<domain::PurchaseOrder> receive(const std::string& poId,
                                                  int64_t locationId,
                                                  const std::vector<domain::Receipt>& receipts,
                                                  const std::string& actor) override {
        return guarded("receive " + poId, [&]() { return doReceive(poId, locationId, receipts, actor); });
    }

    std::optional<domain::PurchaseOrder> findById(const std::string& poId) override {
        return orderRepository_->findById(poId);
    }

private:
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<ports::output::IPurchaseOrderRepository> orderRepository_;
    std::shared_ptr<AuditEmitter> audit_;
    KeyedMutex<std::string> orderLocks_;

    template <typename Body>
    domain::Result<domain::PurchaseOrder> guarded(const std::string& operation, Body&& body) {
        return guardStorage<domain::Result<domain::PurchaseOrder>>("PurchaseWorkflow", operation,
                                                                   std::forward<Body>(body));
    }

    domain::Result<domain::PurchaseOrder> doCreateOrder(const domain::PurchaseOrderRequest& request) {
        domain::PurchaseOrder order;
        order.supplierId = request.supplierId;
        order.status = domain::PurchaseOrderStatus::DRAFT;
        order.orderDate = domain::Timestamp::now();
        order.expectedDeliveryDate = request.expectedDeliveryDate;
        order.notes = request.notes;
        order.createdBy = request.createdBy;

        for (const auto& lineRequest : request.lines) {
            int64_t lineId = order.nextLineId();
            auto check = validateLine(order, lineId, lineRequest.productId,
                                      lineRequest.quantityOrdered, lineRequest.unitPrice);
            if (!check.isSuccess()) {
                return domain::Result<domain::PurchaseOrder>::from(check);
            }
            order.lines.push_back(makeLine(lineId, lineRequest));
        }

        bool inserted = false;
        for (int attempt = 0; attempt < kMaxIdAttempts && !inserted; ++attempt) {
            order.id = utils::IdGenerator::purchaseOrderId();
            inserted = orderRepository_->insert(order);
            if (!inserted) {
                std::cerr << "[PurchaseWorkflow] Order id " << order.id << " already taken" << std::endl;
            }
        }
        if (!inserted) {
            return domain::Result<domain::PurchaseOrder>::failure(domain::ErrorCode::STORAGE_FAILURE,
                "Could not allocate a unique purchase order id");
        }

        std::cout << "[PurchaseWorkflow] Created " << order.id << " with " << order.lines.size()
                  << " line(s), total=" << order.total().toDouble() << std::endl;
        audit_->statusChanged("purchase_order", order.id, domain::toString(order.status), order.createdBy);
        return domain::Result<domain::PurchaseOrder>::success(order);
    }

    domain::Result<domain::PurchaseOrder> doReceive(const std::string& poId,
                                                    int64_t locationId,
                                                    const std::vector<domain::Receipt>& receipts,
                                                    const std::string& actor) {
        auto guard = orderLocks_.lock(poId);

        auto order = orderRepository_->findById(poId);
        if (!order) {
            return unknownOrder(poId);
        }
        if (order->status != domain::PurchaseOrderStatus::SHIPPED) {
            return invalidTransition(*order, domain::PurchaseOrderStatus::RECEIVED);
        }
        if (receipts.empty()) {
            return domain::Result<domain::PurchaseOrder>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "No receipts for purchase order " + poId);
        }

        // Проверяем все поступления до любого изменения стока
        for (const auto& receipt : receipts) {
            if (!order->findLine(receipt.lineId)) {
                return domain::Result<domain::PurchaseOrder>::from(unknownLine(poId, receipt.lineId));
            }
            if (receipt.quantity <= 0) {
                return lineFailure(domain::ErrorCode::INVALID_ARGUMENT, receipt.lineId,
                    "Receipt quantity must be positive");
            }
        }

        // Накопленное по строке не превышает outstanding()
        std::vector<std::pair<int64_t, int64_t>> totals;  // lineId → суммарное количество
        for (const auto& receipt : receipts) {
            const auto* line = order->findLine(receipt.lineId);
            auto it = std::find_if(totals.begin(), totals.end(),
                [&](const auto& t) { return t.first == receipt.lineId; });
            int64_t alreadyCounted = it == totals.end() ? 0 : it->second;

            if (receipt.quantity > line->outstanding() - alreadyCounted) {
                std::cout << "[PurchaseWorkflow] Over-receipt on " << poId << ":" << receipt.lineId
                          << " (received=" << line->quantityReceived << " + " << alreadyCounted
                          << " + " << receipt.quantity << " > ordered=" << line->quantityOrdered << ")" << std::endl;
                return lineFailure(domain::ErrorCode::OVER_RECEIPT, receipt.lineId,
                    "Receiving " + std::to_string(receipt.quantity) + " exceeds outstanding " +
                    std::to_string(line->outstanding() - alreadyCounted));
            }

            if (it == totals.end()) {
                totals.emplace_back(receipt.lineId, receipt.quantity);
            } else {
                it->second += receipt.quantity;
            }
        }

        std::vector<domain::StockKey> keys;
        for (const auto& [lineId, quantity] : totals) {
            keys.push_back(domain::StockKey{order->findLine(lineId)->productId, locationId});
        }

        auto scope = ledger_->lock(keys);

        std::vector<std::pair<domain::StockKey, int64_t>> applied;
        for (const auto& [lineId, quantity] : totals) {
            const auto* line = order->findLine(lineId);
            domain::StockKey key{line->productId, locationId};

            domain::MovementMeta meta;
            meta.kind = domain::JournalKind::PURCHASE;
            meta.referenceKind = domain::ReferenceKind::PO_LINE;
            meta.referenceId = poId + ":" + std::to_string(lineId);
            meta.actor = actor;

            auto result = ledger_->adjust(scope, key, quantity, meta);
            if (!result.isSuccess()) {
                compensate(scope, applied, poId, actor);
                auto failure = domain::Result<domain::PurchaseOrder>::from(result);
                failure.lineId = lineId;
                return failure;
            }
            applied.emplace_back(key, quantity);
        }

        for (const auto& [lineId, quantity] : totals) {
            order->findLine(lineId)->quantityReceived += quantity;
        }

        if (order->isFullyReceived()) {
            order->actualDeliveryDate = domain::Timestamp::now();
            order->updateStatus(domain::PurchaseOrderStatus::RECEIVED);
        } else {
            order->updatedAt = domain::Timestamp::now();
        }
        try {
            orderRepository_->save(*order);
        } catch (const std::exception& e) {
            // Сток и quantityReceived меняются вместе
            compensate(scope, applied, poId, actor);
            std::cerr << "[PurchaseWorkflow] Saving receipt of " << poId << " failed: " << e.what() << std::endl;
            return domain::Result<domain::PurchaseOrder>::failure(domain::ErrorCode::STORAGE_FAILURE,
                "Saving receipt of " + poId + " failed: " + e.what());
        }
        if (order->status == domain::PurchaseOrderStatus::RECEIVED) {
            audit_->statusChanged("purchase_order", order->id, domain::toString(order->status), actor);
        }

        std::cout << "[PurchaseWorkflow] Received " << totals.size() << " line(s) of " << poId
                  << " at location " << locationId << ", status=" << domain::toString(order->status) << std::endl;
        return domain::Result<domain::PurchaseOrder>::success(*order);
    }

    template <typename Edit>
    domain::Result<domain::PurchaseOrder> editDraft(const std::string& poId, const std::string& actor, Edit edit) {
        return guarded("edit " + poId, [&]() { return doEditDraft(poId, actor, edit); });
    }

    template <typename Edit>
    domain::Result<domain::PurchaseOrder> doEditDraft(const std::string& poId, const std::string& actor, Edit& edit) {
        auto guard = orderLocks_.lock(poId);

        auto order = orderRepository_->findById(poId);
        if (!order) {
            return unknownOrder(poId);
        }
        if (order->status != domain::PurchaseOrderStatus::DRAFT) {
            return domain::Result<domain::PurchaseOrder>::failure(domain::ErrorCode::INVALID_TRANSITION,
                "Lines of " + poId + " can only be edited in draft, status is " + domain::toString(order->status));
        }

        auto result = edit(*order);
        if (!result.isSuccess()) {
            return domain::Result<domain::PurchaseOrder>::from(result);
        }

        order->updatedAt = domain::Timestamp::now();
        orderRepository_->save(*order);
        std::cout << "[PurchaseWorkflow] " << poId << " edited by " << actor
                  << ", total=" << order->total().toDouble() << std::endl;
        return domain::Result<domain::PurchaseOrder>::success(*order);
    }

    domain::Result<domain::PurchaseOrder> transitionById(const std::string& poId,
                                                         std::initializer_list<domain::PurchaseOrderStatus> from,
                                                         domain::PurchaseOrderStatus to,
                                                         const std::string& actor) {
        return guarded(domain::toString(to) + " " + poId, [&]() {
            auto guard = orderLocks_.lock(poId);
            auto order = orderRepository_->findById(poId);
            if (!order) {
                return unknownOrder(poId);
            }
            return transition(*order, from, to, actor);
        });
    }

    domain::Result<domain::PurchaseOrder> transition(domain::PurchaseOrder& order,
                                                     std::initializer_list<domain::PurchaseOrderStatus> from,
                                                     domain::PurchaseOrderStatus to,
                                                     const std::string& actor) {
        if (std::find(from.begin(), from.end(), order.status) == from.end()) {
            return invalidTransition(order, to);
        }

        order.updateStatus(to);
        orderRepository_->save(order);

        std::cout << "[PurchaseWorkflow] " << order.id << " -> " << domain::toString(to) << std::endl;
        audit_->statusChanged("purchase_order", order.id, domain::toString(to), actor);
        return domain::Result<domain::PurchaseOrder>::success(order);
    }

    void compensate(const StockLedger::Scope& scope,
                    const std::vector<std::pair<domain::StockKey, int64_t>>& applied,
                    const std::string& poId,
                    const std::string& actor) {
        for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
            domain::MovementMeta meta;
            meta.kind = domain::JournalKind::ADJUSTMENT;
            meta.referenceKind = domain::ReferenceKind::PO_LINE;
            meta.referenceId = poId;
            meta.actor = actor;
            meta.notes = "compensation";

            auto result = ledger_->adjust(scope, it->first, -it->second, meta);
            if (!result.isSuccess()) {
                std::cerr << "[PurchaseWorkflow] Compensation failed for " << it->first.toString()
                          << ": " << result.message << std::endl;
            }
        }
    }

    static domain::PurchaseLine makeLine(int64_t lineId, const domain::PurchaseLineRequest& request) {
        domain::PurchaseLine line;
        line.lineId = lineId;
        line.productId = request.productId;
        line.quantityOrdered = request.quantityOrdered;
        line.unitPrice = request.unitPrice;
        return line;
    }

    /**
     * @brief Проверить строку перед записью в заказ
     *
     * Количество > 0; цена в той же валюте, что и остальные строки
     * (строка lineId сама с собой не сравнивается).
     */
    static domain::OperationResult validateLine(const domain::PurchaseOrder& order,
                                                int64_t lineId,
                                                int64_t productId,
                                                int64_t quantityOrdered,
                                                const domain::Money& unitPrice) {
        if (quantityOrdered <= 0) {
            auto result = domain::OperationResult::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Ordered quantity must be positive for product " + std::to_string(productId));
            result.lineId = lineId;
            return result;
        }
        for (const auto& other : order.lines) {
            if (other.lineId != lineId && other.unitPrice.currency != unitPrice.currency) {
                auto result = domain::OperationResult::failure(domain::ErrorCode::INVALID_ARGUMENT,
                    "Line " + std::to_string(lineId) + " is priced in " + unitPrice.currency +
                    ", order lines are in " + other.unitPrice.currency);
                result.lineId = lineId;
                return result;
            }
        }
        return domain::OperationResult::ok();
    }

    static domain::OperationResult unknownLine(const std::string& poId, int64_t lineId) {
        auto result = domain::OperationResult::failure(domain::ErrorCode::UNKNOWN_ENTITY,
            "Line " + std::to_string(lineId) + " not found in " + poId);
        result.lineId = lineId;
        return result;
    }

    static domain::Result<domain::PurchaseOrder> lineFailure(domain::ErrorCode code, int64_t lineId,
                                                             const std::string& message) {
        auto result = domain::Result<domain::PurchaseOrder>::failure(code, message);
        result.lineId = lineId;
        return result;
    }

    static domain::Result<domain::PurchaseOrder> unknownOrder(const std::string& poId) {
        return domain::Result<domain::PurchaseOrder>::failure(domain::ErrorCode::UNKNOWN_ENTITY,
            "Purchase order not found: " + poId);
    }

    static domain::Result<domain::PurchaseOrder> invalidTransition(const domain::PurchaseOrder& order,
                                                                   domain::PurchaseOrderStatus to) {
        return domain::Result<domain::PurchaseOrder>::failure(domain::ErrorCode::INVALID_TRANSITION,
            "Cannot move " + order.id + " from " + domain::toString(order.status) + " to " + domain::toString(to));
    }
};

} // namespace inventory::application
