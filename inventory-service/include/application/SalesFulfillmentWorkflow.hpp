#pragma once

#include "ports/input/ISalesWorkflow.hpp"
#include "ports/output/ISalesOrderRepository.hpp"
#include "application/StockLedger.hpp"
#include "application/ReservationManager.hpp"
#include "application/AuditEmitter.hpp"
#include "application/StorageGuard.hpp"
#include "utils/IdGenerator.hpp"
#include <KeyedMutex.hpp>
#include <iostream>
#include <memory>
#include <utility>

namespace inventory::application {

/**
 * @brief Жизненный цикл заказа покупателя
 *
 * Реализует ISalesWorkflow, координирует работу между:
 * - ReservationManager (резерв при confirm, списание при ship, снятие при cancel)
 * - StockLedger (возвраты)
 * - ISalesOrderRepository (хранение заказов)
 *
 * Сбой хранилища в любой операции возвращается как STORAGE_FAILURE.
 */
class SalesFulfillmentWorkflow : public ports::input::ISalesWorkflow {
public:
    SalesFulfillmentWorkflow(
        std::shared_ptr<StockLedger> ledger,
        std::shared_ptr<ReservationManager> reservations,
        std::shared_ptr<ports::output::ISalesOrderRepository> orderRepository,
        std::shared_ptr<AuditEmitter> audit
    ) : ledger_(std::move(ledger))
      , reservations_(std::move(reservations))
      , orderRepository_(std::move(orderRepository))
      , audit_(std::move(audit))
    {}

    static constexpr int kMaxIdAttempts = 3;

    domain::Result<domain::SalesOrder> createOrder(const domain::SalesOrderRequest& request) override {
        return guarded("createOrder", [&]() { return doCreateOrder(request); });
    }

    domain::Result<domain::SalesOrder> confirm(const std::string& orderId, const std::string& actor) override {
        return guarded("confirm " + orderId, [&]() { return doConfirm(orderId, actor); });
    }

    domain::Result<domain::SalesOrder> ship(const std::string& orderId, const std::string& actor) override {
        return guarded("ship " + orderId, [&]() { return doShip(orderId, actor); });
    }

    domain::Result<domain::SalesOrder> deliver(const std::string& orderId, const std::string& actor) override {
        return guarded("deliver " + orderId, [&]() { return doDeliver(orderId, actor); });
    }

    domain::Result<domain::SalesOrder> cancel(const std::string& orderId, const std::string& actor) override {
        return guarded("cancel " + orderId, [&]() { return doCancel(orderId, actor); });
    }

    domain::Result<domain::SalesOrder> recordReturn(const std::string& orderId,
                                                    int64_t lineId,
                                                    int64_t locationId,
                                                    int64_t quantity,
                                                    const std::string& actor) override {
        return guarded("recordReturn " + orderId, [&]() {
            return doRecordReturn(orderId, lineId, locationId, quantity, actor);
        });
    }

    std::optional<domain::SalesOrder> findById(const std::string& orderId) override {
        return orderRepository_->findById(orderId);
    }

    std::vector<domain::SalesOrder> findByStatus(domain::SalesOrderStatus status) override {
        return orderRepository_->findByStatus(status);
    }

private:
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<ReservationManager> reservations_;
    std::shared_ptr<ports::output::ISalesOrderRepository> orderRepository_;
    std::shared_ptr<AuditEmitter> audit_;
    KeyedMutex<std::string> orderLocks_;

    template <typename Body>
    domain::Result<domain::SalesOrder> guarded(const std::string& operation, Body&& body) {
        return guardStorage<domain::Result<domain::SalesOrder>>("SalesWorkflow", operation,
                                                                std::forward<Body>(body));
    }

    domain::Result<domain::SalesOrder> doCreateOrder(const domain::SalesOrderRequest& request) {
        if (request.lines.empty()) {
            return domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Sales order must have at least one line");
        }

        domain::SalesOrder order;
        order.customerId = request.customerId;
        order.status = domain::SalesOrderStatus::PENDING;
        order.orderDate = domain::Timestamp::now();
        order.notes = request.notes;
        order.createdBy = request.createdBy;

        // Все строки заказа в одной валюте
        const auto& orderCurrency = request.lines.front().unitPrice.currency;
        int64_t nextLineId = 1;
        for (const auto& lineRequest : request.lines) {
            if (lineRequest.quantity <= 0) {
                auto result = domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                    "Quantity must be positive for product " + std::to_string(lineRequest.productId));
                result.lineId = nextLineId;
                return result;
            }
            if (lineRequest.unitPrice.currency != orderCurrency) {
                auto result = domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                    "Line " + std::to_string(nextLineId) + " is priced in " + lineRequest.unitPrice.currency +
                    ", order lines are in " + orderCurrency);
                result.lineId = nextLineId;
                return result;
            }
            domain::SalesLine line;
            line.lineId = nextLineId++;
            line.productId = lineRequest.productId;
            line.quantity = lineRequest.quantity;
            line.unitPrice = lineRequest.unitPrice;
            line.preferredLocationId = lineRequest.preferredLocationId;
            order.lines.push_back(line);
        }

        bool inserted = false;
        for (int attempt = 0; attempt < kMaxIdAttempts && !inserted; ++attempt) {
            order.id = utils::IdGenerator::salesOrderId();
            inserted = orderRepository_->insert(order);
            if (!inserted) {
                std::cerr << "[SalesWorkflow] Order id " << order.id << " already taken" << std::endl;
            }
        }
        if (!inserted) {
            return domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::STORAGE_FAILURE,
                "Could not allocate a unique sales order id");
        }

        std::cout << "[SalesWorkflow] Created " << order.id << " with " << order.lines.size()
                  << " line(s), total=" << order.total().toDouble() << std::endl;
        audit_->statusChanged("sales_order", order.id, domain::toString(order.status), order.createdBy);
        return domain::Result<domain::SalesOrder>::success(order);
    }

    domain::Result<domain::SalesOrder> doConfirm(const std::string& orderId, const std::string& actor) {
        auto guard = orderLocks_.lock(orderId);

        auto order = orderRepository_->findById(orderId);
        if (!order) {
            return unknownOrder(orderId);
        }
        if (order->status != domain::SalesOrderStatus::PENDING) {
            return invalidTransition(*order, domain::SalesOrderStatus::PROCESSING);
        }

        std::vector<domain::ReservationLine> lines;
        for (const auto& line : order->lines) {
            domain::ReservationLine request;
            request.lineId = line.lineId;
            request.productId = line.productId;
            request.quantity = line.quantity;
            request.locationId = line.preferredLocationId;
            lines.push_back(request);
        }

        auto reserved = reservations_->reserveForOrder(orderId, lines);
        if (!reserved.isSuccess()) {
            std::cout << "[SalesWorkflow] Confirm " << orderId << " failed, order stays pending: "
                      << reserved.message << std::endl;
            return domain::Result<domain::SalesOrder>::from(reserved);
        }

        return moveTo(*order, domain::SalesOrderStatus::PROCESSING, actor);
    }

    domain::Result<domain::SalesOrder> doShip(const std::string& orderId, const std::string& actor) {
        auto guard = orderLocks_.lock(orderId);

        auto order = orderRepository_->findById(orderId);
        if (!order) {
            return unknownOrder(orderId);
        }
        if (order->status != domain::SalesOrderStatus::PROCESSING) {
            return invalidTransition(*order, domain::SalesOrderStatus::SHIPPED);
        }

        auto committed = reservations_->commitForOrder(orderId, actor);
        if (!committed.isSuccess()) {
            std::cerr << "[SalesWorkflow] Ship " << orderId << " failed: " << committed.message << std::endl;
            return domain::Result<domain::SalesOrder>::from(committed);
        }

        return moveTo(*order, domain::SalesOrderStatus::SHIPPED, actor);
    }

    domain::Result<domain::SalesOrder> doDeliver(const std::string& orderId, const std::string& actor) {
        auto guard = orderLocks_.lock(orderId);

        auto order = orderRepository_->findById(orderId);
        if (!order) {
            return unknownOrder(orderId);
        }
        if (order->status != domain::SalesOrderStatus::SHIPPED) {
            return invalidTransition(*order, domain::SalesOrderStatus::DELIVERED);
        }

        return moveTo(*order, domain::SalesOrderStatus::DELIVERED, actor);
    }

    domain::Result<domain::SalesOrder> doCancel(const std::string& orderId, const std::string& actor) {
        auto guard = orderLocks_.lock(orderId);

        auto order = orderRepository_->findById(orderId);
        if (!order) {
            return unknownOrder(orderId);
        }
        if (order->status != domain::SalesOrderStatus::PENDING &&
            order->status != domain::SalesOrderStatus::PROCESSING) {
            return invalidTransition(*order, domain::SalesOrderStatus::CANCELLED);
        }

        auto released = reservations_->releaseForOrder(orderId);
        if (!released.isSuccess()) {
            std::cerr << "[SalesWorkflow] Cancel " << orderId << " failed: " << released.message << std::endl;
            return domain::Result<domain::SalesOrder>::from(released);
        }

        return moveTo(*order, domain::SalesOrderStatus::CANCELLED, actor);
    }

    domain::Result<domain::SalesOrder> doRecordReturn(const std::string& orderId,
                                                      int64_t lineId,
                                                      int64_t locationId,
                                                      int64_t quantity,
                                                      const std::string& actor) {
        auto guard = orderLocks_.lock(orderId);

        auto order = orderRepository_->findById(orderId);
        if (!order) {
            return unknownOrder(orderId);
        }
        if (order->status != domain::SalesOrderStatus::SHIPPED &&
            order->status != domain::SalesOrderStatus::DELIVERED) {
            return domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::INVALID_TRANSITION,
                "Returns are accepted only for shipped or delivered orders, " + orderId +
                " is " + domain::toString(order->status));
        }

        auto* line = order->findLine(lineId);
        if (!line) {
            auto result = domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::UNKNOWN_ENTITY,
                "Line " + std::to_string(lineId) + " not found in " + orderId);
            result.lineId = lineId;
            return result;
        }
        if (quantity <= 0 || quantity > line->quantity - line->quantityReturned) {
            auto result = domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Return of " + std::to_string(quantity) + " on line " + std::to_string(lineId) +
                " exceeds shipped " + std::to_string(line->quantity) +
                " (already returned " + std::to_string(line->quantityReturned) + ")");
            result.lineId = lineId;
            return result;
        }

        domain::MovementMeta meta;
        meta.kind = domain::JournalKind::RETURN;
        meta.referenceKind = domain::ReferenceKind::SALE_LINE;
        meta.referenceId = orderId + ":" + std::to_string(lineId);
        meta.actor = actor;

        domain::StockKey key{line->productId, locationId};
        auto scope = ledger_->lock({key});
        auto credited = ledger_->adjust(scope, key, quantity, meta);
        if (!credited.isSuccess()) {
            return domain::Result<domain::SalesOrder>::from(credited);
        }

        line->quantityReturned += quantity;
        order->updatedAt = domain::Timestamp::now();
        try {
            orderRepository_->save(*order);
        } catch (const std::exception& e) {
            // Сток и quantityReturned меняются вместе
            meta.kind = domain::JournalKind::ADJUSTMENT;
            meta.notes = "compensation";
            auto reverted = ledger_->adjust(scope, key, -quantity, meta);
            if (!reverted.isSuccess()) {
                std::cerr << "[SalesWorkflow] Compensation failed for " << key.toString()
                          << ": " << reverted.message << std::endl;
            }
            std::cerr << "[SalesWorkflow] Saving return on " << orderId << " failed: " << e.what() << std::endl;
            return domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::STORAGE_FAILURE,
                "Saving return on " + orderId + " failed: " + e.what());
        }

        std::cout << "[SalesWorkflow] Return of " << quantity << " on " << orderId << ":" << lineId
                  << " to location " << locationId << std::endl;
        return domain::Result<domain::SalesOrder>::success(*order);
    }

    domain::Result<domain::SalesOrder> moveTo(domain::SalesOrder& order,
                                              domain::SalesOrderStatus status,
                                              const std::string& actor) {
        order.updateStatus(status);
        orderRepository_->save(order);

        std::cout << "[SalesWorkflow] " << order.id << " -> " << domain::toString(status) << std::endl;
        audit_->statusChanged("sales_order", order.id, domain::toString(status), actor);
        return domain::Result<domain::SalesOrder>::success(order);
    }

    static domain::Result<domain::SalesOrder> unknownOrder(const std::string& orderId) {
        return domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::UNKNOWN_ENTITY,
            "Sales order not found: " + orderId);
    }

    static domain::Result<domain::SalesOrder> invalidTransition(const domain::SalesOrder& order,
                                                                domain::SalesOrderStatus to) {
        return domain::Result<domain::SalesOrder>::failure(domain::ErrorCode::INVALID_TRANSITION,
            "Cannot move " + order.id + " from " + domain::toString(order.status) + " to " + domain::toString(to));
    }
};

} // namespace inventory::application
