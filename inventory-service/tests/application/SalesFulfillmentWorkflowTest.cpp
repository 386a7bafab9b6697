/**
 * @file SalesFulfillmentWorkflowTest.cpp
 * @brief Unit tests for SalesFulfillmentWorkflow
 */

#include <gtest/gtest.h>
#include "application/SalesFulfillmentWorkflow.hpp"
#include "application/TransactionJournal.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/InMemoryReservationRepository.hpp"
#include "adapters/secondary/persistence/InMemorySalesOrderRepository.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include <limits>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;

class SalesFulfillmentWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
        publisher_ = std::make_shared<MockEventPublisher>();
        auto audit = std::make_shared<AuditEmitter>(publisher_);
        ledger_ = std::make_shared<StockLedger>(store_, audit);
        journal_ = std::make_shared<TransactionJournal>(store_);
        reservations_ = std::make_shared<ReservationManager>(
            ledger_, std::make_shared<adapters::secondary::InMemoryReservationRepository>());
        orderRepository_ = std::make_shared<adapters::secondary::InMemorySalesOrderRepository>();
        workflow_ = std::make_shared<SalesFulfillmentWorkflow>(ledger_, reservations_, orderRepository_, audit);

        ASSERT_TRUE(ledger_->provision(domain::StockKey{2, 1}, 80, 15).isSuccess());
        ASSERT_TRUE(ledger_->provision(domain::StockKey{5, 1}, 70, 10).isSuccess());
    }

    domain::SalesOrderRequest request(int64_t secondQuantity = 5) {
        domain::SalesOrderRequest r;
        r.customerId = 12;
        r.createdBy = "shop";
        r.lines.push_back({.productId = 2, .quantity = 10, .unitPrice = domain::Money(1999)});
        r.lines.push_back({.productId = 5, .quantity = secondQuantity, .unitPrice = domain::Money(450)});
        return r;
    }

    std::string confirmedOrder() {
        auto created = workflow_->createOrder(request());
        EXPECT_TRUE(created.isSuccess()) << created.message;
        EXPECT_TRUE(workflow_->confirm(created.value->id, "shop").isSuccess());
        return created.value->id;
    }

    domain::StockEntry entry(int64_t productId, int64_t locationId) {
        return *ledger_->find(domain::StockKey{productId, locationId}).value;
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<TransactionJournal> journal_;
    std::shared_ptr<ReservationManager> reservations_;
    std::shared_ptr<adapters::secondary::InMemorySalesOrderRepository> orderRepository_;
    std::shared_ptr<SalesFulfillmentWorkflow> workflow_;
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(SalesFulfillmentWorkflowTest, CreateOrder_IsPendingAndReservesNothing) {
    auto created = workflow_->createOrder(request());

    ASSERT_TRUE(created.isSuccess());
    EXPECT_EQ(created.value->id.rfind("so-", 0), 0u);
    EXPECT_EQ(created.value->status, domain::SalesOrderStatus::PENDING);
    EXPECT_EQ(created.value->total().cents, 19990 + 2250);
    EXPECT_EQ(entry(2, 1).reserved, 15);
}

TEST_F(SalesFulfillmentWorkflowTest, CreateOrder_Validation) {
    domain::SalesOrderRequest empty;
    EXPECT_EQ(workflow_->createOrder(empty).error, domain::ErrorCode::INVALID_ARGUMENT);

    auto zero = workflow_->createOrder(request(0));
    EXPECT_EQ(zero.error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(*zero.lineId, 2);
}

TEST_F(SalesFulfillmentWorkflowTest, CreateOrder_MixedCurrencies_RejectedBeforeSave) {
    auto r = request();
    r.lines[1].unitPrice = domain::Money(450, "EUR");

    auto result = workflow_->createOrder(r);

    EXPECT_EQ(result.error, domain::ErrorCode::INVALID_ARGUMENT);
    ASSERT_TRUE(result.lineId.has_value());
    EXPECT_EQ(*result.lineId, 2);
    EXPECT_TRUE(workflow_->findByStatus(domain::SalesOrderStatus::PENDING).empty());
}

// ============================================================================
// CONFIRM / SHIP / DELIVER
// ============================================================================

TEST_F(SalesFulfillmentWorkflowTest, Confirm_ReservesAllLines) {
    auto id = confirmedOrder();

    EXPECT_EQ(workflow_->findById(id)->status, domain::SalesOrderStatus::PROCESSING);
    EXPECT_EQ(entry(2, 1).reserved, 25);
    EXPECT_EQ(entry(5, 1).reserved, 15);
    EXPECT_EQ(entry(2, 1).onHand, 80);
    EXPECT_EQ(publisher_->messagesWithKey("sales_order.processing").size(), 1u);
}

TEST_F(SalesFulfillmentWorkflowTest, Confirm_SecondLineUnavailable_ReleasesFirst) {
    auto id = workflow_->createOrder(request(500)).value->id;

    auto result = workflow_->confirm(id, "shop");

    EXPECT_EQ(result.error, domain::ErrorCode::PARTIAL_RESERVATION_FAILURE);
    EXPECT_EQ(result.cause, domain::ErrorCode::INSUFFICIENT_AVAILABLE);
    EXPECT_EQ(*result.lineId, 2);
    EXPECT_EQ(entry(2, 1).reserved, 15);
    EXPECT_EQ(entry(5, 1).reserved, 10);
    EXPECT_EQ(workflow_->findById(id)->status, domain::SalesOrderStatus::PENDING);
}

TEST_F(SalesFulfillmentWorkflowTest, Ship_ConsumesReservation) {
    auto id = confirmedOrder();

    auto shipped = workflow_->ship(id, "warehouse");

    ASSERT_TRUE(shipped.isSuccess()) << shipped.message;
    EXPECT_EQ(shipped.value->status, domain::SalesOrderStatus::SHIPPED);
    EXPECT_EQ(entry(2, 1).onHand, 70);
    EXPECT_EQ(entry(2, 1).reserved, 15);
    EXPECT_EQ(entry(5, 1).onHand, 65);
    EXPECT_EQ(entry(5, 1).reserved, 10);

    auto sale = journal_->entriesForReference(domain::ReferenceKind::SALE_LINE, id + ":2");
    ASSERT_EQ(sale.size(), 1u);
    EXPECT_EQ(sale[0].kind, domain::JournalKind::SALE);
    EXPECT_EQ(sale[0].delta, -5);

    ASSERT_TRUE(workflow_->deliver(id, "courier").isSuccess());
    EXPECT_EQ(workflow_->findById(id)->status, domain::SalesOrderStatus::DELIVERED);
}

TEST_F(SalesFulfillmentWorkflowTest, InvalidTransitions) {
    auto id = workflow_->createOrder(request()).value->id;

    EXPECT_EQ(workflow_->ship(id, "warehouse").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(workflow_->deliver(id, "courier").error, domain::ErrorCode::INVALID_TRANSITION);

    workflow_->confirm(id, "shop");
    EXPECT_EQ(workflow_->confirm(id, "shop").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(entry(2, 1).reserved, 25);

    workflow_->ship(id, "warehouse");
    EXPECT_EQ(workflow_->cancel(id, "shop").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(workflow_->ship(id, "warehouse").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(entry(2, 1).onHand, 70);
}

// ============================================================================
// CANCEL
// ============================================================================

TEST_F(SalesFulfillmentWorkflowTest, Cancel_Processing_ReleasesReservation) {
    auto id = confirmedOrder();

    auto cancelled = workflow_->cancel(id, "shop");

    ASSERT_TRUE(cancelled.isSuccess());
    EXPECT_EQ(cancelled.value->status, domain::SalesOrderStatus::CANCELLED);
    EXPECT_EQ(entry(2, 1).reserved, 15);
    EXPECT_EQ(entry(5, 1).reserved, 10);
    EXPECT_EQ(entry(2, 1).onHand, 80);
    EXPECT_EQ(store_->journalSize(), 0u);
}

TEST_F(SalesFulfillmentWorkflowTest, Cancel_Pending_Succeeds) {
    auto id = workflow_->createOrder(request()).value->id;

    EXPECT_TRUE(workflow_->cancel(id, "shop").isSuccess());
    EXPECT_EQ(workflow_->confirm(id, "shop").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(entry(2, 1).reserved, 15);
}

// ============================================================================
// RETURNS
// ============================================================================

TEST_F(SalesFulfillmentWorkflowTest, RecordReturn_CreditsLocation) {
    auto id = confirmedOrder();
    workflow_->ship(id, "warehouse");

    auto returned = workflow_->recordReturn(id, 1, 1, 4, "support");

    ASSERT_TRUE(returned.isSuccess()) << returned.message;
    EXPECT_EQ(returned.value->findLine(1)->quantityReturned, 4);
    EXPECT_EQ(entry(2, 1).onHand, 74);

    auto movements = journal_->entriesForReference(domain::ReferenceKind::SALE_LINE, id + ":1");
    ASSERT_EQ(movements.size(), 2u);
    EXPECT_EQ(movements[1].kind, domain::JournalKind::RETURN);
    EXPECT_EQ(movements[1].delta, 4);
}

TEST_F(SalesFulfillmentWorkflowTest, RecordReturn_ToOtherLocation_AfterDelivery) {
    auto id = confirmedOrder();
    workflow_->ship(id, "warehouse");
    workflow_->deliver(id, "courier");

    ASSERT_TRUE(workflow_->recordReturn(id, 2, 6, 5, "support").isSuccess());
    EXPECT_EQ(entry(5, 6).onHand, 5);
}

TEST_F(SalesFulfillmentWorkflowTest, RecordReturn_CannotExceedShipped) {
    auto id = confirmedOrder();
    workflow_->ship(id, "warehouse");

    ASSERT_TRUE(workflow_->recordReturn(id, 1, 1, 6, "support").isSuccess());

    auto over = workflow_->recordReturn(id, 1, 1, 5, "support");
    EXPECT_EQ(over.error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(*over.lineId, 1);
    EXPECT_EQ(workflow_->recordReturn(id, 1, 1, 0, "support").error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(workflow_->recordReturn(id, 7, 1, 1, "support").error, domain::ErrorCode::UNKNOWN_ENTITY);
    EXPECT_EQ(entry(2, 1).onHand, 76);
}

TEST_F(SalesFulfillmentWorkflowTest, RecordReturn_HugeQuantity_RejectedWithoutOverflow) {
    auto id = confirmedOrder();
    workflow_->ship(id, "warehouse");
    ASSERT_TRUE(workflow_->recordReturn(id, 1, 1, 3, "support").isSuccess());

    auto huge = workflow_->recordReturn(id, 1, 1, std::numeric_limits<int64_t>::max(), "support");

    EXPECT_EQ(huge.error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(workflow_->findById(id)->findLine(1)->quantityReturned, 3);
    EXPECT_EQ(entry(2, 1).onHand, 73);
}

TEST_F(SalesFulfillmentWorkflowTest, RecordReturn_BeforeShipment_Rejected) {
    auto id = confirmedOrder();

    EXPECT_EQ(workflow_->recordReturn(id, 1, 1, 1, "support").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(entry(2, 1).onHand, 80);
}

TEST_F(SalesFulfillmentWorkflowTest, FindByStatus) {
    auto pending = workflow_->createOrder(request()).value->id;
    auto processing = confirmedOrder();

    auto found = workflow_->findByStatus(domain::SalesOrderStatus::PROCESSING);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, processing);
    EXPECT_EQ(workflow_->findByStatus(domain::SalesOrderStatus::PENDING)[0].id, pending);
}
