/**
 * @file TransferCoordinatorTest.cpp
 * @brief Unit tests for TransferCoordinator
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/TransferCoordinator.hpp"
#include "application/ReconciliationService.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/InMemoryTransferRepository.hpp"
#include "adapters/secondary/persistence/InMemoryPurchaseOrderRepository.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include "../mocks/MockJournalRepository.hpp"
#include "../mocks/FailingLedgerStore.hpp"
#include "../mocks/FailingTransferRepository.hpp"
#include <stdexcept>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;
using ::testing::_;
using ::testing::NiceMock;

class TransferCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
        failingStore_ = std::make_shared<FailingLedgerStore>(store_);
        publisher_ = std::make_shared<MockEventPublisher>();
        audit_ = std::make_shared<AuditEmitter>(publisher_);
        ledger_ = std::make_shared<StockLedger>(failingStore_, audit_);
        journal_ = std::make_shared<TransactionJournal>(store_);
        transferRepository_ = std::make_shared<FailingTransferRepository>(
            std::make_shared<adapters::secondary::InMemoryTransferRepository>());
        coordinator_ = std::make_shared<TransferCoordinator>(ledger_, journal_, transferRepository_, audit_);

        ASSERT_TRUE(ledger_->provision(source_, 90, 10).isSuccess());
        ASSERT_TRUE(ledger_->provision(destination_, 30, 0).isSuccess());
    }

    int64_t onHand(const domain::StockKey& key) {
        return ledger_->find(key).value->onHand;
    }

    std::string createTransfer(int64_t quantity = 40) {
        auto created = coordinator_->create(7, 3, 1, quantity, "planner");
        EXPECT_TRUE(created.isSuccess()) << created.message;
        return created.value->id;
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<FailingLedgerStore> failingStore_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<AuditEmitter> audit_;
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<TransactionJournal> journal_;
    std::shared_ptr<FailingTransferRepository> transferRepository_;
    std::shared_ptr<TransferCoordinator> coordinator_;

    domain::StockKey source_{7, 3};
    domain::StockKey destination_{7, 1};
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(TransferCoordinatorTest, Create_IsPendingAndMovesNoStock) {
    auto created = coordinator_->create(7, 3, 1, 40, "planner", "rebalance");

    ASSERT_TRUE(created.isSuccess());
    EXPECT_EQ(created.value->status, domain::TransferStatus::PENDING);
    EXPECT_EQ(created.value->id.rfind("trf-", 0), 0u);
    EXPECT_EQ(created.value->notes, "rebalance");
    EXPECT_EQ(onHand(source_), 90);
    EXPECT_EQ(onHand(destination_), 30);
    EXPECT_EQ(publisher_->messagesWithKey("transfer.pending").size(), 1u);
}

TEST_F(TransferCoordinatorTest, Create_IdIsPrefixedUuid) {
    auto id = createTransfer();

    // trf-xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
    ASSERT_EQ(id.size(), 4u + 36u);
    EXPECT_EQ(id[4 + 14], '4');
    EXPECT_NE(std::string("89ab").find(id[4 + 19]), std::string::npos);
}

TEST_F(TransferCoordinatorTest, Create_TakenId_RetriesWithNewId) {
    transferRepository_->rejectInserts(1);

    auto created = coordinator_->create(7, 3, 1, 40, "planner");

    ASSERT_TRUE(created.isSuccess()) << created.message;
    EXPECT_EQ(transferRepository_->insertAttempts(), 2);
    EXPECT_TRUE(coordinator_->findById(created.value->id).has_value());
}

TEST_F(TransferCoordinatorTest, Create_NoFreeId_FailsWithoutOverwriting) {
    auto existing = createTransfer(10);
    ASSERT_TRUE(coordinator_->dispatch(existing, "driver").isSuccess());
    transferRepository_->rejectInserts(TransferCoordinator::kMaxIdAttempts);

    auto created = coordinator_->create(7, 3, 1, 5, "planner");

    EXPECT_EQ(created.error, domain::ErrorCode::STORAGE_FAILURE);
    EXPECT_EQ(coordinator_->findById(existing)->status, domain::TransferStatus::IN_TRANSIT);
    EXPECT_EQ(coordinator_->findByStatus(domain::TransferStatus::PENDING).size(), 0u);
}

TEST_F(TransferCoordinatorTest, Create_SourceReadFailure_IsStorageFailure) {
    failingStore_->failReads();

    auto created = coordinator_->create(7, 3, 1, 5, "planner");

    EXPECT_EQ(created.error, domain::ErrorCode::STORAGE_FAILURE);
    failingStore_->heal();
    EXPECT_TRUE(coordinator_->findByStatus(domain::TransferStatus::PENDING).empty());
}

TEST_F(TransferCoordinatorTest, Create_Validation) {
    EXPECT_EQ(coordinator_->create(7, 3, 1, 0, "planner").error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(coordinator_->create(7, 3, 3, 5, "planner").error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(coordinator_->create(7, 8, 1, 5, "planner").error, domain::ErrorCode::UNKNOWN_ENTITY);
    // available = 90 - 10 = 80
    EXPECT_EQ(coordinator_->create(7, 3, 1, 81, "planner").error, domain::ErrorCode::INSUFFICIENT_AVAILABLE);
    EXPECT_TRUE(coordinator_->create(7, 3, 1, 80, "planner").isSuccess());
}

// ============================================================================
// DISPATCH & COMPLETE
// ============================================================================

TEST_F(TransferCoordinatorTest, DispatchThenComplete_MovesStock) {
    auto id = createTransfer();

    auto dispatched = coordinator_->dispatch(id, "driver");
    ASSERT_TRUE(dispatched.isSuccess()) << dispatched.message;
    EXPECT_EQ(dispatched.value->status, domain::TransferStatus::IN_TRANSIT);
    EXPECT_TRUE(dispatched.value->dispatchedAt.has_value());
    EXPECT_EQ(onHand(source_), 50);
    EXPECT_EQ(onHand(destination_), 30);

    auto completed = coordinator_->complete(id, "receiver");
    ASSERT_TRUE(completed.isSuccess()) << completed.message;
    EXPECT_EQ(completed.value->status, domain::TransferStatus::COMPLETED);
    EXPECT_TRUE(completed.value->completedAt.has_value());
    EXPECT_EQ(onHand(source_), 50);
    EXPECT_EQ(onHand(destination_), 70);

    auto movements = journal_->entriesForReference(domain::ReferenceKind::TRANSFER, id);
    ASSERT_EQ(movements.size(), 2u);
    EXPECT_EQ(movements[0].kind, domain::JournalKind::TRANSFER_OUT);
    EXPECT_EQ(movements[0].delta, -40);
    EXPECT_EQ(movements[0].actor, "driver");
    EXPECT_EQ(movements[1].kind, domain::JournalKind::TRANSFER_IN);
    EXPECT_EQ(movements[1].delta, 40);
}

TEST_F(TransferCoordinatorTest, Complete_Twice_IsNoOp) {
    auto id = createTransfer();
    coordinator_->dispatch(id, "driver");
    ASSERT_TRUE(coordinator_->complete(id, "receiver").isSuccess());

    auto again = coordinator_->complete(id, "receiver");

    EXPECT_TRUE(again.isSuccess());
    EXPECT_EQ(again.value->status, domain::TransferStatus::COMPLETED);
    EXPECT_EQ(onHand(destination_), 70);
    EXPECT_EQ(journal_->entriesForReference(domain::ReferenceKind::TRANSFER, id).size(), 2u);
}

TEST_F(TransferCoordinatorTest, Complete_ToUnprovisionedLocation_CreatesEntry) {
    auto created = coordinator_->create(7, 3, 5, 15, "planner");
    ASSERT_TRUE(created.isSuccess());
    coordinator_->dispatch(created.value->id, "driver");

    ASSERT_TRUE(coordinator_->complete(created.value->id, "receiver").isSuccess());

    auto entry = ledger_->find(domain::StockKey{7, 5}).value;
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->onHand, 15);
    EXPECT_EQ(entry->initialOnHand, 0);
}

TEST_F(TransferCoordinatorTest, Dispatch_WhenSourceDrained_FailsAndStaysPending) {
    auto id = createTransfer(40);

    // После create остаток источника уменьшился другим движением
    domain::MovementMeta meta;
    meta.kind = domain::JournalKind::SALE;
    meta.referenceKind = domain::ReferenceKind::ADJUSTMENT;
    meta.referenceId = "manual";
    meta.actor = "clerk";
    ASSERT_TRUE(ledger_->adjust(source_, -60, meta).isSuccess());  // 30 на складе, 10 в резерве

    auto dispatched = coordinator_->dispatch(id, "driver");

    EXPECT_EQ(dispatched.error, domain::ErrorCode::INSUFFICIENT_STOCK);
    EXPECT_EQ(coordinator_->findById(id)->status, domain::TransferStatus::PENDING);
    EXPECT_EQ(onHand(source_), 30);
}

TEST_F(TransferCoordinatorTest, CreditFailure_RetryDoesNotDebitTwice) {
    auto id = createTransfer();
    ASSERT_TRUE(coordinator_->dispatch(id, "driver").isSuccess());

    failingStore_->failCommitsFor(destination_);
    auto failed = coordinator_->complete(id, "receiver");

    EXPECT_EQ(failed.error, domain::ErrorCode::STORAGE_FAILURE);
    EXPECT_EQ(coordinator_->findById(id)->status, domain::TransferStatus::IN_TRANSIT);
    EXPECT_EQ(onHand(source_), 50);
    EXPECT_EQ(onHand(destination_), 30);

    failingStore_->heal();
    auto retried = coordinator_->complete(id, "receiver");

    ASSERT_TRUE(retried.isSuccess()) << retried.message;
    EXPECT_EQ(onHand(source_), 50);
    EXPECT_EQ(onHand(destination_), 70);

    int debits = 0;
    for (const auto& e : journal_->entriesForReference(domain::ReferenceKind::TRANSFER, id)) {
        if (e.kind == domain::JournalKind::TRANSFER_OUT) ++debits;
    }
    EXPECT_EQ(debits, 1);
}

// Журнал недоступен во время complete: нельзя считать, что зачисления не было
TEST_F(TransferCoordinatorTest, JournalReadFailure_ReturnsStorageFailureAndMovesNothing) {
    auto journalRepository = std::make_shared<NiceMock<MockJournalRepository>>();
    bool journalDown = false;
    ON_CALL(*journalRepository, findByReference(_, _))
        .WillByDefault([this, &journalDown](domain::ReferenceKind kind, const std::string& referenceId) {
            if (journalDown) {
                throw std::runtime_error("connection lost");
            }
            return store_->findByReference(kind, referenceId);
        });
    auto coordinator = std::make_shared<TransferCoordinator>(
        ledger_, std::make_shared<TransactionJournal>(journalRepository), transferRepository_, audit_);

    auto created = coordinator->create(7, 3, 1, 40, "planner");
    ASSERT_TRUE(created.isSuccess());
    const auto id = created.value->id;
    ASSERT_TRUE(coordinator->dispatch(id, "driver").isSuccess());

    journalDown = true;
    auto failed = coordinator->complete(id, "receiver");

    EXPECT_EQ(failed.error, domain::ErrorCode::STORAGE_FAILURE);
    EXPECT_EQ(coordinator->findById(id)->status, domain::TransferStatus::IN_TRANSIT);
    EXPECT_EQ(onHand(destination_), 30);
    EXPECT_EQ(coordinator->cancel(id, "planner").error, domain::ErrorCode::STORAGE_FAILURE);
    EXPECT_EQ(onHand(source_), 50);

    journalDown = false;
    auto retried = coordinator->complete(id, "receiver");

    ASSERT_TRUE(retried.isSuccess()) << retried.message;
    EXPECT_EQ(onHand(source_), 50);
    EXPECT_EQ(onHand(destination_), 70);
    EXPECT_EQ(journal_->entriesForReference(domain::ReferenceKind::TRANSFER, id).size(), 2u);
}

// ============================================================================
// CANCEL & TRANSITIONS
// ============================================================================

TEST_F(TransferCoordinatorTest, Cancel_Pending_MovesNoStock) {
    auto id = createTransfer();

    auto cancelled = coordinator_->cancel(id, "planner");

    ASSERT_TRUE(cancelled.isSuccess());
    EXPECT_EQ(cancelled.value->status, domain::TransferStatus::CANCELLED);
    EXPECT_EQ(onHand(source_), 90);
    EXPECT_TRUE(journal_->entriesForReference(domain::ReferenceKind::TRANSFER, id).empty());
}

TEST_F(TransferCoordinatorTest, Cancel_InTransit_RestoresSource) {
    auto id = createTransfer();
    coordinator_->dispatch(id, "driver");
    ASSERT_EQ(onHand(source_), 50);

    auto cancelled = coordinator_->cancel(id, "planner");

    ASSERT_TRUE(cancelled.isSuccess()) << cancelled.message;
    EXPECT_EQ(onHand(source_), 90);
    EXPECT_EQ(onHand(destination_), 30);

    auto movements = journal_->entriesForReference(domain::ReferenceKind::TRANSFER, id);
    ASSERT_EQ(movements.size(), 2u);
    EXPECT_EQ(movements[1].kind, domain::JournalKind::TRANSFER_IN);
    EXPECT_EQ(movements[1].key, source_);
    EXPECT_EQ(movements[1].notes, "cancelled in transit");
}

// complete зачислил получателя, но статус COMPLETED не сохранился
TEST_F(TransferCoordinatorTest, Cancel_AfterCreditedComplete_FinishesAsCompleted) {
    auto id = createTransfer();
    ASSERT_TRUE(coordinator_->dispatch(id, "driver").isSuccess());

    transferRepository_->failNextSave(domain::TransferStatus::COMPLETED);
    EXPECT_EQ(coordinator_->complete(id, "receiver").error, domain::ErrorCode::STORAGE_FAILURE);
    ASSERT_EQ(coordinator_->findById(id)->status, domain::TransferStatus::IN_TRANSIT);
    ASSERT_EQ(onHand(destination_), 70);

    auto cancelled = coordinator_->cancel(id, "planner");

    EXPECT_EQ(cancelled.error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(coordinator_->findById(id)->status, domain::TransferStatus::COMPLETED);
    EXPECT_EQ(onHand(source_), 50);
    EXPECT_EQ(onHand(destination_), 70);

    ReconciliationService reconciliation(ledger_, journal_, transferRepository_,
        std::make_shared<adapters::secondary::InMemoryPurchaseOrderRepository>());
    EXPECT_TRUE(reconciliation.reconcile().isClean());
}

TEST_F(TransferCoordinatorTest, InvalidTransitions) {
    auto id = createTransfer();

    EXPECT_EQ(coordinator_->complete(id, "receiver").error, domain::ErrorCode::INVALID_TRANSITION);

    coordinator_->dispatch(id, "driver");
    EXPECT_EQ(coordinator_->dispatch(id, "driver").error, domain::ErrorCode::INVALID_TRANSITION);

    coordinator_->complete(id, "receiver");
    EXPECT_EQ(coordinator_->cancel(id, "planner").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(onHand(destination_), 70);
}

TEST_F(TransferCoordinatorTest, Cancelled_CannotBeDispatched) {
    auto id = createTransfer();
    coordinator_->cancel(id, "planner");

    EXPECT_EQ(coordinator_->dispatch(id, "driver").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(coordinator_->complete(id, "receiver").error, domain::ErrorCode::INVALID_TRANSITION);
    EXPECT_EQ(onHand(source_), 90);
}

TEST_F(TransferCoordinatorTest, UnknownTransfer) {
    EXPECT_EQ(coordinator_->dispatch("trf-missing", "driver").error, domain::ErrorCode::UNKNOWN_ENTITY);
    EXPECT_EQ(coordinator_->complete("trf-missing", "driver").error, domain::ErrorCode::UNKNOWN_ENTITY);
    EXPECT_EQ(coordinator_->cancel("trf-missing", "driver").error, domain::ErrorCode::UNKNOWN_ENTITY);
    EXPECT_FALSE(coordinator_->findById("trf-missing").has_value());
}

TEST_F(TransferCoordinatorTest, FindByStatus) {
    auto first = createTransfer(10);
    auto second = createTransfer(10);
    coordinator_->dispatch(second, "driver");

    auto pending = coordinator_->findByStatus(domain::TransferStatus::PENDING);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, first);
    EXPECT_EQ(coordinator_->findByStatus(domain::TransferStatus::IN_TRANSIT).size(), 1u);
}
