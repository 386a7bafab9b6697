/**
 * @file StockLedgerTest.cpp
 * @brief Unit tests for StockLedger
 */

#include <gtest/gtest.h>
#include "application/StockLedger.hpp"
#include "application/TransactionJournal.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include "../mocks/FailingLedgerStore.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;

class StockLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
        failingStore_ = std::make_shared<FailingLedgerStore>(store_);
        publisher_ = std::make_shared<MockEventPublisher>();
        ledger_ = std::make_shared<StockLedger>(failingStore_, std::make_shared<AuditEmitter>(publisher_));
        journal_ = std::make_shared<TransactionJournal>(store_, 4);

        ASSERT_TRUE(ledger_->provision(key_, 150, 25).isSuccess());
    }

    domain::MovementMeta meta(domain::JournalKind kind = domain::JournalKind::ADJUSTMENT) {
        domain::MovementMeta m;
        m.kind = kind;
        m.referenceKind = domain::ReferenceKind::ADJUSTMENT;
        m.referenceId = "test";
        m.actor = "tester";
        return m;
    }

    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<FailingLedgerStore> failingStore_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<TransactionJournal> journal_;
    domain::StockKey key_{1, 1};
};

// ============================================================================
// PROVISION
// ============================================================================

TEST_F(StockLedgerTest, Provision_SetsInitialBalance) {
    auto entry = ledger_->find(key_).value;
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->onHand, 150);
    EXPECT_EQ(entry->reserved, 25);
    EXPECT_EQ(entry->initialOnHand, 150);
    EXPECT_EQ(entry->available(), 125);
    EXPECT_EQ(store_->journalSize(), 0u);
}

TEST_F(StockLedgerTest, Provision_Twice_Fails) {
    auto result = ledger_->provision(key_, 10, 0);
    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(ledger_->find(key_).value->onHand, 150);
}

TEST_F(StockLedgerTest, Provision_ReservedAboveOnHand_Fails) {
    auto result = ledger_->provision(domain::StockKey{2, 1}, 10, 11);
    EXPECT_EQ(result.error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(ledger_->find(domain::StockKey{2, 1}).value.has_value());
}

// ============================================================================
// ADJUST
// ============================================================================

TEST_F(StockLedgerTest, Adjust_AppliesDeltaAndJournals) {
    auto result = ledger_->adjust(key_, -40, meta(domain::JournalKind::SALE));

    ASSERT_TRUE(result.isSuccess()) << result.message;
    EXPECT_EQ(result.value->onHand, 110);
    EXPECT_EQ(result.value->reserved, 25);

    auto entries = journal_->entriesForReference(domain::ReferenceKind::ADJUSTMENT, "test");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].delta, -40);
    EXPECT_EQ(entries[0].kind, domain::JournalKind::SALE);
    EXPECT_EQ(entries[0].actor, "tester");
    EXPECT_EQ(entries[0].key, key_);
}

TEST_F(StockLedgerTest, Adjust_BelowReserved_InsufficientStock) {
    // onHand=150, reserved=25: можно списать не больше 125
    auto result = ledger_->adjust(key_, -126, meta());

    EXPECT_EQ(result.error, domain::ErrorCode::INSUFFICIENT_STOCK);
    EXPECT_EQ(ledger_->find(key_).value->onHand, 150);
    EXPECT_EQ(store_->journalSize(), 0u);
}

TEST_F(StockLedgerTest, Adjust_UnknownKey_CreatesEntry) {
    domain::StockKey fresh{42, 7};
    auto result = ledger_->adjust(fresh, 30, meta(domain::JournalKind::PURCHASE));

    ASSERT_TRUE(result.isSuccess());
    auto entry = ledger_->find(fresh).value;
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->onHand, 30);
    EXPECT_EQ(entry->initialOnHand, 0);
    EXPECT_EQ(journal_->replay(fresh, entry->initialOnHand), 30);
}

TEST_F(StockLedgerTest, Adjust_UnknownKey_NegativeDelta_Fails) {
    auto result = ledger_->adjust(domain::StockKey{42, 7}, -1, meta());
    EXPECT_EQ(result.error, domain::ErrorCode::INSUFFICIENT_STOCK);
    EXPECT_FALSE(ledger_->find(domain::StockKey{42, 7}).value.has_value());
}

TEST_F(StockLedgerTest, Adjust_ZeroDelta_InvalidArgument) {
    EXPECT_EQ(ledger_->adjust(key_, 0, meta()).error, domain::ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StockLedgerTest, Adjust_StoreFailure_ReportsStorageFailure) {
    failingStore_->failCommitsFor(key_);

    auto result = ledger_->adjust(key_, 10, meta());

    EXPECT_EQ(result.error, domain::ErrorCode::STORAGE_FAILURE);
    EXPECT_EQ(ledger_->find(key_).value->onHand, 150);
    EXPECT_EQ(store_->journalSize(), 0u);
    EXPECT_EQ(failingStore_->failedCommits(), 1);
}

TEST_F(StockLedgerTest, Adjust_OverflowingOnHand_InvalidArgument) {
    auto result = ledger_->adjust(key_, std::numeric_limits<int64_t>::max(), meta());

    EXPECT_EQ(result.error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(ledger_->find(key_).value->onHand, 150);
    EXPECT_EQ(store_->journalSize(), 0u);
}

TEST_F(StockLedgerTest, Adjust_UpToInt64Max_Succeeds) {
    auto result = ledger_->adjust(key_, std::numeric_limits<int64_t>::max() - 150, meta());

    ASSERT_TRUE(result.isSuccess()) << result.message;
    EXPECT_EQ(result.value->onHand, std::numeric_limits<int64_t>::max());
    EXPECT_EQ(ledger_->adjust(key_, 1, meta()).error, domain::ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StockLedgerTest, Adjust_PublishesStockMoved) {
    ledger_->adjust(key_, -40, meta(domain::JournalKind::SALE));

    auto moved = publisher_->messagesWithKey("stock.moved");
    ASSERT_EQ(moved.size(), 1u);

    auto json = nlohmann::json::parse(moved[0].message);
    EXPECT_EQ(json["product_id"], 1);
    EXPECT_EQ(json["location_id"], 1);
    EXPECT_EQ(json["kind"], "sale");
    EXPECT_EQ(json["delta"], -40);
    EXPECT_EQ(json["on_hand"], 110);
    EXPECT_EQ(json["actor"], "tester");
}

TEST_F(StockLedgerTest, Adjust_PublisherFailure_DoesNotFailOperation) {
    publisher_->setFailing(true);

    auto result = ledger_->adjust(key_, 5, meta());

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(ledger_->find(key_).value->onHand, 155);
}

// ============================================================================
// RESERVE / RELEASE
// ============================================================================

TEST_F(StockLedgerTest, Reserve_WithinAvailable_Succeeds) {
    auto result = ledger_->reserve(key_, 30);

    ASSERT_TRUE(result.isSuccess());
    auto entry = ledger_->find(key_).value;
    EXPECT_EQ(entry->reserved, 55);
    EXPECT_EQ(entry->available(), 95);
    EXPECT_EQ(store_->journalSize(), 0u);
    EXPECT_EQ(publisher_->messagesWithKey("stock.reserved").size(), 1u);
}

TEST_F(StockLedgerTest, Reserve_AboveAvailable_InsufficientAvailable) {
    ASSERT_TRUE(ledger_->reserve(key_, 30).isSuccess());

    auto result = ledger_->reserve(key_, 200);

    EXPECT_EQ(result.error, domain::ErrorCode::INSUFFICIENT_AVAILABLE);
    EXPECT_EQ(ledger_->find(key_).value->reserved, 55);
}

TEST_F(StockLedgerTest, Reserve_UnknownKey_UnknownEntity) {
    auto result = ledger_->reserve(domain::StockKey{99, 99}, 1);
    EXPECT_EQ(result.error, domain::ErrorCode::UNKNOWN_ENTITY);
}

TEST_F(StockLedgerTest, Reserve_NonPositive_InvalidArgument) {
    EXPECT_EQ(ledger_->reserve(key_, 0).error, domain::ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(ledger_->reserve(key_, -5).error, domain::ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StockLedgerTest, Release_MoreThanReserved_OverRelease) {
    auto result = ledger_->release(key_, 26);

    EXPECT_EQ(result.error, domain::ErrorCode::OVER_RELEASE);
    EXPECT_EQ(ledger_->find(key_).value->reserved, 25);
}

TEST_F(StockLedgerTest, Release_ReducesReserved) {
    ASSERT_TRUE(ledger_->release(key_, 25).isSuccess());
    EXPECT_EQ(ledger_->find(key_).value->reserved, 0);
    EXPECT_EQ(ledger_->find(key_).value->onHand, 150);
}

// ============================================================================
// CONSUME RESERVED
// ============================================================================

TEST_F(StockLedgerTest, ConsumeReserved_DropsReservedAndOnHandTogether) {
    auto result = ledger_->consumeReserved(key_, 20, meta(domain::JournalKind::SALE));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value->onHand, 130);
    EXPECT_EQ(result.value->reserved, 5);
    EXPECT_EQ(store_->journalSize(), 1u);
    EXPECT_EQ(journal_->sumOfDeltas(key_), -20);
}

TEST_F(StockLedgerTest, ConsumeReserved_MoreThanReserved_OverRelease) {
    auto result = ledger_->consumeReserved(key_, 30, meta(domain::JournalKind::SALE));

    EXPECT_EQ(result.error, domain::ErrorCode::OVER_RELEASE);
    EXPECT_EQ(ledger_->find(key_).value->onHand, 150);
}

// ============================================================================
// RECORD COUNT
// ============================================================================

TEST_F(StockLedgerTest, RecordCount_JournalsDifferenceAsAdjustment) {
    auto result = ledger_->recordCount(key_, 140, meta(domain::JournalKind::SALE));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value->onHand, 140);
    EXPECT_TRUE(result.value->lastCheckedAt.has_value());

    auto entries = journal_->entriesForReference(domain::ReferenceKind::ADJUSTMENT, "test");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind, domain::JournalKind::ADJUSTMENT);
    EXPECT_EQ(entries[0].delta, -10);
}

TEST_F(StockLedgerTest, RecordCount_NoDifference_OnlyStampsDate) {
    auto result = ledger_->recordCount(key_, 150, meta());

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(store_->journalSize(), 0u);
    EXPECT_TRUE(ledger_->find(key_).value->lastCheckedAt.has_value());
}

TEST_F(StockLedgerTest, RecordCount_BelowReserved_InsufficientStock) {
    auto result = ledger_->recordCount(key_, 20, meta());
    EXPECT_EQ(result.error, domain::ErrorCode::INSUFFICIENT_STOCK);
    EXPECT_EQ(ledger_->find(key_).value->onHand, 150);
}

// ============================================================================
// SCOPES
// ============================================================================

TEST_F(StockLedgerTest, ScopedOperation_KeyNotLocked_Throws) {
    auto scope = ledger_->lock({domain::StockKey{2, 2}});
    EXPECT_THROW(ledger_->reserve(scope, key_, 1), std::logic_error);
}

TEST_F(StockLedgerTest, ScopedOperations_ApplyUnderOneScope) {
    domain::StockKey other{1, 2};
    ASSERT_TRUE(ledger_->provision(other, 75, 10).isSuccess());

    {
        auto scope = ledger_->lock({other, key_});
        EXPECT_TRUE(ledger_->reserve(scope, key_, 10).isSuccess());
        EXPECT_TRUE(ledger_->adjust(scope, other, -5, meta()).isSuccess());
    }

    EXPECT_EQ(ledger_->find(key_).value->reserved, 35);
    EXPECT_EQ(ledger_->find(other).value->onHand, 70);
}

// ============================================================================
// READS
// ============================================================================

TEST_F(StockLedgerTest, Find_UnknownKey_UnknownEntity) {
    auto result = ledger_->find(domain::StockKey{42, 7});

    EXPECT_EQ(result.error, domain::ErrorCode::UNKNOWN_ENTITY);
    EXPECT_FALSE(result.value.has_value());
}

TEST_F(StockLedgerTest, Reads_StoreUnavailable_StorageFailureNotEmpty) {
    failingStore_->failReads();

    auto entry = ledger_->find(key_);
    auto byProduct = ledger_->findByProduct(key_.productId);
    auto all = ledger_->findAll();

    EXPECT_EQ(entry.error, domain::ErrorCode::STORAGE_FAILURE);
    EXPECT_EQ(byProduct.error, domain::ErrorCode::STORAGE_FAILURE);
    EXPECT_EQ(all.error, domain::ErrorCode::STORAGE_FAILURE);
    EXPECT_FALSE(byProduct.value.has_value());

    failingStore_->heal();
    auto healed = ledger_->findByProduct(key_.productId);
    ASSERT_TRUE(healed.isSuccess());
    EXPECT_EQ(healed.value->size(), 1u);
}
