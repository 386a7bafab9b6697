/**
 * @file InMemoryRepositoriesTest.cpp
 * @brief Unit tests for in-memory entity repositories and IdGenerator
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryTransferRepository.hpp"
#include "adapters/secondary/persistence/InMemoryPurchaseOrderRepository.hpp"
#include "adapters/secondary/persistence/InMemorySalesOrderRepository.hpp"
#include "utils/IdGenerator.hpp"
#include <set>

using namespace inventory;
using namespace inventory::adapters::secondary;

// ============================================================================
// INSERT
// ============================================================================

TEST(InMemoryRepositoriesTest, TransferInsert_TakenId_KeepsOriginal) {
    InMemoryTransferRepository repository;
    domain::Transfer first;
    first.id = "trf-1";
    first.quantity = 10;
    domain::Transfer second = first;
    second.quantity = 99;

    EXPECT_TRUE(repository.insert(first));
    EXPECT_FALSE(repository.insert(second));
    EXPECT_EQ(repository.findById("trf-1")->quantity, 10);
}

TEST(InMemoryRepositoriesTest, PurchaseOrderInsert_TakenId_KeepsOriginal) {
    InMemoryPurchaseOrderRepository repository;
    domain::PurchaseOrder first;
    first.id = "po-1";
    first.supplierId = 4;
    domain::PurchaseOrder second = first;
    second.supplierId = 5;

    EXPECT_TRUE(repository.insert(first));
    EXPECT_FALSE(repository.insert(second));
    EXPECT_EQ(repository.findById("po-1")->supplierId, 4);
    EXPECT_EQ(repository.findAll().size(), 1u);
}

TEST(InMemoryRepositoriesTest, SalesOrderInsert_TakenId_KeepsOriginal) {
    InMemorySalesOrderRepository repository;
    domain::SalesOrder first;
    first.id = "so-1";
    first.customerId = 12;
    domain::SalesOrder second = first;
    second.customerId = 13;

    EXPECT_TRUE(repository.insert(first));
    EXPECT_FALSE(repository.insert(second));
    EXPECT_EQ(repository.findById("so-1")->customerId, 12);
}

// ============================================================================
// ID GENERATOR
// ============================================================================

TEST(IdGeneratorTest, Uuid_HasVersion4Layout) {
    auto uuid = utils::IdGenerator::uuid();

    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
    EXPECT_EQ(uuid[23], '-');
}

TEST(IdGeneratorTest, Ids_ArePrefixedAndDistinct) {
    EXPECT_EQ(utils::IdGenerator::transferId().rfind("trf-", 0), 0u);
    EXPECT_EQ(utils::IdGenerator::purchaseOrderId().rfind("po-", 0), 0u);
    EXPECT_EQ(utils::IdGenerator::salesOrderId().rfind("so-", 0), 0u);

    std::set<std::string> ids;
    for (int i = 0; i < 100000; ++i) {
        ids.insert(utils::IdGenerator::salesOrderId());
    }
    EXPECT_EQ(ids.size(), 100000u);
}
