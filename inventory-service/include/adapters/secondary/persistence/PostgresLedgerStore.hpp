// include/adapters/secondary/persistence/PostgresLedgerStore.hpp
#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL хранилище позиций и журнала
 *
 * Одна транзакция на движение: условный UPDATE строки остатка
 * (WHERE on_hand/reserved равны прочитанным) и INSERT в журнал.
 * Если UPDATE не затронул строку, транзакция откатывается
 * и бросается исключение.
 *
 * Ошибки логируются и пробрасываются дальше: StockLedger переводит
 * их в STORAGE_FAILURE.
 */
class PostgresLedgerStore : public ports::output::ILedgerStore,
                            public ports::output::IJournalRepository {
public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
        std::cout << "[PostgresLedgerStore] Initialized" << std::endl;
    }

    // =========================================================================
    // ILedgerStore
    // =========================================================================

    std::optional<domain::StockEntry> findEntry(const domain::StockKey& key) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT product_id, location_id, on_hand, reserved, initial_on_hand, last_checked_at "
                "FROM inventory_stock WHERE product_id = $1 AND location_id = $2",
                key.productId, key.locationId
            );
            txn.commit();

            if (!result.empty()) {
                return rowToEntry(result[0]);
            }
            return std::nullopt;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findEntry error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::StockEntry> findEntriesByProduct(int64_t productId) override {
        std::vector<domain::StockEntry> entries;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT product_id, location_id, on_hand, reserved, initial_on_hand, last_checked_at "
                "FROM inventory_stock WHERE product_id = $1 ORDER BY location_id",
                productId
            );
            for (const auto& row : result) {
                entries.push_back(rowToEntry(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findEntriesByProduct error: " << e.what() << std::endl;
            throw;
        }
        return entries;
    }

    std::vector<domain::StockEntry> findAllEntries() override {
        std::vector<domain::StockEntry> entries;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT product_id, location_id, on_hand, reserved, initial_on_hand, last_checked_at "
                "FROM inventory_stock ORDER BY product_id, location_id"
            );
            for (const auto& row : result) {
                entries.push_back(rowToEntry(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findAllEntries error: " << e.what() << std::endl;
            throw;
        }
        return entries;
    }

    bool insertEntry(const domain::StockEntry& entry) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO inventory_stock "
                "(product_id, location_id, on_hand, reserved, initial_on_hand, last_checked_at) "
                "VALUES ($1, $2, $3, $4, $5, $6::date) "
                "ON CONFLICT (product_id, location_id) DO NOTHING",
                entry.productId, entry.locationId, entry.onHand, entry.reserved,
                entry.initialOnHand, checkedAtParam(entry)
            );
            txn.commit();
            return result.affected_rows() == 1;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] insertEntry error: " << e.what() << std::endl;
            throw;
        }
    }

    bool compareAndSwap(const domain::StockEntry& expected, const domain::StockEntry& updated) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = conditionalUpdate(txn, expected, updated);
            txn.commit();
            return result.affected_rows() == 1;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] compareAndSwap error: " << e.what() << std::endl;
            throw;
        }
    }

    domain::JournalEntry commitMovement(const std::optional<domain::StockEntry>& expected,
                                        const domain::StockEntry& updated,
                                        const domain::JournalEntry& entry) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            pqxx::result stockResult;
            if (expected) {
                stockResult = conditionalUpdate(txn, *expected, updated);
            } else {
                stockResult = txn.exec_params(
                    "INSERT INTO inventory_stock "
                    "(product_id, location_id, on_hand, reserved, initial_on_hand, last_checked_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6::date) "
                    "ON CONFLICT (product_id, location_id) DO NOTHING",
                    updated.productId, updated.locationId, updated.onHand, updated.reserved,
                    updated.initialOnHand, checkedAtParam(updated)
                );
            }
            if (stockResult.affected_rows() != 1) {
                // work откатывается в деструкторе
                throw std::runtime_error("Stock row " + updated.key().toString() + " changed since it was read");
            }

            auto journalResult = txn.exec_params(
                "INSERT INTO inventory_journal "
                "(product_id, location_id, kind, delta, reference_type, reference_id, "
                " created_at_ms, actor, notes) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) RETURNING id",
                entry.key.productId, entry.key.locationId, domain::toString(entry.kind), entry.delta,
                domain::toString(entry.referenceKind), entry.referenceId,
                entry.timestamp.toUnixMillis(), entry.actor, entry.notes
            );
            txn.commit();

            domain::JournalEntry written = entry;
            written.id = journalResult[0][0].as<int64_t>();
            return written;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] commitMovement error: " << e.what() << std::endl;
            throw;
        }
    }

    // =========================================================================
    // IJournalRepository
    // =========================================================================

    std::vector<domain::JournalEntry> findByKey(const domain::StockKey& key,
                                                int64_t afterId,
                                                int64_t upToId,
                                                size_t limit) override {
        std::vector<domain::JournalEntry> entries;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, product_id, location_id, kind, delta, reference_type, reference_id, "
                "       created_at_ms, actor, notes "
                "FROM inventory_journal "
                "WHERE product_id = $1 AND location_id = $2 AND id > $3 AND id <= $4 "
                "ORDER BY id LIMIT $5",
                key.productId, key.locationId, afterId, upToId, static_cast<int64_t>(limit)
            );
            for (const auto& row : result) {
                entries.push_back(rowToJournal(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findByKey error: " << e.what() << std::endl;
            throw;
        }
        return entries;
    }

    std::vector<domain::JournalEntry> findByReference(domain::ReferenceKind kind,
                                                      const std::string& referenceId) override {
        std::vector<domain::JournalEntry> entries;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, product_id, location_id, kind, delta, reference_type, reference_id, "
                "       created_at_ms, actor, notes "
                "FROM inventory_journal WHERE reference_type = $1 AND reference_id = $2 "
                "ORDER BY id",
                domain::toString(kind), referenceId
            );
            for (const auto& row : result) {
                entries.push_back(rowToJournal(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findByReference error: " << e.what() << std::endl;
            throw;
        }
        return entries;
    }

    int64_t lastId() override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec("SELECT COALESCE(MAX(id), 0) FROM inventory_journal");
            txn.commit();
            return result[0][0].as<int64_t>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] lastId error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_stock (
                    product_id BIGINT NOT NULL,
                    location_id BIGINT NOT NULL,
                    on_hand BIGINT NOT NULL CHECK (on_hand >= 0),
                    reserved BIGINT NOT NULL DEFAULT 0,
                    initial_on_hand BIGINT NOT NULL DEFAULT 0,
                    last_checked_at DATE,
                    PRIMARY KEY (product_id, location_id),
                    CHECK (reserved >= 0 AND reserved <= on_hand)
                );

                CREATE TABLE IF NOT EXISTS inventory_journal (
                    id BIGSERIAL PRIMARY KEY,
                    product_id BIGINT NOT NULL,
                    location_id BIGINT NOT NULL,
                    kind VARCHAR(20) NOT NULL,
                    delta BIGINT NOT NULL,
                    reference_type VARCHAR(20) NOT NULL,
                    reference_id VARCHAR(128) NOT NULL,
                    created_at_ms BIGINT NOT NULL,
                    actor VARCHAR(100) NOT NULL DEFAULT '',
                    notes TEXT NOT NULL DEFAULT '',
                    FOREIGN KEY (product_id, location_id)
                        REFERENCES inventory_stock (product_id, location_id)
                );

                CREATE INDEX IF NOT EXISTS idx_inventory_journal_key
                ON inventory_journal(product_id, location_id, id);

                CREATE INDEX IF NOT EXISTS idx_inventory_journal_reference
                ON inventory_journal(reference_type, reference_id);
            )");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }

    static pqxx::result conditionalUpdate(pqxx::work& txn,
                                          const domain::StockEntry& expected,
                                          const domain::StockEntry& updated) {
        return txn.exec_params(
            "UPDATE inventory_stock SET on_hand = $1, reserved = $2, last_checked_at = $3::date "
            "WHERE product_id = $4 AND location_id = $5 AND on_hand = $6 AND reserved = $7",
            updated.onHand, updated.reserved, checkedAtParam(updated),
            expected.productId, expected.locationId, expected.onHand, expected.reserved
        );
    }

    static std::optional<std::string> checkedAtParam(const domain::StockEntry& entry) {
        if (!entry.lastCheckedAt) {
            return std::nullopt;
        }
        return entry.lastCheckedAt->toDateString();
    }

    static domain::StockEntry rowToEntry(const pqxx::row& row) {
        domain::StockEntry entry;
        entry.productId = row["product_id"].as<int64_t>();
        entry.locationId = row["location_id"].as<int64_t>();
        entry.onHand = row["on_hand"].as<int64_t>();
        entry.reserved = row["reserved"].as<int64_t>();
        entry.initialOnHand = row["initial_on_hand"].as<int64_t>();
        if (!row["last_checked_at"].is_null()) {
            entry.lastCheckedAt = domain::Timestamp::fromString(row["last_checked_at"].as<std::string>());
        }
        return entry;
    }

    static domain::JournalEntry rowToJournal(const pqxx::row& row) {
        domain::JournalEntry entry;
        entry.id = row["id"].as<int64_t>();
        entry.key = domain::StockKey{row["product_id"].as<int64_t>(), row["location_id"].as<int64_t>()};
        entry.kind = domain::journalKindFromString(row["kind"].as<std::string>());
        entry.delta = row["delta"].as<int64_t>();
        entry.referenceKind = domain::referenceKindFromString(row["reference_type"].as<std::string>());
        entry.referenceId = row["reference_id"].as<std::string>();
        entry.timestamp = domain::Timestamp::fromUnixMillis(row["created_at_ms"].as<int64_t>());
        entry.actor = row["actor"].as<std::string>();
        entry.notes = row["notes"].as<std::string>();
        return entry;
    }
};

} // namespace inventory::adapters::secondary
