#pragma once

#include "ports/output/ITransferRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <optional>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий перемещений
 *
 * insert не перезаписывает существующую строку (ON CONFLICT DO NOTHING),
 * save делает upsert по id. Ошибки логируются и пробрасываются дальше.
 */
class PostgresTransferRepository : public ports::output::ITransferRepository {
public:
    explicit PostgresTransferRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
        std::cout << "[PostgresTransferRepository] Initialized" << std::endl;
    }

    bool insert(const domain::Transfer& transfer) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO inventory_transfers "
                "(id, product_id, source_location_id, destination_location_id, quantity, status, "
                " requested_at_ms, dispatched_at_ms, completed_at_ms, notes, created_by) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11) "
                "ON CONFLICT (id) DO NOTHING",
                transfer.id, transfer.productId, transfer.sourceLocationId, transfer.destinationLocationId,
                transfer.quantity, domain::toString(transfer.status), transfer.requestedAt.toUnixMillis(),
                millisParam(transfer.dispatchedAt), millisParam(transfer.completedAt),
                transfer.notes, transfer.createdBy
            );
            txn.commit();
            return result.affected_rows() == 1;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransferRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    void save(const domain::Transfer& transfer) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO inventory_transfers "
                "(id, product_id, source_location_id, destination_location_id, quantity, status, "
                " requested_at_ms, dispatched_at_ms, completed_at_ms, notes, created_by) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11) "
                "ON CONFLICT (id) DO UPDATE SET "
                "status = EXCLUDED.status, dispatched_at_ms = EXCLUDED.dispatched_at_ms, "
                "completed_at_ms = EXCLUDED.completed_at_ms, notes = EXCLUDED.notes",
                transfer.id, transfer.productId, transfer.sourceLocationId, transfer.destinationLocationId,
                transfer.quantity, domain::toString(transfer.status), transfer.requestedAt.toUnixMillis(),
                millisParam(transfer.dispatchedAt), millisParam(transfer.completedAt),
                transfer.notes, transfer.createdBy
            );
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransferRepository] save error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Transfer> findById(const std::string& id) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(kColumns) + " FROM inventory_transfers WHERE id = $1",
                id
            );
            txn.commit();

            if (!result.empty()) {
                return rowToTransfer(result[0]);
            }
            return std::nullopt;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransferRepository] findById error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Transfer> findByStatus(domain::TransferStatus status) override {
        std::vector<domain::Transfer> transfers;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(kColumns) + " FROM inventory_transfers "
                "WHERE status = $1 ORDER BY requested_at_ms",
                domain::toString(status)
            );
            for (const auto& row : result) {
                transfers.push_back(rowToTransfer(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransferRepository] findByStatus error: " << e.what() << std::endl;
            throw;
        }
        return transfers;
    }

    std::vector<domain::Transfer> findAll() override {
        std::vector<domain::Transfer> transfers;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT " + std::string(kColumns) + " FROM inventory_transfers ORDER BY requested_at_ms"
            );
            for (const auto& row : result) {
                transfers.push_back(rowToTransfer(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransferRepository] findAll error: " << e.what() << std::endl;
            throw;
        }
        return transfers;
    }

private:
    static constexpr const char* kColumns =
        "id, product_id, source_location_id, destination_location_id, quantity, status, "
        "requested_at_ms, dispatched_at_ms, completed_at_ms, notes, created_by";

    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_transfers (
                    id VARCHAR(64) PRIMARY KEY,
                    product_id BIGINT NOT NULL,
                    source_location_id BIGINT NOT NULL,
                    destination_location_id BIGINT NOT NULL,
                    quantity BIGINT NOT NULL CHECK (quantity > 0),
                    status VARCHAR(20) NOT NULL,
                    requested_at_ms BIGINT NOT NULL,
                    dispatched_at_ms BIGINT,
                    completed_at_ms BIGINT,
                    notes TEXT NOT NULL DEFAULT '',
                    created_by VARCHAR(100) NOT NULL DEFAULT '',
                    CHECK (source_location_id <> destination_location_id)
                );

                CREATE INDEX IF NOT EXISTS idx_inventory_transfers_status
                ON inventory_transfers(status);
            )");

            txn.commit();
            std::cout << "[PostgresTransferRepository] Schema initialized" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransferRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }

    static std::optional<int64_t> millisParam(const std::optional<domain::Timestamp>& ts) {
        if (!ts) {
            return std::nullopt;
        }
        return ts->toUnixMillis();
    }

    static std::optional<domain::Timestamp> millisColumn(const pqxx::field& field) {
        if (field.is_null()) {
            return std::nullopt;
        }
        return domain::Timestamp::fromUnixMillis(field.as<int64_t>());
    }

    static domain::Transfer rowToTransfer(const pqxx::row& row) {
        domain::Transfer transfer;
        transfer.id = row["id"].as<std::string>();
        transfer.productId = row["product_id"].as<int64_t>();
        transfer.sourceLocationId = row["source_location_id"].as<int64_t>();
        transfer.destinationLocationId = row["destination_location_id"].as<int64_t>();
        transfer.quantity = row["quantity"].as<int64_t>();
        transfer.status = domain::transferStatusFromString(row["status"].as<std::string>());
        transfer.requestedAt = domain::Timestamp::fromUnixMillis(row["requested_at_ms"].as<int64_t>());
        transfer.dispatchedAt = millisColumn(row["dispatched_at_ms"]);
        transfer.completedAt = millisColumn(row["completed_at_ms"]);
        transfer.notes = row["notes"].as<std::string>();
        transfer.createdBy = row["created_by"].as<std::string>();
        return transfer;
    }
};

} // namespace inventory::adapters::secondary
