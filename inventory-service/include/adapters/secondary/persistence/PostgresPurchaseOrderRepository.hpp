#pragma once

#include "ports/output/IPurchaseOrderRepository.hpp"
#include "settings/DbSettings.hpp"
#include "OrderLinesJson.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <optional>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий заказов поставщикам
 *
 * Строки заказа хранятся в колонке lines (JSONB) вместе с шапкой,
 * поэтому save меняет заказ и его строки одной командой.
 */
class PostgresPurchaseOrderRepository : public ports::output::IPurchaseOrderRepository {
public:
    explicit PostgresPurchaseOrderRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
        std::cout << "[PostgresPurchaseOrderRepository] Initialized" << std::endl;
    }

    bool insert(const domain::PurchaseOrder& order) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO inventory_purchase_orders "
                "(id, supplier_id, status, lines, order_date_ms, expected_delivery_ms, "
                " actual_delivery_ms, notes, created_by, updated_at_ms) "
                "VALUES ($1, $2, $3, $4::jsonb, $5, $6, $7, $8, $9, $10) "
                "ON CONFLICT (id) DO NOTHING",
                order.id, order.supplierId, domain::toString(order.status), purchaseLinesToJson(order.lines),
                order.orderDate.toUnixMillis(), millisParam(order.expectedDeliveryDate),
                millisParam(order.actualDeliveryDate), order.notes, order.createdBy,
                order.updatedAt.toUnixMillis()
            );
            txn.commit();
            return result.affected_rows() == 1;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPurchaseOrderRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    void save(const domain::PurchaseOrder& order) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO inventory_purchase_orders "
                "(id, supplier_id, status, lines, order_date_ms, expected_delivery_ms, "
                " actual_delivery_ms, notes, created_by, updated_at_ms) "
                "VALUES ($1, $2, $3, $4::jsonb, $5, $6, $7, $8, $9, $10) "
                "ON CONFLICT (id) DO UPDATE SET "
                "status = EXCLUDED.status, lines = EXCLUDED.lines, "
                "expected_delivery_ms = EXCLUDED.expected_delivery_ms, "
                "actual_delivery_ms = EXCLUDED.actual_delivery_ms, "
                "notes = EXCLUDED.notes, updated_at_ms = EXCLUDED.updated_at_ms",
                order.id, order.supplierId, domain::toString(order.status), purchaseLinesToJson(order.lines),
                order.orderDate.toUnixMillis(), millisParam(order.expectedDeliveryDate),
                millisParam(order.actualDeliveryDate), order.notes, order.createdBy,
                order.updatedAt.toUnixMillis()
            );
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPurchaseOrderRepository] save error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::PurchaseOrder> findById(const std::string& id) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, supplier_id, status, lines::text AS lines, order_date_ms, expected_delivery_ms, "
                "       actual_delivery_ms, notes, created_by, updated_at_ms "
                "FROM inventory_purchase_orders WHERE id = $1",
                id
            );
            txn.commit();

            if (!result.empty()) {
                return rowToOrder(result[0]);
            }
            return std::nullopt;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPurchaseOrderRepository] findById error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::PurchaseOrder> findAll() override {
        std::vector<domain::PurchaseOrder> orders;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT id, supplier_id, status, lines::text AS lines, order_date_ms, expected_delivery_ms, "
                "       actual_delivery_ms, notes, created_by, updated_at_ms "
                "FROM inventory_purchase_orders ORDER BY order_date_ms"
            );
            for (const auto& row : result) {
                orders.push_back(rowToOrder(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPurchaseOrderRepository] findAll error: " << e.what() << std::endl;
            throw;
        }
        return orders;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_purchase_orders (
                    id VARCHAR(64) PRIMARY KEY,
                    supplier_id BIGINT NOT NULL,
                    status VARCHAR(20) NOT NULL,
                    lines JSONB NOT NULL DEFAULT '[]',
                    order_date_ms BIGINT NOT NULL,
                    expected_delivery_ms BIGINT,
                    actual_delivery_ms BIGINT,
                    notes TEXT NOT NULL DEFAULT '',
                    created_by VARCHAR(100) NOT NULL DEFAULT '',
                    updated_at_ms BIGINT NOT NULL
                );
            )");

            txn.commit();
            std::cout << "[PostgresPurchaseOrderRepository] Schema initialized" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresPurchaseOrderRepository] initSchema error: " << e.what() << std::endl;
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

    static domain::PurchaseOrder rowToOrder(const pqxx::row& row) {
        domain::PurchaseOrder order;
        order.id = row["id"].as<std::string>();
        order.supplierId = row["supplier_id"].as<int64_t>();
        order.status = domain::purchaseOrderStatusFromString(row["status"].as<std::string>());
        order.lines = purchaseLinesFromJson(row["lines"].as<std::string>());
        order.orderDate = domain::Timestamp::fromUnixMillis(row["order_date_ms"].as<int64_t>());
        order.expectedDeliveryDate = millisColumn(row["expected_delivery_ms"]);
        order.actualDeliveryDate = millisColumn(row["actual_delivery_ms"]);
        order.notes = row["notes"].as<std::string>();
        order.createdBy = row["created_by"].as<std::string>();
        order.updatedAt = domain::Timestamp::fromUnixMillis(row["updated_at_ms"].as<int64_t>());
        return order;
    }
};

} // namespace inventory::adapters::secondary
