#pragma once

#include "ports/output/ISalesOrderRepository.hpp"
#include "settings/DbSettings.hpp"
#include "OrderLinesJson.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <optional>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий заказов покупателей
 *
 * Строки заказа хранятся в JSONB-колонке lines.
 */
class PostgresSalesOrderRepository : public ports::output::ISalesOrderRepository {
public:
    explicit PostgresSalesOrderRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
        std::cout << "[PostgresSalesOrderRepository] Initialized" << std::endl;
    }

    bool insert(const domain::SalesOrder& order) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "INSERT INTO inventory_sales_orders "
                "(id, customer_id, status, lines, order_date_ms, notes, created_by, updated_at_ms) "
                "VALUES ($1, $2, $3, $4::jsonb, $5, $6, $7, $8) "
                "ON CONFLICT (id) DO NOTHING",
                order.id, order.customerId, domain::toString(order.status), salesLinesToJson(order.lines),
                order.orderDate.toUnixMillis(), order.notes, order.createdBy, order.updatedAt.toUnixMillis()
            );
            txn.commit();
            return result.affected_rows() == 1;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSalesOrderRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    void save(const domain::SalesOrder& order) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO inventory_sales_orders "
                "(id, customer_id, status, lines, order_date_ms, notes, created_by, updated_at_ms) "
                "VALUES ($1, $2, $3, $4::jsonb, $5, $6, $7, $8) "
                "ON CONFLICT (id) DO UPDATE SET "
                "status = EXCLUDED.status, lines = EXCLUDED.lines, "
                "notes = EXCLUDED.notes, updated_at_ms = EXCLUDED.updated_at_ms",
                order.id, order.customerId, domain::toString(order.status), salesLinesToJson(order.lines),
                order.orderDate.toUnixMillis(), order.notes, order.createdBy, order.updatedAt.toUnixMillis()
            );
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSalesOrderRepository] save error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::SalesOrder> findById(const std::string& id) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, customer_id, status, lines::text AS lines, order_date_ms, notes, "
                "       created_by, updated_at_ms "
                "FROM inventory_sales_orders WHERE id = $1",
                id
            );
            txn.commit();

            if (!result.empty()) {
                return rowToOrder(result[0]);
            }
            return std::nullopt;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSalesOrderRepository] findById error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::SalesOrder> findByStatus(domain::SalesOrderStatus status) override {
        std::vector<domain::SalesOrder> orders;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT id, customer_id, status, lines::text AS lines, order_date_ms, notes, "
                "       created_by, updated_at_ms "
                "FROM inventory_sales_orders WHERE status = $1 ORDER BY order_date_ms",
                domain::toString(status)
            );
            for (const auto& row : result) {
                orders.push_back(rowToOrder(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSalesOrderRepository] findByStatus error: " << e.what() << std::endl;
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
                CREATE TABLE IF NOT EXISTS inventory_sales_orders (
                    id VARCHAR(64) PRIMARY KEY,
                    customer_id BIGINT NOT NULL,
                    status VARCHAR(20) NOT NULL,
                    lines JSONB NOT NULL DEFAULT '[]',
                    order_date_ms BIGINT NOT NULL,
                    notes TEXT NOT NULL DEFAULT '',
                    created_by VARCHAR(100) NOT NULL DEFAULT '',
                    updated_at_ms BIGINT NOT NULL
                );

                CREATE INDEX IF NOT EXISTS idx_inventory_sales_orders_status
                ON inventory_sales_orders(status);
            )");

            txn.commit();
            std::cout << "[PostgresSalesOrderRepository] Schema initialized" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSalesOrderRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }

    static domain::SalesOrder rowToOrder(const pqxx::row& row) {
        domain::SalesOrder order;
        order.id = row["id"].as<std::string>();
        order.customerId = row["customer_id"].as<int64_t>();
        order.status = domain::salesOrderStatusFromString(row["status"].as<std::string>());
        order.lines = salesLinesFromJson(row["lines"].as<std::string>());
        order.orderDate = domain::Timestamp::fromUnixMillis(row["order_date_ms"].as<int64_t>());
        order.notes = row["notes"].as<std::string>();
        order.createdBy = row["created_by"].as<std::string>();
        order.updatedAt = domain::Timestamp::fromUnixMillis(row["updated_at_ms"].as<int64_t>());
        return order;
    }
};

} // namespace inventory::adapters::secondary
