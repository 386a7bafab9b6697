#pragma once

#include "ports/output/IReservationRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <iostream>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL учёт резервов по заказам
 *
 * saveAll заменяет набор резервов заказа в одной транзакции,
 * takeByOrderId забирает его одним DELETE ... RETURNING.
 */
class PostgresReservationRepository : public ports::output::IReservationRepository {
public:
    explicit PostgresReservationRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
        std::cout << "[PostgresReservationRepository] Initialized" << std::endl;
    }

    void saveAll(const std::string& orderId, const std::vector<domain::Reservation>& reservations) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params("DELETE FROM inventory_reservations WHERE order_id = $1", orderId);
            for (const auto& reservation : reservations) {
                txn.exec_params(
                    "INSERT INTO inventory_reservations (order_id, line_id, product_id, location_id, quantity) "
                    "VALUES ($1, $2, $3, $4, $5)",
                    orderId, reservation.lineId, reservation.key.productId,
                    reservation.key.locationId, reservation.quantity
                );
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReservationRepository] saveAll error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::Reservation> findByOrderId(const std::string& orderId) override {
        std::vector<domain::Reservation> reservations;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT order_id, line_id, product_id, location_id, quantity "
                "FROM inventory_reservations WHERE order_id = $1 ORDER BY line_id",
                orderId
            );
            for (const auto& row : result) {
                reservations.push_back(rowToReservation(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReservationRepository] findByOrderId error: " << e.what() << std::endl;
            throw;
        }
        return reservations;
    }

    std::vector<domain::Reservation> takeByOrderId(const std::string& orderId) override {
        std::vector<domain::Reservation> reservations;
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "DELETE FROM inventory_reservations WHERE order_id = $1 "
                "RETURNING order_id, line_id, product_id, location_id, quantity",
                orderId
            );
            for (const auto& row : result) {
                reservations.push_back(rowToReservation(row));
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReservationRepository] takeByOrderId error: " << e.what() << std::endl;
            throw;
        }
        std::sort(reservations.begin(), reservations.end(),
            [](const domain::Reservation& a, const domain::Reservation& b) { return a.lineId < b.lineId; });
        return reservations;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_reservations (
                    order_id VARCHAR(64) NOT NULL,
                    line_id BIGINT NOT NULL,
                    product_id BIGINT NOT NULL,
                    location_id BIGINT NOT NULL,
                    quantity BIGINT NOT NULL CHECK (quantity > 0),
                    PRIMARY KEY (order_id, line_id)
                );
            )");

            txn.commit();
            std::cout << "[PostgresReservationRepository] Schema initialized" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresReservationRepository] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }

    static domain::Reservation rowToReservation(const pqxx::row& row) {
        domain::Reservation reservation;
        reservation.orderId = row["order_id"].as<std::string>();
        reservation.lineId = row["line_id"].as<int64_t>();
        reservation.key = domain::StockKey{row["product_id"].as<int64_t>(), row["location_id"].as<int64_t>()};
        reservation.quantity = row["quantity"].as<int64_t>();
        return reservation;
    }
};

} // namespace inventory::adapters::secondary
