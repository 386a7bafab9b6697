#pragma once

#include "application/StockLedger.hpp"
#include "application/StorageGuard.hpp"
#include "ports/output/IReservationRepository.hpp"
#include "domain/Reservation.hpp"
#include "domain/OperationResult.hpp"
#include <KeyedMutex.hpp>
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace inventory::application {

/**
 * @brief Резервирование стока под заказы
 *
 * Резервирует все строки заказа или ни одной. Какие резервы принадлежат
 * какому заказу, хранит IReservationRepository; сами количества
 * изменяет только StockLedger.
 *
 * Выбор склада для строки:
 * - явно указанный locationId;
 * - иначе склад с наибольшим available, при равенстве с меньшим locationId.
 * Строка никогда не делится между складами.
 *
 * @example
 * ```
 * line 1: product 2, qty 10 (available 40 @1, 45 @2)  → 2@2
 * line 2: product 5, qty 500 (available 100 @1)       → INSUFFICIENT_AVAILABLE
 * Итог: PARTIAL_RESERVATION_FAILURE, lineId=2, резерв 2@2 снят
 * ```
 */
class ReservationManager {
public:
    ReservationManager(
        std::shared_ptr<StockLedger> ledger,
        std::shared_ptr<ports::output::IReservationRepository> reservationRepository
    ) : ledger_(std::move(ledger))
      , reservationRepository_(std::move(reservationRepository))
    {}

    /**
     * @brief Зарезервировать все строки заказа
     *
     * При отказе любой строки снимает то, что успело зарезервировать
     * это же обращение, и возвращает PARTIAL_RESERVATION_FAILURE
     * с cause и lineId строки-виновника.
     */
    domain::OperationResult reserveForOrder(const std::string& orderId,
                                            const std::vector<domain::ReservationLine>& lines) {
        return guardStorage<domain::OperationResult>("ReservationManager", "reserveForOrder " + orderId,
            [&]() { return doReserve(orderId, lines); });
    }

    /**
     * @brief Снять все резервы заказа
     *
     * Повторный вызов ничего не делает и возвращает успех.
     */
    domain::OperationResult releaseForOrder(const std::string& orderId) {
        return guardStorage<domain::OperationResult>("ReservationManager", "releaseForOrder " + orderId,
            [&]() { return doRelease(orderId); });
    }

    /**
     * @brief Списать зарезервированное по всем строкам заказа
     *
     * Для каждой строки consumeReserved(kind=sale, reference=sale_item
     * "<orderId>:<lineId>"). При ошибке уже списанные строки
     * возвращаются на склад и снова резервируются.
     */
    domain::OperationResult commitForOrder(const std::string& orderId, const std::string& actor) {
        return guardStorage<domain::OperationResult>("ReservationManager", "commitForOrder " + orderId,
            [&]() { return doCommit(orderId, actor); });
    }

    std::vector<domain::Reservation> reservationsFor(const std::string& orderId) const {
        return reservationRepository_->findByOrderId(orderId);
    }

private:
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<ports::output::IReservationRepository> reservationRepository_;
    KeyedMutex<std::string> orderLocks_;

    domain::OperationResult doReserve(const std::string& orderId,
                                      const std::vector<domain::ReservationLine>& lines) {
        auto orderLock = orderLocks_.lock(orderId);

        if (lines.empty()) {
            return domain::OperationResult::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Order " + orderId + " has no lines to reserve");
        }
        if (!reservationRepository_->findByOrderId(orderId).empty()) {
            return domain::OperationResult::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Order " + orderId + " already holds reservations");
        }

        // Кандидаты для каждой строки
        std::vector<std::vector<domain::StockKey>> candidates;
        std::vector<domain::StockKey> allKeys;
        for (const auto& line : lines) {
            if (line.quantity <= 0) {
                auto result = domain::OperationResult::failure(domain::ErrorCode::INVALID_ARGUMENT,
                    "Line " + std::to_string(line.lineId) + " has non-positive quantity");
                result.lineId = line.lineId;
                return result;
            }

            std::vector<domain::StockKey> keys;
            if (line.locationId) {
                keys.push_back(domain::StockKey{line.productId, *line.locationId});
            } else {
                auto stocked = ledger_->findByProduct(line.productId);
                if (!stocked.isSuccess()) {
                    domain::OperationResult result = stocked;
                    result.lineId = line.lineId;
                    return result;
                }
                for (const auto& entry : *stocked.value) {
                    keys.push_back(entry.key());
                }
            }
            allKeys.insert(allKeys.end(), keys.begin(), keys.end());
            candidates.push_back(std::move(keys));
        }

        auto scope = ledger_->lock(allKeys);

        std::vector<domain::Reservation> made;
        for (size_t i = 0; i < lines.size(); ++i) {
            const auto& line = lines[i];

            domain::OperationResult lineResult;
            auto key = selectLocation(line, candidates[i]);
            if (!key.isSuccess()) {
                lineResult = key;
            } else {
                lineResult = ledger_->reserve(scope, *key.value, line.quantity);
            }

            if (!lineResult.isSuccess()) {
                rollback(scope, made);
                std::cout << "[ReservationManager] Order " << orderId << " line " << line.lineId
                          << " failed: " << lineResult.message << std::endl;

                auto result = domain::OperationResult::failure(domain::ErrorCode::PARTIAL_RESERVATION_FAILURE,
                    "Order " + orderId + " line " + std::to_string(line.lineId) + ": " + lineResult.message);
                result.cause = lineResult.error;
                result.lineId = line.lineId;
                return result;
            }

            domain::Reservation reservation;
            reservation.orderId = orderId;
            reservation.lineId = line.lineId;
            reservation.key = *key.value;
            reservation.quantity = line.quantity;
            made.push_back(reservation);
        }

        try {
            reservationRepository_->saveAll(orderId, made);
        } catch (const std::exception& e) {
            // Резерв не должен остаться без заказа-владельца
            rollback(scope, made);
            std::cerr << "[ReservationManager] Saving reservations of " << orderId << " failed: " << e.what() << std::endl;
            return domain::OperationResult::failure(domain::ErrorCode::STORAGE_FAILURE,
                "Saving reservations of order " + orderId + " failed: " + e.what());
        }
        std::cout << "[ReservationManager] Reserved " << made.size() << " line(s) for order " << orderId << std::endl;
        return domain::OperationResult::ok("Reserved " + std::to_string(made.size()) + " line(s)");
    }

    domain::OperationResult doRelease(const std::string& orderId) {
        auto orderLock = orderLocks_.lock(orderId);

        auto taken = reservationRepository_->takeByOrderId(orderId);
        if (taken.empty()) {
            return domain::OperationResult::ok("Nothing to release");
        }

        auto scope = ledger_->lock(keysOf(taken));

        std::vector<domain::Reservation> failed;
        domain::OperationResult firstFailure;
        for (const auto& reservation : taken) {
            auto result = ledger_->release(scope, reservation.key, reservation.quantity);
            if (!result.isSuccess()) {
                std::cerr << "[ReservationManager] Release failed for " << reservation.lineReference()
                          << ": " << result.message << std::endl;
                if (firstFailure.isSuccess()) {
                    firstFailure = result;
                }
                failed.push_back(reservation);
            }
        }

        if (!failed.empty()) {
            // Невыполненные резервы остаются за заказом, повтор их снимет
            reservationRepository_->saveAll(orderId, failed);
            return firstFailure;
        }

        std::cout << "[ReservationManager] Released " << taken.size() << " line(s) for order " << orderId << std::endl;
        return domain::OperationResult::ok("Released " + std::to_string(taken.size()) + " line(s)");
    }

    domain::OperationResult doCommit(const std::string& orderId, const std::string& actor) {
        auto orderLock = orderLocks_.lock(orderId);

        auto reservations = reservationRepository_->findByOrderId(orderId);
        if (reservations.empty()) {
            return domain::OperationResult::failure(domain::ErrorCode::UNKNOWN_ENTITY,
                "Order " + orderId + " holds no reservations");
        }

        auto scope = ledger_->lock(keysOf(reservations));

        std::vector<domain::Reservation> consumed;
        for (const auto& reservation : reservations) {
            domain::MovementMeta meta;
            meta.kind = domain::JournalKind::SALE;
            meta.referenceKind = domain::ReferenceKind::SALE_LINE;
            meta.referenceId = reservation.lineReference();
            meta.actor = actor;

            auto result = ledger_->consumeReserved(scope, reservation.key, reservation.quantity, meta);
            if (!result.isSuccess()) {
                compensate(scope, consumed, actor);
                domain::OperationResult failure = result;
                failure.lineId = reservation.lineId;
                return failure;
            }
            consumed.push_back(reservation);
        }

        reservationRepository_->takeByOrderId(orderId);
        std::cout << "[ReservationManager] Committed " << consumed.size() << " line(s) for order " << orderId << std::endl;
        return domain::OperationResult::ok("Committed " + std::to_string(consumed.size()) + " line(s)");
    }

    domain::Result<domain::StockKey> selectLocation(const domain::ReservationLine& line,
                                                    const std::vector<domain::StockKey>& candidates) const {
        if (line.locationId) {
            return domain::Result<domain::StockKey>::success(candidates.front());
        }

        std::optional<domain::StockKey> best;
        int64_t bestAvailable = 0;
        for (const auto& key : candidates) {
            auto entry = ledger_->find(key);
            if (entry.error == domain::ErrorCode::UNKNOWN_ENTITY) {
                continue;
            }
            if (!entry.isSuccess()) {
                return domain::Result<domain::StockKey>::from(entry);
            }
            if (!best || entry.value->available() > bestAvailable ||
                (entry.value->available() == bestAvailable && key.locationId < best->locationId)) {
                best = key;
                bestAvailable = entry.value->available();
            }
        }
        if (!best) {
            return domain::Result<domain::StockKey>::failure(domain::ErrorCode::UNKNOWN_ENTITY,
                "Product " + std::to_string(line.productId) + " is not stocked anywhere");
        }
        return domain::Result<domain::StockKey>::success(*best);
    }

    void rollback(const StockLedger::Scope& scope, const std::vector<domain::Reservation>& made) {
        for (auto it = made.rbegin(); it != made.rend(); ++it) {
            auto result = ledger_->release(scope, it->key, it->quantity);
            if (!result.isSuccess()) {
                std::cerr << "[ReservationManager] Rollback release failed for " << it->lineReference()
                          << ": " << result.message << std::endl;
            }
        }
    }

    void compensate(const StockLedger::Scope& scope,
                    const std::vector<domain::Reservation>& consumed,
                    const std::string& actor) {
        for (auto it = consumed.rbegin(); it != consumed.rend(); ++it) {
            domain::MovementMeta meta;
            meta.kind = domain::JournalKind::ADJUSTMENT;
            meta.referenceKind = domain::ReferenceKind::SALE_LINE;
            meta.referenceId = it->lineReference();
            meta.actor = actor;
            meta.notes = "compensation";

            auto restored = ledger_->adjust(scope, it->key, it->quantity, meta);
            if (restored.isSuccess()) {
                restored = domain::Result<domain::StockEntry>::from(ledger_->reserve(scope, it->key, it->quantity));
            }
            if (!restored.isSuccess()) {
                std::cerr << "[ReservationManager] Compensation failed for " << it->lineReference()
                          << ": " << restored.message << std::endl;
            }
        }
    }

    static std::vector<domain::StockKey> keysOf(const std::vector<domain::Reservation>& reservations) {
        std::vector<domain::StockKey> keys;
        keys.reserve(reservations.size());
        for (const auto& r : reservations) {
            keys.push_back(r.key);
        }
        return keys;
    }
};

} // namespace inventory::application
