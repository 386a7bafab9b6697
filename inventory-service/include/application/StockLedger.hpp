// include/application/StockLedger.hpp
#pragma once

#include "application/AuditEmitter.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "domain/StockEntry.hpp"
#include "domain/JournalEntry.hpp"
#include "domain/OperationResult.hpp"
#include <KeyedMutex.hpp>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace inventory::application {

/**
 * @brief Ледджер складских остатков
 *
 * Единственный, кто изменяет onHand/reserved. Каждое движение
 * (adjust, consumeReserved, recordCount) фиксируется в хранилище
 * вместе с одной записью журнала.
 *
 * Потокобезопасность:
 * - операции над одним ключом сериализуются мьютексом ключа;
 * - операции над разными ключами идут параллельно;
 * - многоключевые операции берут Scope через lock(keys), ключи
 *   захватываются по возрастанию StockKey, затем вызывают
 *   перегрузки с Scope.
 *
 * @example
 * ```cpp
 * auto scope = ledger->lock({keyA, keyB});
 * auto r = ledger->reserve(scope, keyA, 10);
 * if (r.isSuccess()) {
 *     ledger->reserve(scope, keyB, 5);
 * }
 * ```
 */
class StockLedger {
public:
    using KeyLocks = KeyedMutex<domain::StockKey, domain::StockKeyHash>;
    using Scope = KeyLocks::MultiLock;

    StockLedger(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<AuditEmitter> audit
    ) : store_(std::move(store))
      , audit_(std::move(audit))
    {
        std::cout << "[StockLedger] Created" << std::endl;
    }

    /**
     * @brief Захватить ключи в глобальном порядке
     */
    Scope lock(std::vector<domain::StockKey> keys) {
        return locks_.lockAll(std::move(keys));
    }

    // =========================================================================
    // Чтение
    // =========================================================================

    /**
     * @brief Прочитать позицию
     *
     * UNKNOWN_ENTITY если позиция не зарегистрирована,
     * STORAGE_FAILURE если хранилище недоступно.
     */
    domain::Result<domain::StockEntry> find(const domain::StockKey& key) const {
        try {
            auto entry = store_->findEntry(key);
            if (!entry) {
                return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::UNKNOWN_ENTITY,
                    "Unknown stock entry: " + key.toString());
            }
            return domain::Result<domain::StockEntry>::success(*entry);
        } catch (const std::exception& e) {
            return storageFailure<domain::StockEntry>("find", key, e);
        }
    }

    domain::Result<std::vector<domain::StockEntry>> findByProduct(int64_t productId) const {
        try {
            return domain::Result<std::vector<domain::StockEntry>>::success(store_->findEntriesByProduct(productId));
        } catch (const std::exception& e) {
            std::cerr << "[StockLedger] findByProduct " << productId << " storage error: " << e.what() << std::endl;
            return domain::Result<std::vector<domain::StockEntry>>::failure(domain::ErrorCode::STORAGE_FAILURE,
                "findByProduct failed for product " + std::to_string(productId) + ": " + e.what());
        }
    }

    domain::Result<std::vector<domain::StockEntry>> findAll() const {
        try {
            return domain::Result<std::vector<domain::StockEntry>>::success(store_->findAllEntries());
        } catch (const std::exception& e) {
            std::cerr << "[StockLedger] findAll storage error: " << e.what() << std::endl;
            return domain::Result<std::vector<domain::StockEntry>>::failure(domain::ErrorCode::STORAGE_FAILURE,
                std::string("findAll failed: ") + e.what());
        }
    }

    // =========================================================================
    // Регистрация позиции
    // =========================================================================

    /**
     * @brief Зарегистрировать позицию с начальным остатком
     *
     * Начальный остаток не пишется в журнал: он становится initialOnHand,
     * от которого считается сумма движений.
     */
    domain::Result<domain::StockEntry> provision(
        const domain::StockKey& key,
        int64_t onHand,
        int64_t reserved,
        std::optional<domain::Timestamp> lastCheckedAt = std::nullopt)
    {
        if (onHand < 0 || reserved < 0 || reserved > onHand) {
            return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Invalid initial balance for " + key.toString() +
                ": onHand=" + std::to_string(onHand) + " reserved=" + std::to_string(reserved));
        }

        auto scope = lock({key});
        domain::StockEntry entry = domain::StockEntry::empty(key);
        entry.onHand = onHand;
        entry.reserved = reserved;
        entry.initialOnHand = onHand;
        entry.lastCheckedAt = lastCheckedAt;

        try {
            if (!store_->insertEntry(entry)) {
                return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                    "Stock entry already provisioned: " + key.toString());
            }
        } catch (const std::exception& e) {
            return storageFailure<domain::StockEntry>("provision", key, e);
        }

        std::cout << "[StockLedger] Provisioned " << key.toString()
                  << " onHand=" << onHand << " reserved=" << reserved << std::endl;
        return domain::Result<domain::StockEntry>::success(entry);
    }

    // =========================================================================
    // Движения (с записью в журнал)
    // =========================================================================

    domain::Result<domain::StockEntry> adjust(
        const domain::StockKey& key, int64_t delta, const domain::MovementMeta& meta)
    {
        auto scope = lock({key});
        return adjust(scope, key, delta, meta);
    }

    /**
     * @brief Изменить onHand на delta и записать движение в журнал
     *
     * Позиция, которой ещё нет, создаётся с onHand=0.
     * INSUFFICIENT_STOCK если onHand стал бы < 0 или < reserved,
     * INVALID_ARGUMENT если onHand вышел бы за пределы int64.
     */
    domain::Result<domain::StockEntry> adjust(
        const Scope& scope, const domain::StockKey& key, int64_t delta, const domain::MovementMeta& meta)
    {
        requireHeld(scope, key);
        if (delta == 0) {
            return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Zero delta for " + key.toString());
        }

        try {
            auto current = store_->findEntry(key);
            domain::StockEntry updated = current ? *current : domain::StockEntry::empty(key);
            if (delta > 0 && updated.onHand > std::numeric_limits<int64_t>::max() - delta) {
                return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                    "Adjust " + std::to_string(delta) + " overflows onHand " +
                    std::to_string(updated.onHand) + " at " + key.toString());
            }
            int64_t newOnHand = updated.onHand + delta;

            if (newOnHand < 0 || newOnHand < updated.reserved) {
                std::cout << "[StockLedger] REJECTED adjust " << key.toString() << " by " << delta
                          << ": onHand=" << updated.onHand << " reserved=" << updated.reserved << std::endl;
                return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::INSUFFICIENT_STOCK,
                    "Insufficient stock at " + key.toString() + ": onHand=" + std::to_string(updated.onHand) +
                    " reserved=" + std::to_string(updated.reserved) + " delta=" + std::to_string(delta));
            }

            updated.onHand = newOnHand;
            return commit(current, updated, domain::JournalEntry::from(key, delta, meta));

        } catch (const std::exception& e) {
            return storageFailure<domain::StockEntry>("adjust", key, e);
        }
    }

    domain::Result<domain::StockEntry> consumeReserved(
        const domain::StockKey& key, int64_t quantity, const domain::MovementMeta& meta)
    {
        auto scope = lock({key});
        return consumeReserved(scope, key, quantity, meta);
    }

    /**
     * @brief Списать зарезервированное количество
     *
     * reserved и onHand уменьшаются на quantity одним шагом с одной
     * записью журнала (delta = -quantity), поэтому reserved <= onHand
     * сохраняется в любой момент.
     */
    domain::Result<domain::StockEntry> consumeReserved(
        const Scope& scope, const domain::StockKey& key, int64_t quantity, const domain::MovementMeta& meta)
    {
        requireHeld(scope, key);
        if (quantity <= 0) {
            return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Quantity must be positive: " + std::to_string(quantity));
        }

        try {
            auto current = store_->findEntry(key);
            if (!current) {
                return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::UNKNOWN_ENTITY,
                    "Unknown stock entry: " + key.toString());
            }
            if (quantity > current->reserved) {
                return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::OVER_RELEASE,
                    "Consume " + std::to_string(quantity) + " exceeds reserved " +
                    std::to_string(current->reserved) + " at " + key.toString());
            }

            domain::StockEntry updated = *current;
            updated.reserved -= quantity;
            updated.onHand -= quantity;
            return commit(current, updated, domain::JournalEntry::from(key, -quantity, meta));

        } catch (const std::exception& e) {
            return storageFailure<domain::StockEntry>("consumeReserved", key, e);
        }
    }

    /**
     * @brief Зафиксировать результат инвентаризации
     *
     * Разница между фактом и учётом пишется как ADJUSTMENT,
     * lastCheckedAt обновляется в любом случае.
     */
    domain::Result<domain::StockEntry> recordCount(
        const domain::StockKey& key, int64_t countedOnHand, domain::MovementMeta meta)
    {
        if (countedOnHand < 0) {
            return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Counted quantity must be non-negative: " + std::to_string(countedOnHand));
        }

        auto scope = lock({key});
        try {
            auto current = store_->findEntry(key);
            if (!current) {
                return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::UNKNOWN_ENTITY,
                    "Unknown stock entry: " + key.toString());
            }
            if (countedOnHand < current->reserved) {
                return domain::Result<domain::StockEntry>::failure(domain::ErrorCode::INSUFFICIENT_STOCK,
                    "Counted " + std::to_string(countedOnHand) + " is below reserved " +
                    std::to_string(current->reserved) + " at " + key.toString());
            }

            domain::StockEntry updated = *current;
            updated.onHand = countedOnHand;
            updated.lastCheckedAt = domain::Timestamp::now();

            int64_t delta = countedOnHand - current->onHand;
            if (delta == 0) {
                if (!store_->compareAndSwap(*current, updated)) {
                    return concurrentModification<domain::StockEntry>(key);
                }
                std::cout << "[StockLedger] Count confirmed " << key.toString() << " onHand=" << countedOnHand << std::endl;
                return domain::Result<domain::StockEntry>::success(updated);
            }

            meta.kind = domain::JournalKind::ADJUSTMENT;
            return commit(current, updated, domain::JournalEntry::from(key, delta, meta));

        } catch (const std::exception& e) {
            return storageFailure<domain::StockEntry>("recordCount", key, e);
        }
    }

    // =========================================================================
    // Резервы (без записи в журнал)
    // =========================================================================

    domain::OperationResult reserve(const domain::StockKey& key, int64_t quantity) {
        auto scope = lock({key});
        return reserve(scope, key, quantity);
    }

    /**
     * @brief Зарезервировать: reserved += quantity
     *
     * INSUFFICIENT_AVAILABLE если quantity > available,
     * UNKNOWN_ENTITY если позиция не зарегистрирована.
     */
    domain::OperationResult reserve(const Scope& scope, const domain::StockKey& key, int64_t quantity) {
        requireHeld(scope, key);
        if (quantity <= 0) {
            return domain::OperationResult::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Quantity must be positive: " + std::to_string(quantity));
        }

        try {
            auto current = store_->findEntry(key);
            if (!current) {
                return domain::OperationResult::failure(domain::ErrorCode::UNKNOWN_ENTITY,
                    "Unknown stock entry: " + key.toString());
            }
            if (quantity > current->available()) {
                return domain::OperationResult::failure(domain::ErrorCode::INSUFFICIENT_AVAILABLE,
                    "Insufficient available at " + key.toString() + ": requested=" + std::to_string(quantity) +
                    " available=" + std::to_string(current->available()));
            }

            domain::StockEntry updated = *current;
            updated.reserved += quantity;
            if (!store_->compareAndSwap(*current, updated)) {
                return concurrentModification<domain::StockEntry>(key);
            }

            std::cout << "[StockLedger] Reserved " << quantity << " at " << key.toString()
                      << " (reserved=" << updated.reserved << ")" << std::endl;
            audit_->reservationChanged("stock.reserved", updated, quantity);
            return domain::OperationResult::ok();

        } catch (const std::exception& e) {
            return storageFailure<domain::StockEntry>("reserve", key, e);
        }
    }

    domain::OperationResult release(const domain::StockKey& key, int64_t quantity) {
        auto scope = lock({key});
        return release(scope, key, quantity);
    }

    /**
     * @brief Снять резерв: reserved -= quantity
     *
     * OVER_RELEASE если quantity > reserved (ошибка вызывающего).
     */
    domain::OperationResult release(const Scope& scope, const domain::StockKey& key, int64_t quantity) {
        requireHeld(scope, key);
        if (quantity <= 0) {
            return domain::OperationResult::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Quantity must be positive: " + std::to_string(quantity));
        }

        try {
            auto current = store_->findEntry(key);
            if (!current) {
                return domain::OperationResult::failure(domain::ErrorCode::UNKNOWN_ENTITY,
                    "Unknown stock entry: " + key.toString());
            }
            if (quantity > current->reserved) {
                std::cerr << "[StockLedger] Over-release at " << key.toString() << ": " << quantity
                          << " > reserved " << current->reserved << std::endl;
                return domain::OperationResult::failure(domain::ErrorCode::OVER_RELEASE,
                    "Release " + std::to_string(quantity) + " exceeds reserved " +
                    std::to_string(current->reserved) + " at " + key.toString());
            }

            domain::StockEntry updated = *current;
            updated.reserved -= quantity;
            if (!store_->compareAndSwap(*current, updated)) {
                return concurrentModification<domain::StockEntry>(key);
            }

            std::cout << "[StockLedger] Released " << quantity << " at " << key.toString()
                      << " (reserved=" << updated.reserved << ")" << std::endl;
            audit_->reservationChanged("stock.released", updated, quantity);
            return domain::OperationResult::ok();

        } catch (const std::exception& e) {
            return storageFailure<domain::StockEntry>("release", key, e);
        }
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<AuditEmitter> audit_;
    KeyLocks locks_;

    static void requireHeld(const Scope& scope, const domain::StockKey& key) {
        if (!scope.holds(key)) {
            throw std::logic_error("[StockLedger] Key " + key.toString() + " is not locked by the caller");
        }
    }

    domain::Result<domain::StockEntry> commit(
        const std::optional<domain::StockEntry>& current,
        const domain::StockEntry& updated,
        const domain::JournalEntry& entry)
    {
        auto written = store_->commitMovement(current, updated, entry);

        std::cout << "[StockLedger] " << domain::toString(written.kind) << " " << written.key.toString()
                  << " delta=" << written.delta << " onHand=" << updated.onHand
                  << " reserved=" << updated.reserved << " journal#" << written.id << std::endl;
        audit_->stockMoved(written, updated);
        return domain::Result<domain::StockEntry>::success(updated);
    }

    template <typename T>
    static domain::Result<T> storageFailure(const char* operation, const domain::StockKey& key, const std::exception& e) {
        std::cerr << "[StockLedger] " << operation << " " << key.toString() << " storage error: " << e.what() << std::endl;
        return domain::Result<T>::failure(domain::ErrorCode::STORAGE_FAILURE,
            std::string(operation) + " failed at " + key.toString() + ": " + e.what());
    }

    template <typename T>
    static domain::Result<T> concurrentModification(const domain::StockKey& key) {
        std::cerr << "[StockLedger] Stored row changed outside the ledger: " << key.toString() << std::endl;
        return domain::Result<T>::failure(domain::ErrorCode::STORAGE_FAILURE,
            "Concurrent modification of " + key.toString());
    }
};

} // namespace inventory::application
