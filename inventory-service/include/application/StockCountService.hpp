#pragma once

#include "ports/input/IStockCountService.hpp"
#include "application/StockLedger.hpp"
#include <memory>

namespace inventory::application {

/**
 * @brief Регистрация позиций и инвентаризация
 *
 * Реализует IStockCountService поверх StockLedger.
 */
class StockCountService : public ports::input::IStockCountService {
public:
    explicit StockCountService(std::shared_ptr<StockLedger> ledger)
        : ledger_(std::move(ledger))
    {}

    domain::Result<domain::StockEntry> provision(
        int64_t productId,
        int64_t locationId,
        int64_t onHand,
        int64_t reserved,
        std::optional<domain::Timestamp> lastCheckedAt = std::nullopt
    ) override {
        return ledger_->provision(domain::StockKey{productId, locationId}, onHand, reserved, lastCheckedAt);
    }

    domain::Result<domain::StockEntry> recordCount(
        int64_t productId,
        int64_t locationId,
        int64_t countedOnHand,
        const std::string& actor,
        const std::string& notes = ""
    ) override {
        domain::MovementMeta meta;
        meta.kind = domain::JournalKind::ADJUSTMENT;
        meta.referenceKind = domain::ReferenceKind::ADJUSTMENT;
        meta.referenceId = "count:" + domain::Timestamp::now().toDateString();
        meta.actor = actor;
        meta.notes = notes;
        return ledger_->recordCount(domain::StockKey{productId, locationId}, countedOnHand, meta);
    }

    domain::Result<domain::StockEntry> get(int64_t productId, int64_t locationId) override {
        return ledger_->find(domain::StockKey{productId, locationId});
    }

    domain::Result<std::vector<domain::StockEntry>> entriesForProduct(int64_t productId) override {
        return ledger_->findByProduct(productId);
    }

private:
    std::shared_ptr<StockLedger> ledger_;
};

} // namespace inventory::application
