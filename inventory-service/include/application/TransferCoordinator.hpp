#pragma once

#include "ports/input/ITransferCoordinator.hpp"
#include "ports/output/ITransferRepository.hpp"
#include "application/StockLedger.hpp"
#include "application/TransactionJournal.hpp"
#include "application/AuditEmitter.hpp"
#include "application/StorageGuard.hpp"
#include "utils/IdGenerator.hpp"
#include <KeyedMutex.hpp>
#include <algorithm>
#include <iostream>
#include <memory>

namespace inventory::application {

/**
 * @brief Координатор перемещений между складами
 *
 * Реализует ITransferCoordinator. Блокировка перемещения берётся
 * раньше блокировок ключей, никогда наоборот.
 *
 * Журнал служит маркером идемпотентности: перед списанием или
 * зачислением проверяется, нет ли уже записи с reference
 * transfer:<id> нужного вида на нужном ключе. Поэтому повтор
 * complete после сбоя зачисления не спишет источник второй раз.
 * Если журнал недоступен, операция завершается STORAGE_FAILURE и
 * ничего не двигает.
 */
class TransferCoordinator : public ports::input::ITransferCoordinator {
public:
    TransferCoordinator(
        std::shared_ptr<StockLedger> ledger,
        std::shared_ptr<TransactionJournal> journal,
        std::shared_ptr<ports::output::ITransferRepository> transferRepository,
        std::shared_ptr<AuditEmitter> audit
    ) : ledger_(std::move(ledger))
      , journal_(std::move(journal))
      , transferRepository_(std::move(transferRepository))
      , audit_(std::move(audit))
    {}

    static constexpr int kMaxIdAttempts = 3;

    domain::Result<domain::Transfer> create(
        int64_t productId,
        int64_t sourceLocationId,
        int64_t destinationLocationId,
        int64_t quantity,
        const std::string& actor,
        const std::string& notes = ""
    ) override {
        return guardStorage<domain::Result<domain::Transfer>>("TransferCoordinator", "create", [&]() {
            return doCreate(productId, sourceLocationId, destinationLocationId, quantity, actor, notes);
        });
    }

    domain::Result<domain::Transfer> dispatch(const std::string& transferId, const std::string& actor) override {
        return guardStorage<domain::Result<domain::Transfer>>("TransferCoordinator", "dispatch " + transferId,
            [&]() { return doDispatch(transferId, actor); });
    }

    domain::Result<domain::Transfer> complete(const std::string& transferId, const std::string& actor) override {
        return guardStorage<domain::Result<domain::Transfer>>("TransferCoordinator", "complete " + transferId,
            [&]() { return doComplete(transferId, actor); });
    }

    domain::Result<domain::Transfer> cancel(const std::string& transferId, const std::string& actor) override {
        return guardStorage<domain::Result<domain::Transfer>>("TransferCoordinator", "cancel " + transferId,
            [&]() { return doCancel(transferId, actor); });
    }

    std::optional<domain::Transfer> findById(const std::string& transferId) override {
        return transferRepository_->findById(transferId);
    }

    std::vector<domain::Transfer> findByStatus(domain::TransferStatus status) override {
        return transferRepository_->findByStatus(status);
    }

private:
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<TransactionJournal> journal_;
    std::shared_ptr<ports::output::ITransferRepository> transferRepository_;
    std::shared_ptr<AuditEmitter> audit_;
    KeyedMutex<std::string> transferLocks_;

    domain::Result<domain::Transfer> doCreate(
        int64_t productId,
        int64_t sourceLocationId,
        int64_t destinationLocationId,
        int64_t quantity,
        const std::string& actor,
        const std::string& notes)
    {
        if (quantity <= 0) {
            return domain::Result<domain::Transfer>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Transfer quantity must be positive");
        }
        if (sourceLocationId == destinationLocationId) {
            return domain::Result<domain::Transfer>::failure(domain::ErrorCode::INVALID_ARGUMENT,
                "Source and destination must differ");
        }

        domain::StockKey source{productId, sourceLocationId};
        auto entry = ledger_->find(source);
        if (!entry.isSuccess()) {
            return domain::Result<domain::Transfer>::from(entry);
        }
        if (quantity > entry.value->available()) {
            return domain::Result<domain::Transfer>::failure(domain::ErrorCode::INSUFFICIENT_AVAILABLE,
                "Requested " + std::to_string(quantity) + " but only " +
                std::to_string(entry.value->available()) + " available at " + source.toString());
        }

        domain::Transfer transfer;
        transfer.productId = productId;
        transfer.sourceLocationId = sourceLocationId;
        transfer.destinationLocationId = destinationLocationId;
        transfer.quantity = quantity;
        transfer.status = domain::TransferStatus::PENDING;
        transfer.requestedAt = domain::Timestamp::now();
        transfer.notes = notes;
        transfer.createdBy = actor;

        bool inserted = false;
        for (int attempt = 0; attempt < kMaxIdAttempts && !inserted; ++attempt) {
            transfer.id = utils::IdGenerator::transferId();
            inserted = transferRepository_->insert(transfer);
            if (!inserted) {
                std::cerr << "[TransferCoordinator] Transfer id " << transfer.id << " already taken" << std::endl;
            }
        }
        if (!inserted) {
            return domain::Result<domain::Transfer>::failure(domain::ErrorCode::STORAGE_FAILURE,
                "Could not allocate a unique transfer id");
        }

        std::cout << "[TransferCoordinator] Created " << transfer.id << ": " << quantity
                  << " of product " << productId << " " << sourceLocationId
                  << " -> " << destinationLocationId << std::endl;
        audit_->statusChanged("transfer", transfer.id, domain::toString(transfer.status), actor);
        return domain::Result<domain::Transfer>::success(transfer);
    }

    domain::Result<domain::Transfer> doDispatch(const std::string& transferId, const std::string& actor) {
        auto guard = transferLocks_.lock(transferId);

        auto transfer = transferRepository_->findById(transferId);
        if (!transfer) {
            return unknownTransfer(transferId);
        }
        if (transfer->status != domain::TransferStatus::PENDING) {
            return invalidTransition(*transfer, "dispatch");
        }

        if (!hasMovement(*transfer, transfer->sourceKey(), domain::JournalKind::TRANSFER_OUT)) {
            auto debit = ledger_->adjust(transfer->sourceKey(), -transfer->quantity,
                movementMeta(*transfer, domain::JournalKind::TRANSFER_OUT, actor, ""));
            if (!debit.isSuccess()) {
                std::cout << "[TransferCoordinator] Dispatch " << transferId << " rejected: " << debit.message << std::endl;
                return domain::Result<domain::Transfer>::from(debit);
            }
        }

        return moveTo(*transfer, domain::TransferStatus::IN_TRANSIT, actor);
    }

    domain::Result<domain::Transfer> doComplete(const std::string& transferId, const std::string& actor) {
        auto guard = transferLocks_.lock(transferId);

        auto transfer = transferRepository_->findById(transferId);
        if (!transfer) {
            return unknownTransfer(transferId);
        }
        if (transfer->status == domain::TransferStatus::COMPLETED) {
            return domain::Result<domain::Transfer>::success(*transfer, "Transfer already completed");
        }
        if (transfer->status != domain::TransferStatus::IN_TRANSIT) {
            return invalidTransition(*transfer, "complete");
        }

        if (!hasMovement(*transfer, transfer->destinationKey(), domain::JournalKind::TRANSFER_IN)) {
            auto credit = ledger_->adjust(transfer->destinationKey(), transfer->quantity,
                movementMeta(*transfer, domain::JournalKind::TRANSFER_IN, actor, ""));
            if (!credit.isSuccess()) {
                std::cerr << "[TransferCoordinator] Credit for " << transferId
                          << " failed, transfer stays in_transit: " << credit.message << std::endl;
                return domain::Result<domain::Transfer>::from(credit);
            }
        }

        return moveTo(*transfer, domain::TransferStatus::COMPLETED, actor);
    }

    /**
     * @brief Отменить перемещение
     *
     * IN_TRANSIT: списанное возвращается на источник. Если получатель
     * уже зачислен (complete упал после зачисления), перемещение
     * переводится в COMPLETED и отмена отклоняется.
     */
    domain::Result<domain::Transfer> doCancel(const std::string& transferId, const std::string& actor) {
        auto guard = transferLocks_.lock(transferId);

        auto transfer = transferRepository_->findById(transferId);
        if (!transfer) {
            return unknownTransfer(transferId);
        }
        if (domain::isFinalStatus(transfer->status)) {
            return invalidTransition(*transfer, "cancel");
        }

        if (transfer->status == domain::TransferStatus::IN_TRANSIT &&
            hasMovement(*transfer, transfer->destinationKey(), domain::JournalKind::TRANSFER_IN)) {
            std::cerr << "[TransferCoordinator] " << transferId
                      << " already credited at destination, finishing as completed" << std::endl;
            moveTo(*transfer, domain::TransferStatus::COMPLETED, actor);
            return domain::Result<domain::Transfer>::failure(domain::ErrorCode::INVALID_TRANSITION,
                "Cannot cancel transfer " + transferId + ": destination already credited, transfer completed");
        }

        if (transfer->status == domain::TransferStatus::IN_TRANSIT &&
            !hasMovement(*transfer, transfer->sourceKey(), domain::JournalKind::TRANSFER_IN)) {
            auto restore = ledger_->adjust(transfer->sourceKey(), transfer->quantity,
                movementMeta(*transfer, domain::JournalKind::TRANSFER_IN, actor, "cancelled in transit"));
            if (!restore.isSuccess()) {
                std::cerr << "[TransferCoordinator] Restoring source for " << transferId
                          << " failed: " << restore.message << std::endl;
                return domain::Result<domain::Transfer>::from(restore);
            }
        }

        return moveTo(*transfer, domain::TransferStatus::CANCELLED, actor);
    }

    // Бросает, если журнал недоступен
    bool hasMovement(const domain::Transfer& transfer, const domain::StockKey& key, domain::JournalKind kind) const {
        auto entries = journal_->entriesForReference(domain::ReferenceKind::TRANSFER, transfer.id);
        return std::any_of(entries.begin(), entries.end(), [&](const domain::JournalEntry& e) {
            return e.key == key && e.kind == kind;
        });
    }

    static domain::MovementMeta movementMeta(const domain::Transfer& transfer,
                                             domain::JournalKind kind,
                                             const std::string& actor,
                                             const std::string& notes) {
        domain::MovementMeta meta;
        meta.kind = kind;
        meta.referenceKind = domain::ReferenceKind::TRANSFER;
        meta.referenceId = transfer.id;
        meta.actor = actor;
        meta.notes = notes.empty() ? transfer.notes : notes;
        return meta;
    }

    domain::Result<domain::Transfer> moveTo(domain::Transfer& transfer,
                                            domain::TransferStatus status,
                                            const std::string& actor) {
        transfer.updateStatus(status);
        transferRepository_->save(transfer);

        std::cout << "[TransferCoordinator] " << transfer.id << " -> " << domain::toString(status) << std::endl;
        audit_->statusChanged("transfer", transfer.id, domain::toString(status), actor);
        return domain::Result<domain::Transfer>::success(transfer);
    }

    static domain::Result<domain::Transfer> unknownTransfer(const std::string& transferId) {
        return domain::Result<domain::Transfer>::failure(domain::ErrorCode::UNKNOWN_ENTITY,
            "Transfer not found: " + transferId);
    }

    static domain::Result<domain::Transfer> invalidTransition(const domain::Transfer& transfer, const std::string& action) {
        return domain::Result<domain::Transfer>::failure(domain::ErrorCode::INVALID_TRANSITION,
            "Cannot " + action + " transfer " + transfer.id + " in status " + domain::toString(transfer.status));
    }
};

} // namespace inventory::application
