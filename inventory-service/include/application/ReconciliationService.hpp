#pragma once

#include "ports/input/IReconciliationService.hpp"
#include "ports/output/ITransferRepository.hpp"
#include "ports/output/IPurchaseOrderRepository.hpp"
#include "application/StockLedger.hpp"
#include "application/TransactionJournal.hpp"
#include <iostream>
#include <map>
#include <memory>

namespace inventory::application {

/**
 * @brief Сверка ледджера с журналом
 *
 * Проверяет:
 * - balance: onHand >= 0, 0 <= reserved <= onHand для каждой позиции;
 * - journal: initialOnHand + сумма delta == onHand;
 * - reserved_total: сумма reserved товара не больше суммы onHand;
 * - transfer_pair: у завершённого перемещения ровно одна запись
 *   transfer_out на источнике и одна transfer_in на получателе,
 *   в сумме ноль;
 * - receipt: received <= ordered для каждой строки заказа поставщику;
 * - storage: проверку не удалось выполнить, хранилище недоступно.
 *   Такой отчёт никогда не бывает чистым.
 *
 * Сверка только читает; позиции, изменённые во время обхода, могут
 * дать ложное расхождение по журналу, поэтому запускать её стоит
 * на спокойной системе.
 */
class ReconciliationService : public ports::input::IReconciliationService {
public:
    ReconciliationService(
        std::shared_ptr<StockLedger> ledger,
        std::shared_ptr<TransactionJournal> journal,
        std::shared_ptr<ports::output::ITransferRepository> transferRepository,
        std::shared_ptr<ports::output::IPurchaseOrderRepository> purchaseOrderRepository
    ) : ledger_(std::move(ledger))
      , journal_(std::move(journal))
      , transferRepository_(std::move(transferRepository))
      , purchaseOrderRepository_(std::move(purchaseOrderRepository))
    {}

    domain::ReconciliationReport reconcile() override {
        domain::ReconciliationReport report;
        report.checkedAt = domain::Timestamp::now();

        runCheck("ledger", report, [this](auto& r) { checkEntries(r); });
        runCheck("transfers", report, [this](auto& r) { checkTransfers(r); });
        runCheck("purchase orders", report, [this](auto& r) { checkPurchaseOrders(r); });

        std::cout << "[Reconciliation] Checked " << report.entriesChecked << " entries, "
                  << report.journalEntriesReplayed << " journal entries, "
                  << report.transfersChecked << " transfers, "
                  << report.purchaseLinesChecked << " PO lines: "
                  << (report.isClean() ? "clean" : std::to_string(report.discrepancies.size()) + " discrepancies")
                  << std::endl;
        for (const auto& d : report.discrepancies) {
            std::cerr << "[Reconciliation] " << d.subject << " [" << d.rule << "] " << d.details << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<StockLedger> ledger_;
    std::shared_ptr<TransactionJournal> journal_;
    std::shared_ptr<ports::output::ITransferRepository> transferRepository_;
    std::shared_ptr<ports::output::IPurchaseOrderRepository> purchaseOrderRepository_;

    template <typename Check>
    static void runCheck(const std::string& subject, domain::ReconciliationReport& report, Check check) {
        try {
            check(report);
        } catch (const std::exception& e) {
            std::cerr << "[Reconciliation] " << subject << " check aborted: " << e.what() << std::endl;
            report.discrepancies.push_back({subject, "storage", std::string("check aborted: ") + e.what()});
        }
    }

    void checkEntries(domain::ReconciliationReport& report) {
        std::map<int64_t, std::pair<int64_t, int64_t>> productTotals;  // productId → (onHand, reserved)

        auto entries = ledger_->findAll();
        if (!entries.isSuccess()) {
            report.discrepancies.push_back({"ledger", "storage", entries.message});
            return;
        }
        for (const auto& entry : *entries.value) {
            ++report.entriesChecked;
            std::string subject = "stock " + entry.key().toString();

            if (!entry.isConsistent()) {
                report.discrepancies.push_back({subject, "balance",
                    "onHand=" + std::to_string(entry.onHand) + " reserved=" + std::to_string(entry.reserved)});
            }

            int64_t sum = 0;
            for (const auto& movement : journal_->entriesFor(entry.key())) {
                sum += movement.delta;
                ++report.journalEntriesReplayed;
            }
            if (entry.initialOnHand + sum != entry.onHand) {
                report.discrepancies.push_back({subject, "journal",
                    "initialOnHand=" + std::to_string(entry.initialOnHand) + " + deltas=" + std::to_string(sum) +
                    " != onHand=" + std::to_string(entry.onHand)});
            }

            auto& totals = productTotals[entry.productId];
            totals.first += entry.onHand;
            totals.second += entry.reserved;
        }

        for (const auto& [productId, totals] : productTotals) {
            if (totals.second > totals.first) {
                report.discrepancies.push_back({"product " + std::to_string(productId), "reserved_total",
                    "reserved=" + std::to_string(totals.second) + " > onHand=" + std::to_string(totals.first)});
            }
        }
    }

    void checkTransfers(domain::ReconciliationReport& report) {
        for (const auto& transfer : transferRepository_->findByStatus(domain::TransferStatus::COMPLETED)) {
            ++report.transfersChecked;

            int outCount = 0;
            int inCount = 0;
            int64_t net = 0;
            for (const auto& e : journal_->entriesForReference(domain::ReferenceKind::TRANSFER, transfer.id)) {
                if (e.kind == domain::JournalKind::TRANSFER_OUT && e.key == transfer.sourceKey() &&
                    e.delta == -transfer.quantity) {
                    ++outCount;
                } else if (e.kind == domain::JournalKind::TRANSFER_IN && e.key == transfer.destinationKey() &&
                           e.delta == transfer.quantity) {
                    ++inCount;
                }
                net += e.delta;
            }

            if (outCount != 1 || inCount != 1 || net != 0) {
                report.discrepancies.push_back({"transfer " + transfer.id, "transfer_pair",
                    "transfer_out=" + std::to_string(outCount) + " transfer_in=" + std::to_string(inCount) +
                    " net=" + std::to_string(net)});
            }
        }
    }

    void checkPurchaseOrders(domain::ReconciliationReport& report) {
        for (const auto& order : purchaseOrderRepository_->findAll()) {
            for (const auto& line : order.lines) {
                ++report.purchaseLinesChecked;
                if (line.quantityReceived < 0 || line.quantityReceived > line.quantityOrdered) {
                    report.discrepancies.push_back({"po " + order.id + ":" + std::to_string(line.lineId), "receipt",
                        "received=" + std::to_string(line.quantityReceived) +
                        " ordered=" + std::to_string(line.quantityOrdered)});
                }
            }
        }
    }
};

} // namespace inventory::application
