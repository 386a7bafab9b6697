// include/InventoryApp.hpp
#pragma once

#include <boost/di.hpp>

// Ports
#include "ports/input/IStockCountService.hpp"
#include "ports/input/ITransferCoordinator.hpp"
#include "ports/input/IPurchaseWorkflow.hpp"
#include "ports/input/ISalesWorkflow.hpp"
#include "ports/input/IReconciliationService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "ports/output/IEventPublisher.hpp"

// Settings
#include "settings/EngineSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"

// Application
#include "application/AuditEmitter.hpp"
#include "application/StockLedger.hpp"
#include "application/TransactionJournal.hpp"
#include "application/ReservationManager.hpp"
#include "application/TransferCoordinator.hpp"
#include "application/PurchaseFulfillmentWorkflow.hpp"
#include "application/SalesFulfillmentWorkflow.hpp"
#include "application/StockCountService.hpp"
#include "application/ReconciliationService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/PostgresLedgerStore.hpp"
#include "adapters/secondary/persistence/InMemoryReservationRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTransferRepository.hpp"
#include "adapters/secondary/persistence/InMemoryPurchaseOrderRepository.hpp"
#include "adapters/secondary/persistence/InMemorySalesOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresTransferRepository.hpp"
#include "adapters/secondary/persistence/PostgresReservationRepository.hpp"
#include "adapters/secondary/persistence/PostgresPurchaseOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresSalesOrderRepository.hpp"
#include "adapters/secondary/events/LoggingEventPublisher.hpp"
#include "adapters/secondary/events/RabbitMQEventPublisher.hpp"
#include "adapters/secondary/seed/JsonSeedLoader.hpp"

#include <atomic>
#include <iostream>
#include <memory>

namespace di = boost::di;

namespace inventory {

/**
 * @brief Inventory Engine Application
 *
 * Собирает движок по EngineSettings:
 * - хранилище: in-memory или PostgreSQL (INVENTORY_STORAGE), одно для ледджера, журнала, резервов, перемещений и заказов
 * - аудит: stdout или RabbitMQ (INVENTORY_AUDIT_SINK)
 *
 * Затем загружает начальные остатки (INVENTORY_SEED_FILE),
 * выполняет сверку и печатает отчёт.
 *
 * Template Method: run() вызывает loadEnvironment(),
 * configureInjection(), start().
 */
class InventoryApp {
public:
    InventoryApp() { std::cout << "[InventoryApp] Initializing..." << std::endl; }
    ~InventoryApp() { std::cout << "[InventoryApp] Shutting down..." << std::endl; }

    /**
     * @return 0 если сверка чистая, 1 если найдены расхождения
     */
    int run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();
        return start();
    }

    void stop() {
        stopRequested_ = true;
    }

    // Input ports, доступны после run()
    std::shared_ptr<ports::input::IStockCountService> stockCount() const { return stockCount_; }
    std::shared_ptr<ports::input::ITransferCoordinator> transfers() const { return transfers_; }
    std::shared_ptr<ports::input::IPurchaseWorkflow> purchases() const { return purchases_; }
    std::shared_ptr<ports::input::ISalesWorkflow> sales() const { return sales_; }

private:
    std::shared_ptr<settings::EngineSettings> settings_;
    std::shared_ptr<ports::input::IStockCountService> stockCount_;
    std::shared_ptr<ports::input::ITransferCoordinator> transfers_;
    std::shared_ptr<ports::input::IPurchaseWorkflow> purchases_;
    std::shared_ptr<ports::input::ISalesWorkflow> sales_;
    std::shared_ptr<ports::input::IReconciliationService> reconciliation_;
    std::atomic<bool> stopRequested_{false};

    void loadEnvironment(int argc, char* argv[]) {
        (void)argc;
        (void)argv;
        settings_ = std::make_shared<settings::EngineSettings>();
        std::cout << "[InventoryApp] Environment loaded: storage=" << settings_->getStorage()
                  << " audit=" << settings_->getAuditSink()
                  << " journalPageSize=" << settings_->getJournalPageSize() << std::endl;
    }

    void configureInjection() {
        std::cout << "[InventoryApp] Configuring DI..." << std::endl;

        // Шаг 1: Хранилище, один экземпляр для ILedgerStore и IJournalRepository
        std::shared_ptr<ports::output::ILedgerStore> ledgerStore;
        std::shared_ptr<ports::output::IJournalRepository> journalRepository;
        std::shared_ptr<ports::output::IReservationRepository> reservationRepository;
        std::shared_ptr<ports::output::ITransferRepository> transferRepository;
        std::shared_ptr<ports::output::IPurchaseOrderRepository> purchaseOrderRepository;
        std::shared_ptr<ports::output::ISalesOrderRepository> salesOrderRepository;
        if (settings_->usePostgres()) {
            auto dbInjector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton)
            );
            auto store = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresLedgerStore>>();
            ledgerStore = store;
            journalRepository = store;
            reservationRepository = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresReservationRepository>>();
            transferRepository = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresTransferRepository>>();
            purchaseOrderRepository = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresPurchaseOrderRepository>>();
            salesOrderRepository = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresSalesOrderRepository>>();
        } else {
            auto store = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
            ledgerStore = store;
            journalRepository = store;
            reservationRepository = std::make_shared<adapters::secondary::InMemoryReservationRepository>();
            transferRepository = std::make_shared<adapters::secondary::InMemoryTransferRepository>();
            purchaseOrderRepository = std::make_shared<adapters::secondary::InMemoryPurchaseOrderRepository>();
            salesOrderRepository = std::make_shared<adapters::secondary::InMemorySalesOrderRepository>();
        }

        // Шаг 2: Аудит
        std::shared_ptr<ports::output::IEventPublisher> publisher;
        if (settings_->useRabbitMQ()) {
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton)
            );
            publisher = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQEventPublisher>>();
        } else {
            publisher = std::make_shared<adapters::secondary::LoggingEventPublisher>();
        }

        auto journal = std::make_shared<application::TransactionJournal>(
            journalRepository, static_cast<size_t>(settings_->getJournalPageSize()));

        // Шаг 3: Основной injector с instance binding для хранилищ и аудита
        auto injector = di::make_injector(
            di::bind<ports::output::ILedgerStore>().to(ledgerStore),
            di::bind<ports::output::IJournalRepository>().to(journalRepository),
            di::bind<ports::output::IEventPublisher>().to(publisher),
            di::bind<application::TransactionJournal>().to(journal),

            di::bind<ports::output::IReservationRepository>().to(reservationRepository),
            di::bind<ports::output::ITransferRepository>().to(transferRepository),
            di::bind<ports::output::IPurchaseOrderRepository>().to(purchaseOrderRepository),
            di::bind<ports::output::ISalesOrderRepository>().to(salesOrderRepository),

            di::bind<application::AuditEmitter>().in(di::singleton),
            di::bind<application::StockLedger>().in(di::singleton),
            di::bind<application::ReservationManager>().in(di::singleton),

            di::bind<ports::input::IStockCountService>().to<application::StockCountService>().in(di::singleton),
            di::bind<ports::input::ITransferCoordinator>().to<application::TransferCoordinator>().in(di::singleton),
            di::bind<ports::input::IPurchaseWorkflow>().to<application::PurchaseFulfillmentWorkflow>().in(di::singleton),
            di::bind<ports::input::ISalesWorkflow>().to<application::SalesFulfillmentWorkflow>().in(di::singleton),
            di::bind<ports::input::IReconciliationService>().to<application::ReconciliationService>().in(di::singleton)
        );

        stockCount_ = injector.create<std::shared_ptr<ports::input::IStockCountService>>();
        transfers_ = injector.create<std::shared_ptr<ports::input::ITransferCoordinator>>();
        purchases_ = injector.create<std::shared_ptr<ports::input::IPurchaseWorkflow>>();
        sales_ = injector.create<std::shared_ptr<ports::input::ISalesWorkflow>>();
        reconciliation_ = injector.create<std::shared_ptr<ports::input::IReconciliationService>>();

        std::cout << "[InventoryApp] Ready" << std::endl;
    }

    int start() {
        if (!settings_->getSeedFile().empty()) {
            adapters::secondary::JsonSeedLoader loader(stockCount_);
            auto seeded = loader.loadFile(settings_->getSeedFile());
            std::cout << "[InventoryApp] Seed: " << seeded.provisioned << " provisioned, "
                      << seeded.skipped << " skipped" << std::endl;
        }

        if (stopRequested_) {
            std::cout << "[InventoryApp] Stop requested, skipping reconciliation" << std::endl;
            return 0;
        }

        auto report = reconciliation_->reconcile();
        printReport(report);
        return report.isClean() ? 0 : 1;
    }

    static void printReport(const domain::ReconciliationReport& report) {
        std::cout << "========================================" << std::endl;
        std::cout << "  Reconciliation " << report.checkedAt.toString() << std::endl;
        std::cout << "  Stock entries:    " << report.entriesChecked << std::endl;
        std::cout << "  Journal entries:  " << report.journalEntriesReplayed << std::endl;
        std::cout << "  Transfers:        " << report.transfersChecked << std::endl;
        std::cout << "  PO lines:         " << report.purchaseLinesChecked << std::endl;
        std::cout << "  Discrepancies:    " << report.discrepancies.size() << std::endl;
        std::cout << "========================================" << std::endl;
    }
};

} // namespace inventory
