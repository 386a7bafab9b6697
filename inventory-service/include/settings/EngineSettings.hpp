#pragma once

#include "settings/Env.hpp"
#include <string>
#include <stdexcept>

namespace inventory::settings {

/**
 * @brief Настройки движка
 *
 * Переменные окружения:
 * - INVENTORY_STORAGE: memory | postgres (по умолчанию memory)
 * - INVENTORY_AUDIT_SINK: log | rabbitmq (по умолчанию log)
 * - INVENTORY_SEED_FILE: JSON с начальными остатками (пусто — без загрузки)
 * - INVENTORY_JOURNAL_PAGE_SIZE: размер страницы чтения журнала (по умолчанию 256)
 *
 * @example K8s ConfigMap:
 * ```yaml
 * data:
 *   INVENTORY_STORAGE: "postgres"
 *   INVENTORY_AUDIT_SINK: "rabbitmq"
 *   INVENTORY_SEED_FILE: "/etc/inventory/seed.json"
 *   INVENTORY_JOURNAL_PAGE_SIZE: "512"
 * ```
 */
class EngineSettings {
public:
    /**
     * @throws std::invalid_argument при неизвестном значении
     */
    EngineSettings() {
        storage_ = env::getOrDefault("INVENTORY_STORAGE", "memory");
        auditSink_ = env::getOrDefault("INVENTORY_AUDIT_SINK", "log");
        seedFile_ = env::getOrDefault("INVENTORY_SEED_FILE", "");
        journalPageSize_ = env::getIntInRange("INVENTORY_JOURNAL_PAGE_SIZE", 256, 1, 65536);

        if (storage_ != "memory" && storage_ != "postgres") {
            throw std::invalid_argument("INVENTORY_STORAGE must be memory or postgres, got: " + storage_);
        }
        if (auditSink_ != "log" && auditSink_ != "rabbitmq") {
            throw std::invalid_argument("INVENTORY_AUDIT_SINK must be log or rabbitmq, got: " + auditSink_);
        }
    }

    std::string getStorage() const { return storage_; }
    bool usePostgres() const { return storage_ == "postgres"; }
    std::string getAuditSink() const { return auditSink_; }
    bool useRabbitMQ() const { return auditSink_ == "rabbitmq"; }
    std::string getSeedFile() const { return seedFile_; }
    int getJournalPageSize() const { return journalPageSize_; }

private:
    std::string storage_;
    std::string auditSink_;
    std::string seedFile_;
    int journalPageSize_;
};

} // namespace inventory::settings
