#pragma once

#include "Timestamp.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Найденное расхождение
 */
struct Discrepancy {
    std::string subject;   ///< "stock 7@3", "transfer trf-…", "po po-…:2"
    std::string rule;      ///< "balance", "journal", "reserved_total", "transfer_pair", "receipt", "storage"
    std::string details;
};

/**
 * @brief Итог сверки ледджера с журналом
 */
struct ReconciliationReport {
    Timestamp checkedAt;
    int64_t entriesChecked = 0;
    int64_t journalEntriesReplayed = 0;
    int64_t transfersChecked = 0;
    int64_t purchaseLinesChecked = 0;
    std::vector<Discrepancy> discrepancies;

    bool isClean() const { return discrepancies.empty(); }
};

} // namespace inventory::domain
