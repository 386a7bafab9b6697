#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief На что ссылается запись журнала
 */
enum class ReferenceKind {
    PO_LINE,      ///< "<poId>:<lineId>"
    SALE_LINE,    ///< "<orderId>:<lineId>"
    ADJUSTMENT,   ///< произвольный идентификатор пересчёта
    TRANSFER      ///< id перемещения
};

inline std::string toString(ReferenceKind kind) {
    switch (kind) {
        case ReferenceKind::PO_LINE:    return "po_item";
        case ReferenceKind::SALE_LINE:  return "sale_item";
        case ReferenceKind::ADJUSTMENT: return "adjustment";
        case ReferenceKind::TRANSFER:   return "transfer";
    }
    return "unknown";
}

inline ReferenceKind referenceKindFromString(const std::string& str) {
    if (str == "po_item")    return ReferenceKind::PO_LINE;
    if (str == "sale_item")  return ReferenceKind::SALE_LINE;
    if (str == "adjustment") return ReferenceKind::ADJUSTMENT;
    if (str == "transfer")   return ReferenceKind::TRANSFER;
    throw std::invalid_argument("Unknown ReferenceKind: " + str);
}

} // namespace inventory::domain
