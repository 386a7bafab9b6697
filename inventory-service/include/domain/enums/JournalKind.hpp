#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Тип движения товара в журнале
 */
enum class JournalKind {
    PURCHASE,       ///< Приёмка по закупке
    SALE,           ///< Отгрузка по продаже
    ADJUSTMENT,     ///< Корректировка (инвентаризация)
    TRANSFER_IN,    ///< Поступление по перемещению
    TRANSFER_OUT,   ///< Списание по перемещению
    RETURN          ///< Возврат от покупателя
};

inline std::string toString(JournalKind kind) {
    switch (kind) {
        case JournalKind::PURCHASE:     return "purchase";
        case JournalKind::SALE:         return "sale";
        case JournalKind::ADJUSTMENT:   return "adjustment";
        case JournalKind::TRANSFER_IN:  return "transfer_in";
        case JournalKind::TRANSFER_OUT: return "transfer_out";
        case JournalKind::RETURN:       return "return";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline JournalKind journalKindFromString(const std::string& str) {
    if (str == "purchase")     return JournalKind::PURCHASE;
    if (str == "sale")         return JournalKind::SALE;
    if (str == "adjustment")   return JournalKind::ADJUSTMENT;
    if (str == "transfer_in")  return JournalKind::TRANSFER_IN;
    if (str == "transfer_out") return JournalKind::TRANSFER_OUT;
    if (str == "return")       return JournalKind::RETURN;
    throw std::invalid_argument("Unknown JournalKind: " + str);
}

} // namespace inventory::domain
