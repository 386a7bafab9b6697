#pragma once

#include "StockKey.hpp"
#include "Timestamp.hpp"
#include "enums/JournalKind.hpp"
#include "enums/ReferenceKind.hpp"
#include <cstdint>
#include <string>

namespace inventory::domain {

/**
 * @brief Атрибуты движения, которые передаёт вызывающий
 */
struct MovementMeta {
    JournalKind kind = JournalKind::ADJUSTMENT;
    ReferenceKind referenceKind = ReferenceKind::ADJUSTMENT;
    std::string referenceId;
    std::string actor;
    std::string notes;
};

/**
 * @brief Неизменяемая запись журнала движений
 *
 * id назначает хранилище при фиксации; порядок id совпадает
 * с порядком вставки.
 */
struct JournalEntry {
    int64_t id = 0;
    StockKey key;
    JournalKind kind = JournalKind::ADJUSTMENT;
    int64_t delta = 0;
    ReferenceKind referenceKind = ReferenceKind::ADJUSTMENT;
    std::string referenceId;
    Timestamp timestamp;
    std::string actor;
    std::string notes;

    static JournalEntry from(const StockKey& key, int64_t delta, const MovementMeta& meta) {
        JournalEntry e;
        e.key = key;
        e.kind = meta.kind;
        e.delta = delta;
        e.referenceKind = meta.referenceKind;
        e.referenceId = meta.referenceId;
        e.timestamp = Timestamp::now();
        e.actor = meta.actor;
        e.notes = meta.notes;
        return e;
    }
};

} // namespace inventory::domain
