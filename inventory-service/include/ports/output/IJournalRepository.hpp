#pragma once

#include "domain/JournalEntry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Чтение журнала движений
 *
 * Запись в журнал идёт только через ILedgerStore::commitMovement.
 */
class IJournalRepository {
public:
    virtual ~IJournalRepository() = default;

    /**
     * @brief Страница записей по позиции в порядке вставки
     *
     * @param afterId Вернуть записи с id > afterId
     * @param upToId Не возвращать записи с id > upToId
     * @param limit Размер страницы
     */
    virtual std::vector<domain::JournalEntry> findByKey(const domain::StockKey& key,
                                                        int64_t afterId,
                                                        int64_t upToId,
                                                        size_t limit) = 0;

    /**
     * @brief Все записи по ссылке (например, по перемещению)
     */
    virtual std::vector<domain::JournalEntry> findByReference(domain::ReferenceKind kind,
                                                              const std::string& referenceId) = 0;

    /**
     * @brief id последней записи (0 — журнал пуст)
     */
    virtual int64_t lastId() = 0;
};

} // namespace inventory::ports::output
