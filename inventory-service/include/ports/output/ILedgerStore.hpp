#pragma once

#include "domain/StockEntry.hpp"
#include "domain/JournalEntry.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Долговременное хранилище складских позиций
 *
 * Пишет только StockLedger. Все изменяющие методы работают как
 * compare-and-swap: expected — строка, которую ледджер прочитал;
 * если в хранилище уже другая строка, изменение не применяется.
 *
 * commitMovement фиксирует новую строку и запись журнала одной
 * атомарной операцией: в журнале не бывает записи без изменения
 * остатка и наоборот.
 *
 * Ошибки ввода-вывода и конфликты CAS — исключения (std::runtime_error);
 * StockLedger переводит их в STORAGE_FAILURE.
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual std::optional<domain::StockEntry> findEntry(const domain::StockKey& key) = 0;

    virtual std::vector<domain::StockEntry> findEntriesByProduct(int64_t productId) = 0;

    virtual std::vector<domain::StockEntry> findAllEntries() = 0;

    /**
     * @brief Зарегистрировать новую позицию
     * @return false если позиция уже существует
     */
    virtual bool insertEntry(const domain::StockEntry& entry) = 0;

    /**
     * @brief Изменить позицию без записи в журнал (резервы, дата проверки)
     * @return false если строка в хранилище не совпала с expected
     */
    virtual bool compareAndSwap(const domain::StockEntry& expected,
                                const domain::StockEntry& updated) = 0;

    /**
     * @brief Атомарно записать новый остаток и запись журнала
     *
     * @param expected Строка до изменения; nullopt — позиция создаётся
     * @param updated Строка после изменения
     * @param entry Запись журнала (id назначает хранилище)
     * @return Записанная запись журнала с id
     */
    virtual domain::JournalEntry commitMovement(const std::optional<domain::StockEntry>& expected,
                                                const domain::StockEntry& updated,
                                                const domain::JournalEntry& entry) = 0;
};

} // namespace inventory::ports::output
