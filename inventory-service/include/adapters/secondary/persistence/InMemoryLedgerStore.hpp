#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IJournalRepository.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory хранилище позиций и журнала
 *
 * Реализует оба порта: позиции и журнал лежат под одним мьютексом,
 * поэтому commitMovement атомарен. id записей журнала идут с 1
 * подряд в порядке вставки.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore,
                            public ports::output::IJournalRepository {
public:
    // =========================================================================
    // ILedgerStore
    // =========================================================================

    std::optional<domain::StockEntry> findEntry(const domain::StockKey& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::StockEntry> findEntriesByProduct(int64_t productId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::StockEntry> result;
        auto it = entries_.lower_bound(domain::StockKey{productId, std::numeric_limits<int64_t>::min()});
        for (; it != entries_.end() && it->first.productId == productId; ++it) {
            result.push_back(it->second);
        }
        return result;
    }

    std::vector<domain::StockEntry> findAllEntries() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::StockEntry> result;
        result.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            result.push_back(entry);
        }
        return result;
    }

    bool insertEntry(const domain::StockEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.emplace(entry.key(), entry).second;
    }

    bool compareAndSwap(const domain::StockEntry& expected, const domain::StockEntry& updated) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(expected.key());
        if (it == entries_.end() || !(it->second == expected)) {
            return false;
        }
        it->second = updated;
        return true;
    }

    domain::JournalEntry commitMovement(const std::optional<domain::StockEntry>& expected,
                                        const domain::StockEntry& updated,
                                        const domain::JournalEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(updated.key());
        bool matches = expected
            ? (it != entries_.end() && it->second == *expected)
            : (it == entries_.end());
        if (!matches) {
            throw std::runtime_error("Stock row " + updated.key().toString() + " changed since it was read");
        }

        domain::JournalEntry written = entry;
        written.id = static_cast<int64_t>(journal_.size()) + 1;

        entries_[updated.key()] = updated;
        journal_.push_back(written);
        keyIndex_[written.key].push_back(written.id);
        referenceIndex_[{written.referenceKind, written.referenceId}].push_back(written.id);
        return written;
    }

    // =========================================================================
    // IJournalRepository
    // =========================================================================

    std::vector<domain::JournalEntry> findByKey(const domain::StockKey& key,
                                                int64_t afterId,
                                                int64_t upToId,
                                                size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::JournalEntry> result;

        auto indexIt = keyIndex_.find(key);
        if (indexIt == keyIndex_.end()) {
            return result;
        }

        const auto& ids = indexIt->second;
        for (auto it = std::upper_bound(ids.begin(), ids.end(), afterId);
             it != ids.end() && *it <= upToId && result.size() < limit; ++it) {
            result.push_back(journal_[static_cast<size_t>(*it - 1)]);
        }
        return result;
    }

    std::vector<domain::JournalEntry> findByReference(domain::ReferenceKind kind,
                                                      const std::string& referenceId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::JournalEntry> result;

        auto indexIt = referenceIndex_.find({kind, referenceId});
        if (indexIt != referenceIndex_.end()) {
            for (int64_t id : indexIt->second) {
                result.push_back(journal_[static_cast<size_t>(id - 1)]);
            }
        }
        return result;
    }

    int64_t lastId() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int64_t>(journal_.size());
    }

    /**
     * @brief Количество записей журнала
     */
    size_t journalSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return journal_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<domain::StockKey, domain::StockEntry> entries_;
    std::vector<domain::JournalEntry> journal_;
    std::unordered_map<domain::StockKey, std::vector<int64_t>, domain::StockKeyHash> keyIndex_;
    std::map<std::pair<domain::ReferenceKind, std::string>, std::vector<int64_t>> referenceIndex_;
};

} // namespace inventory::adapters::secondary
