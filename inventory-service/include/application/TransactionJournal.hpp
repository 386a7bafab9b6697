#pragma once

#include "ports/output/IJournalRepository.hpp"
#include "domain/JournalEntry.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <vector>

namespace inventory::application {

/**
 * @brief Ленивая последовательность записей журнала по одной позиции
 *
 * Читает хранилище страницами по pageSize записей. Верхняя граница
 * (lastId журнала) фиксируется при вызове begin(), поэтому обход
 * конечен, даже если в журнал параллельно дописывают. Повторный
 * begin() начинает обход заново с новой границей.
 *
 * @example
 * ```cpp
 * int64_t sum = 0;
 * for (const auto& entry : journal->entriesFor(key)) {
 *     sum += entry.delta;
 * }
 * ```
 */
class JournalSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = domain::JournalEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const domain::JournalEntry*;
        using reference = const domain::JournalEntry&;

        iterator() = default;

        reference operator*() const { return page_[pos_]; }
        pointer operator->() const { return &page_[pos_]; }

        iterator& operator++() {
            ++pos_;
            if (pos_ >= page_.size()) {
                fetch();
            }
            return *this;
        }

        bool operator==(const iterator& other) const {
            return atEnd() == other.atEnd() && (atEnd() || page_[pos_].id == other.page_[other.pos_].id);
        }

        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class JournalSequence;

        std::shared_ptr<ports::output::IJournalRepository> repository_;
        domain::StockKey key_;
        int64_t upToId_ = 0;
        size_t pageSize_ = 0;
        int64_t cursor_ = 0;
        std::vector<domain::JournalEntry> page_;
        size_t pos_ = 0;
        bool exhausted_ = true;

        iterator(std::shared_ptr<ports::output::IJournalRepository> repository,
                 const domain::StockKey& key, int64_t upToId, size_t pageSize)
            : repository_(std::move(repository))
            , key_(key)
            , upToId_(upToId)
            , pageSize_(pageSize)
            , exhausted_(false)
        {
            fetch();
        }

        bool atEnd() const { return exhausted_; }

        void fetch() {
            page_.clear();
            pos_ = 0;
            if (cursor_ >= upToId_) {
                exhausted_ = true;
                return;
            }
            page_ = repository_->findByKey(key_, cursor_, upToId_, pageSize_);
            if (page_.empty()) {
                exhausted_ = true;
                return;
            }
            cursor_ = page_.back().id;
        }
    };

    JournalSequence(std::shared_ptr<ports::output::IJournalRepository> repository,
                    const domain::StockKey& key, size_t pageSize)
        : repository_(std::move(repository))
        , key_(key)
        , pageSize_(pageSize)
    {}

    iterator begin() const {
        return iterator(repository_, key_, repository_->lastId(), pageSize_);
    }

    iterator end() const { return iterator(); }

private:
    std::shared_ptr<ports::output::IJournalRepository> repository_;
    domain::StockKey key_;
    size_t pageSize_;
};

/**
 * @brief Журнал движений: чтение и сверка
 *
 * Запись в журнал выполняет только StockLedger в одной атомарной
 * операции с изменением остатка (ILedgerStore::commitMovement).
 */
class TransactionJournal {
public:
    static constexpr size_t DEFAULT_PAGE_SIZE = 256;

    explicit TransactionJournal(
        std::shared_ptr<ports::output::IJournalRepository> repository,
        size_t pageSize = DEFAULT_PAGE_SIZE
    ) : repository_(std::move(repository))
      , pageSize_(pageSize)
    {
        if (pageSize_ == 0) {
            throw std::invalid_argument("Journal page size must be positive");
        }
    }

    JournalSequence entriesFor(const domain::StockKey& key) const {
        return JournalSequence(repository_, key, pageSize_);
    }

    std::vector<domain::JournalEntry> entriesForReference(
        domain::ReferenceKind kind, const std::string& referenceId) const
    {
        return repository_->findByReference(kind, referenceId);
    }

    int64_t sumOfDeltas(const domain::StockKey& key) const {
        int64_t sum = 0;
        for (const auto& entry : entriesFor(key)) {
            sum += entry.delta;
        }
        return sum;
    }

    /**
     * @brief Восстановить onHand позиции проигрыванием журнала
     *
     * @return initialOnHand + сумма delta
     */
    int64_t replay(const domain::StockKey& key, int64_t initialOnHand) const {
        return initialOnHand + sumOfDeltas(key);
    }

    size_t pageSize() const { return pageSize_; }

private:
    std::shared_ptr<ports::output::IJournalRepository> repository_;
    size_t pageSize_;
};

} // namespace inventory::application
