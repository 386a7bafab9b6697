#pragma once

#include "ports/output/ITransferRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <iterator>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory реализация репозитория перемещений
 */
class InMemoryTransferRepository : public ports::output::ITransferRepository {
public:
    bool insert(const domain::Transfer& transfer) override {
        return transfers_.insertIfAbsent(transfer.id, std::make_shared<domain::Transfer>(transfer));
    }

    void save(const domain::Transfer& transfer) override {
        transfers_.insert(transfer.id, std::make_shared<domain::Transfer>(transfer));
    }

    std::optional<domain::Transfer> findById(const std::string& id) override {
        auto transfer = transfers_.find(id);
        return transfer ? std::optional(*transfer) : std::nullopt;
    }

    std::vector<domain::Transfer> findByStatus(domain::TransferStatus status) override {
        auto all = findAll();
        std::vector<domain::Transfer> result;
        std::copy_if(all.begin(), all.end(), std::back_inserter(result),
            [status](const domain::Transfer& t) { return t.status == status; });
        return result;
    }

    /**
     * @brief Все перемещения, старые первыми
     */
    std::vector<domain::Transfer> findAll() override {
        std::vector<domain::Transfer> result;
        for (const auto& transfer : transfers_.getAll()) {
            result.push_back(*transfer);
        }
        std::sort(result.begin(), result.end(),
            [](const domain::Transfer& a, const domain::Transfer& b) {
                return a.requestedAt < b.requestedAt;
            });
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::Transfer> transfers_;
};

} // namespace inventory::adapters::secondary
