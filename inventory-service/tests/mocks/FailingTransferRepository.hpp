#pragma once

#include "ports/output/ITransferRepository.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace inventory::tests {

/**
 * @brief Декоратор ITransferRepository с внедрением отказов
 *
 * - failNextSave(status): следующий save перемещения в этом статусе
 *   бросает std::runtime_error, ничего не записав;
 * - rejectInserts(n): следующие n вызовов insert отвечают "id занят".
 */
class FailingTransferRepository : public ports::output::ITransferRepository {
public:
    explicit FailingTransferRepository(std::shared_ptr<ports::output::ITransferRepository> inner)
        : inner_(std::move(inner))
    {}

    void failNextSave(domain::TransferStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        failingStatus_ = status;
    }

    void rejectInserts(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejectedInserts_ = count;
    }

    int insertAttempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return insertAttempts_;
    }

    bool insert(const domain::Transfer& transfer) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++insertAttempts_;
            if (rejectedInserts_ > 0) {
                --rejectedInserts_;
                return false;
            }
        }
        return inner_->insert(transfer);
    }

    void save(const domain::Transfer& transfer) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failingStatus_ && *failingStatus_ == transfer.status) {
                failingStatus_.reset();
                throw std::runtime_error("connection reset while saving " + transfer.id);
            }
        }
        inner_->save(transfer);
    }

    std::optional<domain::Transfer> findById(const std::string& id) override {
        return inner_->findById(id);
    }

    std::vector<domain::Transfer> findByStatus(domain::TransferStatus status) override {
        return inner_->findByStatus(status);
    }

    std::vector<domain::Transfer> findAll() override {
        return inner_->findAll();
    }

private:
    std::shared_ptr<ports::output::ITransferRepository> inner_;
    mutable std::mutex mutex_;
    std::optional<domain::TransferStatus> failingStatus_;
    int rejectedInserts_ = 0;
    int insertAttempts_ = 0;
};

} // namespace inventory::tests
