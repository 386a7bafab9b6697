#pragma once

#include "ports/output/IReservationRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory реализация учёта резервов по заказам
 */
class InMemoryReservationRepository : public ports::output::IReservationRepository {
public:
    void saveAll(const std::string& orderId, const std::vector<domain::Reservation>& reservations) override {
        if (reservations.empty()) {
            reservations_.remove(orderId);
            return;
        }
        reservations_.insert(orderId, std::make_shared<std::vector<domain::Reservation>>(reservations));
    }

    std::vector<domain::Reservation> findByOrderId(const std::string& orderId) override {
        auto found = reservations_.find(orderId);
        return found ? *found : std::vector<domain::Reservation>{};
    }

    std::vector<domain::Reservation> takeByOrderId(const std::string& orderId) override {
        auto taken = reservations_.take(orderId);
        return taken ? *taken : std::vector<domain::Reservation>{};
    }

    size_t count() const {
        return reservations_.size();
    }

private:
    ThreadSafeMap<std::string, std::vector<domain::Reservation>> reservations_;
};

} // namespace inventory::adapters::secondary
