#pragma once

#include "domain/Reservation.hpp"
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Учёт резервов в разрезе заказов
 */
class IReservationRepository {
public:
    virtual ~IReservationRepository() = default;

    virtual void saveAll(const std::string& orderId, const std::vector<domain::Reservation>& reservations) = 0;

    virtual std::vector<domain::Reservation> findByOrderId(const std::string& orderId) = 0;

    /**
     * @brief Атомарно забрать (и удалить) все резервы заказа
     */
    virtual std::vector<domain::Reservation> takeByOrderId(const std::string& orderId) = 0;
};

} // namespace inventory::ports::output
