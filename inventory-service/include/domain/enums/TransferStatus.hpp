#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Статус перемещения между складами
 *
 * PENDING → IN_TRANSIT → COMPLETED
 * PENDING | IN_TRANSIT → CANCELLED
 */
enum class TransferStatus {
    PENDING,
    IN_TRANSIT,
    COMPLETED,
    CANCELLED
};

inline std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING:    return "pending";
        case TransferStatus::IN_TRANSIT: return "in_transit";
        case TransferStatus::COMPLETED:  return "completed";
        case TransferStatus::CANCELLED:  return "cancelled";
    }
    return "unknown";
}

inline TransferStatus transferStatusFromString(const std::string& str) {
    if (str == "pending")    return TransferStatus::PENDING;
    if (str == "in_transit") return TransferStatus::IN_TRANSIT;
    if (str == "completed")  return TransferStatus::COMPLETED;
    if (str == "cancelled")  return TransferStatus::CANCELLED;
    throw std::invalid_argument("Unknown TransferStatus: " + str);
}

inline bool isFinalStatus(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::CANCELLED;
}

} // namespace inventory::domain
