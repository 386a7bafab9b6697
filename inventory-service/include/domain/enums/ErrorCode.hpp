#pragma once

#include <string>

namespace inventory::domain {

/**
 * @brief Код ошибки операции движка
 */
enum class ErrorCode {
    NONE,
    INSUFFICIENT_STOCK,            ///< onHand ушёл бы в минус или ниже reserved
    INSUFFICIENT_AVAILABLE,        ///< резерв больше available
    OVER_RELEASE,                  ///< снятие резерва больше reserved (ошибка вызывающего)
    OVER_RECEIPT,                  ///< приёмка больше заказанного
    INVALID_TRANSITION,            ///< недопустимый переход статуса
    PARTIAL_RESERVATION_FAILURE,   ///< резерв заказа откатан целиком
    UNKNOWN_ENTITY,                ///< ключ/заказ/строка не найдены
    INVALID_ARGUMENT,
    STORAGE_FAILURE                ///< хранилище отказало, изменение не применено
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                        return "NONE";
        case ErrorCode::INSUFFICIENT_STOCK:          return "INSUFFICIENT_STOCK";
        case ErrorCode::INSUFFICIENT_AVAILABLE:      return "INSUFFICIENT_AVAILABLE";
        case ErrorCode::OVER_RELEASE:                return "OVER_RELEASE";
        case ErrorCode::OVER_RECEIPT:                return "OVER_RECEIPT";
        case ErrorCode::INVALID_TRANSITION:          return "INVALID_TRANSITION";
        case ErrorCode::PARTIAL_RESERVATION_FAILURE: return "PARTIAL_RESERVATION_FAILURE";
        case ErrorCode::UNKNOWN_ENTITY:              return "UNKNOWN_ENTITY";
        case ErrorCode::INVALID_ARGUMENT:            return "INVALID_ARGUMENT";
        case ErrorCode::STORAGE_FAILURE:             return "STORAGE_FAILURE";
    }
    return "UNKNOWN";
}

} // namespace inventory::domain
