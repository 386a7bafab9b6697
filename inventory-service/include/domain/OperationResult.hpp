#pragma once

#include "enums/ErrorCode.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace inventory::domain {

/**
 * @brief Результат операции движка
 *
 * Все операции синхронные: либо эффект применён целиком и
 * isSuccess() == true, либо ничего не изменилось и error
 * описывает причину.
 *
 * Для PARTIAL_RESERVATION_FAILURE поле cause содержит исходную
 * ошибку строки (INSUFFICIENT_AVAILABLE, UNKNOWN_ENTITY), а lineId
 * указывает на первую строку заказа, которую не удалось зарезервировать.
 */
struct OperationResult {
    ErrorCode error = ErrorCode::NONE;
    ErrorCode cause = ErrorCode::NONE;
    std::string message;
    std::optional<int64_t> lineId;

    bool isSuccess() const {
        return error == ErrorCode::NONE;
    }

    static OperationResult ok(std::string message = "") {
        OperationResult r;
        r.message = std::move(message);
        return r;
    }

    static OperationResult failure(ErrorCode code, std::string message) {
        OperationResult r;
        r.error = code;
        r.cause = code;
        r.message = std::move(message);
        return r;
    }
};

/**
 * @brief Результат операции, возвращающей значение
 *
 * value заполнено только при успехе.
 */
template <typename T>
struct Result : OperationResult {
    std::optional<T> value;

    static Result success(T v, std::string message = "") {
        Result r;
        r.message = std::move(message);
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorCode code, std::string message) {
        return from(OperationResult::failure(code, std::move(message)));
    }

    static Result from(const OperationResult& status) {
        Result r;
        static_cast<OperationResult&>(r) = status;
        return r;
    }
};

} // namespace inventory::domain
