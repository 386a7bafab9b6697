#pragma once

#include "domain/OperationResult.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace inventory::application {

/**
 * @brief Выполнить операцию сервиса, переводя сбой хранилища в STORAGE_FAILURE
 *
 * Исключение репозитория или журнала (обрыв соединения, ошибка SQL)
 * не выходит за пределы операции: оно логируется как
 * "[Component] operation storage error: ..." и возвращается как
 * R::failure(STORAGE_FAILURE). std::logic_error означает ошибку
 * вызывающего кода и пробрасывается дальше.
 *
 * @example
 * ```cpp
 * return guardStorage<domain::Result<domain::Transfer>>("TransferCoordinator", "complete " + id,
 *     [&]() { return doComplete(id, actor); });
 * ```
 */
template <typename R, typename Body>
R guardStorage(const char* component, const std::string& operation, Body&& body) {
    try {
        return body();
    } catch (const std::logic_error&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[" << component << "] " << operation << " storage error: " << e.what() << std::endl;
        return R::failure(domain::ErrorCode::STORAGE_FAILURE, operation + " failed: " + e.what());
    }
}

} // namespace inventory::application
