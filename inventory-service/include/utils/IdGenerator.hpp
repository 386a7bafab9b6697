#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace inventory::utils {

/**
 * @brief Идентификаторы перемещений и заказов
 *
 * Префикс сущности + UUID v4:
 * "trf-3f2b9c1e-7a40-4d1b-9e2f-0c6a5b7d8e91", "po-…", "so-…".
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    static std::string transferId() { return withPrefix("trf"); }
    static std::string purchaseOrderId() { return withPrefix("po"); }
    static std::string salesOrderId() { return withPrefix("so"); }

    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y из [8, 9, a, b]
     */
    static std::string uuid() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((high >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((high >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((high & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (low & 0xFFFFFFFFFFFF);
        return ss.str();
    }

private:
    static std::string withPrefix(const char* prefix) {
        return std::string(prefix) + "-" + uuid();
    }
};

} // namespace inventory::utils
