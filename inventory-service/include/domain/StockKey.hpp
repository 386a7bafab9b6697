#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

namespace inventory::domain {

/**
 * @brief Ключ складской позиции: (товар, склад)
 *
 * Порядок (productId, locationId) является глобальным порядком
 * захвата блокировок для многоключевых операций.
 */
struct StockKey {
    int64_t productId = 0;
    int64_t locationId = 0;

    bool operator==(const StockKey& other) const {
        return productId == other.productId && locationId == other.locationId;
    }

    bool operator!=(const StockKey& other) const { return !(*this == other); }

    bool operator<(const StockKey& other) const {
        return std::tie(productId, locationId) < std::tie(other.productId, other.locationId);
    }

    /**
     * @brief "7@3" — товар 7 на складе 3
     */
    std::string toString() const {
        return std::to_string(productId) + "@" + std::to_string(locationId);
    }
};

struct StockKeyHash {
    size_t operator()(const StockKey& key) const {
        size_t h1 = std::hash<int64_t>{}(key.productId);
        size_t h2 = std::hash<int64_t>{}(key.locationId);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

} // namespace inventory::domain
