#pragma once

#include "ports/input/IStockCountService.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief Итог загрузки начальных остатков
 */
struct SeedResult {
    int provisioned = 0;
    int skipped = 0;
    std::vector<std::string> errors;
};

/**
 * @brief Загрузка начальных остатков из JSON
 *
 * Формат:
 * ```json
 * {
 *   "stock": [
 *     { "product_id": 1, "location_id": 1, "on_hand": 150, "reserved": 25,
 *       "last_checked_at": "2025-05-01" }
 *   ]
 * }
 * ```
 * Строка, которую нельзя зарегистрировать (уже есть, reserved > on_hand,
 * нет обязательного поля), пропускается и попадает в errors.
 */
class JsonSeedLoader {
public:
    explicit JsonSeedLoader(std::shared_ptr<ports::input::IStockCountService> stockCount)
        : stockCount_(std::move(stockCount))
    {}

    /**
     * @throws std::runtime_error если файл не открывается или это не JSON
     */
    SeedResult loadFile(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open seed file: " + path);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        std::cout << "[JsonSeedLoader] Loading " << path << std::endl;
        return load(buffer.str());
    }

    /**
     * @throws std::runtime_error если content — не JSON или нет массива "stock"
     */
    SeedResult load(const std::string& content) {
        nlohmann::json root;
        try {
            root = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error(std::string("Malformed seed JSON: ") + e.what());
        }

        if (!root.contains("stock") || !root["stock"].is_array()) {
            throw std::runtime_error("Seed JSON must contain a \"stock\" array");
        }

        SeedResult result;
        size_t index = 0;
        for (const auto& row : root["stock"]) {
            std::string error = provisionRow(row);
            if (error.empty()) {
                ++result.provisioned;
            } else {
                ++result.skipped;
                result.errors.push_back("row " + std::to_string(index) + ": " + error);
                std::cerr << "[JsonSeedLoader] Skipped row " << index << ": " << error << std::endl;
            }
            ++index;
        }

        std::cout << "[JsonSeedLoader] Provisioned " << result.provisioned
                  << ", skipped " << result.skipped << std::endl;
        return result;
    }

private:
    std::shared_ptr<ports::input::IStockCountService> stockCount_;

    std::string provisionRow(const nlohmann::json& row) {
        try {
            int64_t productId = row.at("product_id").get<int64_t>();
            int64_t locationId = row.at("location_id").get<int64_t>();
            int64_t onHand = row.at("on_hand").get<int64_t>();
            int64_t reserved = row.value("reserved", static_cast<int64_t>(0));

            std::optional<domain::Timestamp> lastCheckedAt;
            std::string checked = row.value("last_checked_at", "");
            if (!checked.empty()) {
                lastCheckedAt = domain::Timestamp::fromString(checked);
            }

            auto provisioned = stockCount_->provision(productId, locationId, onHand, reserved, lastCheckedAt);
            return provisioned.isSuccess() ? "" : provisioned.message;

        } catch (const nlohmann::json::exception& e) {
            return e.what();
        } catch (const std::invalid_argument& e) {
            return e.what();
        }
    }
};

} // namespace inventory::adapters::secondary
