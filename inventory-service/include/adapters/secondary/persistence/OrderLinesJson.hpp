#pragma once

#include "domain/PurchaseOrder.hpp"
#include "domain/SalesOrder.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief Строки заказов в JSONB-колонке lines
 *
 * Цена хранится как {"unit_price_cents", "currency"}.
 * Разбор бросает nlohmann::json::exception на неполной строке.
 */
inline std::string purchaseLinesToJson(const std::vector<domain::PurchaseLine>& lines) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& line : lines) {
        array.push_back({
            {"line_id", line.lineId},
            {"product_id", line.productId},
            {"quantity_ordered", line.quantityOrdered},
            {"quantity_received", line.quantityReceived},
            {"unit_price_cents", line.unitPrice.cents},
            {"currency", line.unitPrice.currency}
        });
    }
    return array.dump();
}

inline std::vector<domain::PurchaseLine> purchaseLinesFromJson(const std::string& text) {
    std::vector<domain::PurchaseLine> lines;
    for (const auto& item : nlohmann::json::parse(text)) {
        domain::PurchaseLine line;
        line.lineId = item.at("line_id").get<int64_t>();
        line.productId = item.at("product_id").get<int64_t>();
        line.quantityOrdered = item.at("quantity_ordered").get<int64_t>();
        line.quantityReceived = item.at("quantity_received").get<int64_t>();
        line.unitPrice = domain::Money(item.at("unit_price_cents").get<int64_t>(),
                                       item.at("currency").get<std::string>());
        lines.push_back(line);
    }
    return lines;
}

inline std::string salesLinesToJson(const std::vector<domain::SalesLine>& lines) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& line : lines) {
        nlohmann::json item = {
            {"line_id", line.lineId},
            {"product_id", line.productId},
            {"quantity", line.quantity},
            {"quantity_returned", line.quantityReturned},
            {"unit_price_cents", line.unitPrice.cents},
            {"currency", line.unitPrice.currency}
        };
        if (line.preferredLocationId) {
            item["preferred_location_id"] = *line.preferredLocationId;
        }
        array.push_back(item);
    }
    return array.dump();
}

inline std::vector<domain::SalesLine> salesLinesFromJson(const std::string& text) {
    std::vector<domain::SalesLine> lines;
    for (const auto& item : nlohmann::json::parse(text)) {
        domain::SalesLine line;
        line.lineId = item.at("line_id").get<int64_t>();
        line.productId = item.at("product_id").get<int64_t>();
        line.quantity = item.at("quantity").get<int64_t>();
        line.quantityReturned = item.at("quantity_returned").get<int64_t>();
        line.unitPrice = domain::Money(item.at("unit_price_cents").get<int64_t>(),
                                       item.at("currency").get<std::string>());
        if (item.contains("preferred_location_id")) {
            line.preferredLocationId = item.at("preferred_location_id").get<int64_t>();
        }
        lines.push_back(line);
    }
    return lines;
}

} // namespace inventory::adapters::secondary
