#pragma once

#include "ports/output/ISalesOrderRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory реализация репозитория заказов покупателей
 */
class InMemorySalesOrderRepository : public ports::output::ISalesOrderRepository {
public:
    bool insert(const domain::SalesOrder& order) override {
        return orders_.insertIfAbsent(order.id, std::make_shared<domain::SalesOrder>(order));
    }

    void save(const domain::SalesOrder& order) override {
        orders_.insert(order.id, std::make_shared<domain::SalesOrder>(order));
    }

    std::optional<domain::SalesOrder> findById(const std::string& id) override {
        auto order = orders_.find(id);
        return order ? std::optional(*order) : std::nullopt;
    }

    std::vector<domain::SalesOrder> findByStatus(domain::SalesOrderStatus status) override {
        std::vector<domain::SalesOrder> result;
        for (const auto& order : orders_.getAll()) {
            if (order->status == status) {
                result.push_back(*order);
            }
        }
        // Сортируем по дате создания (старые первые)
        std::sort(result.begin(), result.end(),
            [](const domain::SalesOrder& a, const domain::SalesOrder& b) {
                return a.orderDate < b.orderDate;
            });
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::SalesOrder> orders_;
};

} // namespace inventory::adapters::secondary
