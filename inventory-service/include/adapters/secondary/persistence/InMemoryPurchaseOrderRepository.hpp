#pragma once

#include "ports/output/IPurchaseOrderRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory реализация репозитория заказов поставщикам
 */
class InMemoryPurchaseOrderRepository : public ports::output::IPurchaseOrderRepository {
public:
    bool insert(const domain::PurchaseOrder& order) override {
        return orders_.insertIfAbsent(order.id, std::make_shared<domain::PurchaseOrder>(order));
    }

    void save(const domain::PurchaseOrder& order) override {
        orders_.insert(order.id, std::make_shared<domain::PurchaseOrder>(order));
    }

    std::optional<domain::PurchaseOrder> findById(const std::string& id) override {
        auto order = orders_.find(id);
        return order ? std::optional(*order) : std::nullopt;
    }

    std::vector<domain::PurchaseOrder> findAll() override {
        std::vector<domain::PurchaseOrder> result;
        for (const auto& order : orders_.getAll()) {
            result.push_back(*order);
        }
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::PurchaseOrder> orders_;
};

} // namespace inventory::adapters::secondary
