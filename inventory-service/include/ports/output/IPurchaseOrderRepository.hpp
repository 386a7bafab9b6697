#pragma once

#include "domain/PurchaseOrder.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

class IPurchaseOrderRepository {
public:
    virtual ~IPurchaseOrderRepository() = default;

    /**
     * @brief Сохранить новый заказ
     * @return false если id уже занят
     */
    virtual bool insert(const domain::PurchaseOrder& order) = 0;

    virtual void save(const domain::PurchaseOrder& order) = 0;

    virtual std::optional<domain::PurchaseOrder> findById(const std::string& id) = 0;

    virtual std::vector<domain::PurchaseOrder> findAll() = 0;
};

} // namespace inventory::ports::output
