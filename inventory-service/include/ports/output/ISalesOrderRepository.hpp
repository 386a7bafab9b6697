#pragma once

#include "domain/SalesOrder.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

class ISalesOrderRepository {
public:
    virtual ~ISalesOrderRepository() = default;

    virtual bool insert(const domain::SalesOrder& order) = 0;

    virtual void save(const domain::SalesOrder& order) = 0;

    virtual std::optional<domain::SalesOrder> findById(const std::string& id) = 0;

    virtual std::vector<domain::SalesOrder> findByStatus(domain::SalesOrderStatus status) = 0;
};

} // namespace inventory::ports::output
