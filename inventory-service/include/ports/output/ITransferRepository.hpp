#pragma once

#include "domain/Transfer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

class ITransferRepository {
public:
    virtual ~ITransferRepository() = default;

    /**
     * @brief Сохранить новое перемещение
     * @return false если перемещение с таким id уже есть (ничего не записано)
     */
    virtual bool insert(const domain::Transfer& transfer) = 0;

    virtual void save(const domain::Transfer& transfer) = 0;

    virtual std::optional<domain::Transfer> findById(const std::string& id) = 0;

    virtual std::vector<domain::Transfer> findByStatus(domain::TransferStatus status) = 0;

    virtual std::vector<domain::Transfer> findAll() = 0;
};

} // namespace inventory::ports::output
