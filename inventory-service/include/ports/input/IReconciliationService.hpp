#pragma once

#include "domain/ReconciliationReport.hpp"

namespace inventory::ports::input {

/**
 * @brief Интерфейс сверки ледджера с журналом
 */
class IReconciliationService {
public:
    virtual ~IReconciliationService() = default;

    virtual domain::ReconciliationReport reconcile() = 0;
};

} // namespace inventory::ports::input
