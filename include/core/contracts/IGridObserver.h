#pragma once

#include "strategy/GridState.h"

namespace supergrid {
namespace core {

class IGridObserver {
public:
    virtual ~IGridObserver() = default;

    virtual void onGridState(const strategy::GridStateSnapshot& snapshot) = 0;
};

} // namespace core
} // namespace supergrid
