#pragma once

#include <vector>

#include "common/Types.h"
#include "core/model/ExecutionTypes.h"

namespace rebalex {
namespace core {
namespace execution {

class RunLifecycleStateMachine {
public:
    // done / partial / failed / canceled. blocked is not terminal: a forced
    // re-execution may still move it to running.
    static bool isTerminal(RunStatus status);

    static bool canTransition(RunStatus from, RunStatus to);

    // Active runs take part in de-duplication and periodic reconciliation.
    static bool isActive(RunStatus status);

    // Deterministic completion over the order-status multiset. summary.status
    // is set only when every order is terminal.
    static CompletionSummary summarize(const std::vector<Order>& orders);
};

} // namespace execution
} // namespace core
} // namespace rebalex
