#include "core/execution/RunLifecycleStateMachine.h"

#include "core/execution/OrderLifecycleStateMachine.h"

namespace rebalex {
namespace core {
namespace execution {

bool RunLifecycleStateMachine::isTerminal(RunStatus status) {
    return status == RunStatus::DONE ||
           status == RunStatus::PARTIAL ||
           status == RunStatus::FAILED ||
           status == RunStatus::CANCELED;
}

bool RunLifecycleStateMachine::canTransition(RunStatus from, RunStatus to) {
    if (from == to) {
        return false;
    }
    switch (from) {
        case RunStatus::QUEUED:
            return true;
        case RunStatus::RUNNING:
            return to != RunStatus::QUEUED;
        case RunStatus::STALLED:
            return to != RunStatus::QUEUED && to != RunStatus::BLOCKED;
        case RunStatus::BLOCKED:
            return to == RunStatus::RUNNING || to == RunStatus::DONE ||
                   to == RunStatus::FAILED || to == RunStatus::CANCELED;
        case RunStatus::DONE:
        case RunStatus::PARTIAL:
        case RunStatus::FAILED:
        case RunStatus::CANCELED:
            return false;
    }
    return false;
}

bool RunLifecycleStateMachine::isActive(RunStatus status) {
    return status == RunStatus::QUEUED ||
           status == RunStatus::RUNNING ||
           status == RunStatus::STALLED;
}

CompletionSummary RunLifecycleStateMachine::summarize(const std::vector<Order>& orders) {
    CompletionSummary summary;
    summary.total = static_cast<int>(orders.size());

    bool any_active = false;
    bool any_unfilled_terminal = false;
    for (const auto& order : orders) {
        switch (order.status) {
            case OrderStatus::NEW: summary.new_count++; break;
            case OrderStatus::SUBMITTED: summary.submitted++; break;
            case OrderStatus::PARTIAL: summary.partial++; break;
            case OrderStatus::FILLED: summary.filled++; break;
            case OrderStatus::CANCELED: summary.canceled++; break;
            case OrderStatus::REJECTED: summary.rejected++; break;
            case OrderStatus::SKIPPED: summary.skipped++; break;
        }
        if (!OrderLifecycleStateMachine::isTerminal(order.status)) {
            any_active = true;
        } else if (order.status != OrderStatus::FILLED) {
            any_unfilled_terminal = true;
        }
        if (order.filled_quantity > 0.0 || order.status == OrderStatus::FILLED) {
            summary.with_fills++;
        }
        summary.filled_quantity += order.filled_quantity;
    }

    if (any_active) {
        return summary;
    }

    summary.terminal = true;
    if (summary.with_fills == 0) {
        summary.status = RunStatus::FAILED;
    } else if (any_unfilled_terminal) {
        summary.status = RunStatus::PARTIAL;
    } else {
        summary.status = RunStatus::DONE;
    }
    return summary;
}

} // namespace execution
} // namespace core
} // namespace rebalex
