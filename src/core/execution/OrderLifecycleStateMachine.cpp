#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace rebalex {
namespace core {
namespace execution {

namespace {
std::string normalizeEvent(std::string event) {
    std::transform(event.begin(), event.end(), event.begin(), [](unsigned char c) {
        if (c == ' ' || c == '-') return '_';
        return static_cast<char>(std::tolower(c));
    });
    return event;
}
} // namespace

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    const std::string& event,
    double current_filled_quantity,
    double order_quantity,
    double reported_filled_quantity
) {
    OrderLifecycleTransitionResult result;
    result.filled_quantity = std::max(current_filled_quantity, reported_filled_quantity);
    if (order_quantity > 0.0) {
        result.filled_quantity = std::min(result.filled_quantity, order_quantity);
    }

    const std::string normalized_event = normalizeEvent(event);

    if (normalized_event == "filled") {
        result.recognized = true;
        result.status = OrderStatus::FILLED;
        if (result.filled_quantity <= 0.0) {
            result.filled_quantity = order_quantity;
        }
        result.terminal = true;
        return result;
    }

    if (normalized_event == "canceled" || normalized_event == "cancelled" ||
        normalized_event == "api_cancelled" || normalized_event == "api_canceled") {
        result.recognized = true;
        result.status = OrderStatus::CANCELED;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "rejected" || normalized_event == "inactive" || normalized_event == "error") {
        result.recognized = true;
        result.status = OrderStatus::REJECTED;
        result.terminal = true;
        return result;
    }

    if (normalized_event == "partially_filled" || normalized_event == "partial") {
        result.recognized = true;
        if (isFullyFilled(result.filled_quantity, order_quantity)) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else if (result.filled_quantity > 0.0) {
            result.status = OrderStatus::PARTIAL;
        } else {
            result.status = OrderStatus::SUBMITTED;
        }
        return result;
    }

    if (normalized_event == "submitted" || normalized_event == "presubmitted" ||
        normalized_event == "pending_submit" || normalized_event == "new") {
        result.recognized = true;
        if (result.filled_quantity > 0.0 && isFullyFilled(result.filled_quantity, order_quantity)) {
            result.status = OrderStatus::FILLED;
            result.terminal = true;
        } else {
            result.status = (result.filled_quantity > 0.0) ? OrderStatus::PARTIAL : OrderStatus::SUBMITTED;
        }
        return result;
    }

    result.status = (result.filled_quantity > 0.0) ? OrderStatus::PARTIAL : OrderStatus::SUBMITTED;
    return result;
}

bool OrderLifecycleStateMachine::isTerminal(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELED ||
           status == OrderStatus::REJECTED ||
           status == OrderStatus::SKIPPED;
}

bool OrderLifecycleStateMachine::canTransition(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::NEW:
            return to != OrderStatus::NEW;
        case OrderStatus::SUBMITTED:
            return to == OrderStatus::PARTIAL || to == OrderStatus::FILLED ||
                   to == OrderStatus::CANCELED || to == OrderStatus::REJECTED;
        case OrderStatus::PARTIAL:
            return to == OrderStatus::PARTIAL || to == OrderStatus::FILLED ||
                   to == OrderStatus::CANCELED;
        case OrderStatus::FILLED:
        case OrderStatus::CANCELED:
        case OrderStatus::REJECTED:
        case OrderStatus::SKIPPED:
            return false;
    }
    return false;
}

bool OrderLifecycleStateMachine::isRecoverableLowConfidence(
    const Order& order,
    long long now_ms,
    long long window_ms
) {
    if (!order.low_confidence) {
        return false;
    }
    if (order.status != OrderStatus::CANCELED && order.status != OrderStatus::SKIPPED) {
        return false;
    }
    return window_ms > 0 && now_ms - order.low_confidence_at_ms <= window_ms;
}

bool OrderLifecycleStateMachine::canApply(
    const Order& order,
    OrderStatus to,
    long long now_ms,
    long long window_ms
) {
    if (canTransition(order.status, to)) {
        return true;
    }
    if (to != OrderStatus::SUBMITTED && to != OrderStatus::PARTIAL && to != OrderStatus::FILLED) {
        return false;
    }
    return isRecoverableLowConfidence(order, now_ms, window_ms);
}

bool OrderLifecycleStateMachine::isFullyFilled(double filled_quantity, double order_quantity) {
    const double tol = kQuantityTolerance * std::max(1.0, std::fabs(order_quantity));
    return order_quantity > 0.0 && filled_quantity >= order_quantity - tol;
}

} // namespace execution
} // namespace core
} // namespace rebalex
