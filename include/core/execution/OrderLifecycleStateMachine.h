#pragma once

#include <string>

#include "common/Types.h"
#include "core/model/ExecutionTypes.h"

namespace rebalex {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    bool recognized = false;
    OrderStatus status = OrderStatus::SUBMITTED;
    double filled_quantity = 0.0;
    bool terminal = false;
};

class OrderLifecycleStateMachine {
public:
    // Maps a broker/bridge status string plus a cumulative filled quantity to
    // the target status. The filled quantity never decreases and is clamped to
    // the order quantity.
    static OrderLifecycleTransitionResult transition(
        const std::string& event,
        double current_filled_quantity,
        double order_quantity,
        double reported_filled_quantity = 0.0
    );

    static bool isTerminal(OrderStatus status);

    // Forward edges only. Self edges are allowed for PARTIAL (more fills).
    static bool canTransition(OrderStatus from, OrderStatus to);

    // CANCELED/SKIPPED inferred from absence of evidence can be reopened by
    // stronger evidence while still inside the recovery window.
    static bool isRecoverableLowConfidence(const Order& order, long long now_ms, long long window_ms);

    // canTransition, or a low-confidence override to SUBMITTED/PARTIAL/FILLED.
    static bool canApply(const Order& order, OrderStatus to, long long now_ms, long long window_ms);

    static bool isFullyFilled(double filled_quantity, double order_quantity);
};

} // namespace execution
} // namespace core
} // namespace rebalex
