#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IRiskHaltGuard.h"

namespace rebalex {
namespace risk {

// A limit with a non-positive value is disabled.
struct RiskLimits {
    std::optional<double> max_order_notional;
    std::optional<double> max_position_ratio;
    std::optional<double> max_total_notional;
    std::optional<int> max_symbols;
    std::optional<double> min_cash_buffer_ratio;

    bool notionalLimitsConfigured() const;
};

struct RiskOrderLine {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    double price = 0.0;

    double notional() const { return quantity * price; }
};

struct RiskGateInput {
    long long project_id = 0;
    TradingMode mode = TradingMode::PAPER;
    std::vector<RiskOrderLine> orders;
    std::map<std::string, double> held_quantity;
    std::optional<double> portfolio_value;
    std::optional<double> cash_available;
    // skip the notional/exposure limits (manually composed orders)
    bool bypass_limits = false;
    // proceed even when the halt guard reports halted
    bool force_guard = false;
};

struct RiskGateResult {
    bool allowed = true;
    std::vector<std::string> reasons;
    double total_notional = 0.0;
    int symbol_count = 0;
    std::string guard_status = "active";
    std::string guard_reason;
    bool bypassed = false;
    bool forced = false;

    std::string firstReason() const { return reasons.empty() ? std::string() : reasons.front(); }
};

class RiskGate {
public:
    RiskGate(RiskLimits limits, std::shared_ptr<core::IRiskHaltGuard> guard);

    RiskGateResult evaluate(const RiskGateInput& input) const;

    const RiskLimits& limits() const { return limits_; }
    // Active when no guard is configured.
    core::GuardState guardState(long long project_id, TradingMode mode) const;

private:
    RiskLimits limits_;
    std::shared_ptr<core::IRiskHaltGuard> guard_;
};

} // namespace risk
} // namespace rebalex
