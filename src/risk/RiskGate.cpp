#include "risk/RiskGate.h"

#include <cmath>
#include <set>

#include "common/Logger.h"
#include "common/LotSizeHelper.h"

namespace rebalex {
namespace risk {

namespace {
template <typename T>
bool enabled(const std::optional<T>& limit) {
    return limit.has_value() && *limit > 0;
}
} // namespace

bool RiskLimits::notionalLimitsConfigured() const {
    return enabled(max_order_notional) || enabled(max_position_ratio) ||
           enabled(max_total_notional) || enabled(min_cash_buffer_ratio);
}

RiskGate::RiskGate(RiskLimits limits, std::shared_ptr<core::IRiskHaltGuard> guard)
    : limits_(std::move(limits)), guard_(std::move(guard)) {}

core::GuardState RiskGate::guardState(long long project_id, TradingMode mode) const {
    if (!guard_) {
        return core::GuardState{};
    }
    return guard_->evaluate(project_id, mode);
}

RiskGateResult RiskGate::evaluate(const RiskGateInput& input) const {
    RiskGateResult result;

    std::set<std::string> symbols;
    std::map<std::string, double> net_quantity;
    double buy_notional = 0.0;
    double sell_notional = 0.0;
    for (const auto& line : input.orders) {
        symbols.insert(line.symbol);
        result.total_notional += line.notional();
        net_quantity[line.symbol] += common::signedQuantity(line.side, line.quantity);
        if (line.side == OrderSide::BUY) {
            buy_notional += line.notional();
        } else {
            sell_notional += line.notional();
        }
    }
    result.symbol_count = static_cast<int>(symbols.size());

    if (guard_) {
        const auto state = guard_->evaluate(input.project_id, input.mode);
        result.guard_status = state.status;
        result.guard_reason = state.reason;
        if (state.halted()) {
            if (input.force_guard) {
                result.forced = true;
                LOG_WARN("risk gate: guard halted ({}) but forced", state.reason);
            } else {
                result.reasons.push_back("guard_halted");
                LOG_WARN("risk gate: guard halted ({})", state.reason);
            }
        }
    }

    if (input.bypass_limits) {
        result.bypassed = true;
        result.allowed = result.reasons.empty();
        return result;
    }

    if (enabled(limits_.max_symbols) && result.symbol_count > *limits_.max_symbols) {
        LOG_WARN("risk gate: {} symbols > max {}", result.symbol_count, *limits_.max_symbols);
        result.reasons.push_back("max_symbols");
    }

    if (enabled(limits_.max_order_notional)) {
        for (const auto& line : input.orders) {
            if (line.notional() > *limits_.max_order_notional) {
                LOG_WARN("risk gate: {} order notional {:.2f} > {:.2f}",
                         line.symbol, line.notional(), *limits_.max_order_notional);
                result.reasons.push_back("max_order_notional:" + line.symbol);
            }
        }
    }

    const bool has_value = input.portfolio_value.has_value() && *input.portfolio_value > 0.0;
    if (enabled(limits_.max_position_ratio) && has_value) {
        std::map<std::string, double> prices;
        for (const auto& line : input.orders) {
            prices[line.symbol] = line.price;
        }
        const double allowed = *limits_.max_position_ratio * *input.portfolio_value;
        for (const auto& [symbol, net] : net_quantity) {
            double held = 0.0;
            auto it = input.held_quantity.find(symbol);
            if (it != input.held_quantity.end()) {
                held = it->second;
            }
            const double exposure = std::fabs(held + net) * prices[symbol];
            if (exposure > allowed) {
                LOG_WARN("risk gate: {} post-trade exposure {:.2f} > {:.2f}", symbol, exposure, allowed);
                result.reasons.push_back("max_position_ratio:" + symbol);
            }
        }
    }

    if (enabled(limits_.max_position_ratio) && !has_value && !input.orders.empty()) {
        result.reasons.push_back("max_position_ratio:missing_portfolio_value");
    }

    if (enabled(limits_.max_total_notional) && result.total_notional > *limits_.max_total_notional) {
        LOG_WARN("risk gate: total notional {:.2f} > {:.2f}", result.total_notional, *limits_.max_total_notional);
        result.reasons.push_back("max_total_notional");
    }

    if (enabled(limits_.min_cash_buffer_ratio)) {
        if (!input.cash_available.has_value() || !has_value) {
            result.reasons.push_back("min_cash_buffer_ratio:missing_cash_available");
        } else {
            const double cash_after = *input.cash_available - buy_notional + sell_notional;
            const double ratio = cash_after / *input.portfolio_value;
            if (ratio < *limits_.min_cash_buffer_ratio) {
                LOG_WARN("risk gate: cash buffer {:.4f} < {:.4f}", ratio, *limits_.min_cash_buffer_ratio);
                result.reasons.push_back("min_cash_buffer_ratio");
            }
        }
    }

    result.allowed = result.reasons.empty();
    return result;
}

} // namespace risk
} // namespace rebalex
