#include "execution/OrderIntentBuilder.h"

#include <algorithm>
#include <cmath>
#include <set>

#include "common/Logger.h"
#include "common/LotSizeHelper.h"

namespace rebalex {
namespace execution {

std::string OrderIntentBuilder::intentId(long long run_id, int sequence) {
    return "oi_" + std::to_string(run_id) + "_" + std::to_string(sequence);
}

IntentBuildResult OrderIntentBuilder::build(const IntentBuildInput& input) {
    const auto& sizing = input.sizing;
    const bool has_value = sizing.portfolio_value.has_value() && *sizing.portfolio_value > 0.0;
    if (!has_value && (input.notional_limits_configured || !input.target_weights.empty())) {
        throw IntentBuildError(IntentBuildErrorCode::PORTFOLIO_VALUE_REQUIRED, "portfolio_value_required");
    }
    const double portfolio_value = has_value ? *sizing.portfolio_value : 0.0;
    const double investable = portfolio_value * (1.0 - std::clamp(sizing.cash_buffer_ratio, 0.0, 1.0));
    const double min_qty = std::max(0.0, sizing.min_qty);

    std::map<std::string, double> targets;
    for (const auto& [raw_symbol, weight] : input.target_weights) {
        targets[common::normalizeSymbol(raw_symbol)] += std::max(0.0, weight);
    }

    std::set<std::string> universe;
    for (const auto& [symbol, weight] : targets) universe.insert(symbol);
    for (const auto& [symbol, holding] : input.holdings) {
        if (std::fabs(holding.quantity) > kQuantityTolerance) universe.insert(common::normalizeSymbol(symbol));
    }

    IntentBuildResult result;
    for (const auto& symbol : universe) {
        double held = 0.0;
        double avg_cost = 0.0;
        auto holding = input.holdings.find(symbol);
        if (holding != input.holdings.end()) {
            held = holding->second.quantity;
            avg_cost = holding->second.avg_cost;
        }

        std::optional<double> price;
        auto price_it = input.prices.find(symbol);
        if (price_it != input.prices.end() && price_it->second > 0.0) {
            price = price_it->second;
        }

        const bool is_target = targets.count(symbol) > 0;
        double target_qty = 0.0;
        if (is_target) {
            if (!price) {
                LOG_WARN("intent: no price for target symbol {}, skipped", symbol);
                result.missing_prices.push_back(symbol);
                continue;
            }
            target_qty = common::floorToLot(targets[symbol] * investable / *price, sizing.lot_size);
        } else if (!price && avg_cost > 0.0) {
            // Full divest still needs a notional; cost basis is good enough.
            price = avg_cost;
        }

        const double delta = target_qty - held;
        if (std::fabs(delta) < std::max(min_qty, kQuantityTolerance)) {
            continue;
        }
        if (!price) {
            LOG_WARN("intent: no price for divest symbol {}, skipped", symbol);
            result.missing_prices.push_back(symbol);
            continue;
        }
        if (std::fabs(delta) * *price <= 0.0) {
            continue;
        }

        OrderIntent intent;
        intent.symbol = symbol;
        intent.side = delta > 0 ? OrderSide::BUY : OrderSide::SELL;
        intent.quantity = std::fabs(delta);
        intent.order_type = sizing.order_type;
        intent.reference_price = *price;
        intent.target_quantity = target_qty;
        intent.held_quantity = held;

        auto limit_it = input.limit_prices.find(symbol);
        const std::optional<double> limit = (limit_it != input.limit_prices.end() && limit_it->second > 0.0)
            ? std::optional<double>(limit_it->second)
            : std::nullopt;
        if (sizing.order_type == OrderType::LMT) {
            intent.limit_price = limit ? limit : price;
        }
        if (common::requiresPrimePrice(sizing.order_type)) {
            intent.prime_price = limit ? limit : price;
        } else if (sizing.order_type == OrderType::MKT) {
            intent.prime_price = price;
        }
        result.intents.push_back(std::move(intent));
    }

    if (result.intents.empty() && !result.missing_prices.empty()) {
        throw IntentBuildError(IntentBuildErrorCode::PRICE_MISSING, "price_missing:" + result.missing_prices.front());
    }
    if (result.intents.empty()) {
        throw IntentBuildError(IntentBuildErrorCode::ORDERS_EMPTY, "orders_empty");
    }

    std::stable_sort(result.intents.begin(), result.intents.end(), [](const OrderIntent& a, const OrderIntent& b) {
        if (a.side != b.side) {
            return a.side == OrderSide::SELL;
        }
        return a.symbol < b.symbol;
    });
    int sequence = 1;
    for (auto& intent : result.intents) {
        intent.intent_id = intentId(input.run_id, sequence++);
    }
    return result;
}

core::IntentRecord OrderIntentBuilder::toIntentRecord(const core::Order& order, const core::SizingConfig& sizing) {
    core::IntentRecord record;
    record.id = order.client_order_id;
    record.symbol = order.symbol;
    record.quantity = common::signedQuantity(order.side, order.quantity);
    record.order_type = order.order_type;
    record.limit_price = order.limit_price;
    record.prime_price = order.prime_price;
    record.outside_rth = sizing.outside_rth;
    record.session = sizing.execution_session;
    return record;
}

} // namespace execution
} // namespace rebalex
