#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/BridgeTypes.h"
#include "core/model/ExecutionTypes.h"

namespace rebalex {
namespace execution {

enum class IntentBuildErrorCode { PORTFOLIO_VALUE_REQUIRED, ORDERS_EMPTY, PRICE_MISSING };

class IntentBuildError : public std::runtime_error {
public:
    IntentBuildError(IntentBuildErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    IntentBuildErrorCode code() const { return code_; }

private:
    IntentBuildErrorCode code_;
};

struct IntentBuildInput {
    long long run_id = 0;
    std::map<std::string, double> target_weights;
    std::map<std::string, core::HoldingItem> holdings;
    // sizing (reference) prices per symbol
    std::map<std::string, double> prices;
    // optional side-aware limit/priming prices per symbol
    std::map<std::string, double> limit_prices;
    core::SizingConfig sizing;
    bool notional_limits_configured = false;
};

struct OrderIntent {
    std::string intent_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    OrderType order_type = OrderType::MKT;
    std::optional<double> limit_price;
    std::optional<double> prime_price;
    double reference_price = 0.0;
    double target_quantity = 0.0;
    double held_quantity = 0.0;

    double notional() const { return quantity * reference_price; }
};

struct IntentBuildResult {
    std::vector<OrderIntent> intents;
    // target symbols skipped because no price resolved
    std::vector<std::string> missing_prices;
};

class OrderIntentBuilder {
public:
    // Throws IntentBuildError. PRICE_MISSING only when every candidate symbol
    // lacked a price; otherwise unpriced symbols are listed in the result.
    static IntentBuildResult build(const IntentBuildInput& input);

    static std::string intentId(long long run_id, int sequence);

    static core::IntentRecord toIntentRecord(const core::Order& order, const core::SizingConfig& sizing);
};

} // namespace execution
} // namespace rebalex
