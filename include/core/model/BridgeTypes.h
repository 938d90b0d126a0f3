#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace rebalex {
namespace core {

// Snapshots read from the bridge carry their own freshness metadata; a
// snapshot that is missing or stale is never used as evidence.

struct BridgeStatus {
    bool present = false;
    std::string status;
    bool connected = false;
    long long last_heartbeat_ms = 0;
    int leader_pid = 0;
    bool stale = true;
};

struct OpenOrderItem {
    std::string tag;
    std::string broker_order_id;
    std::string status;
    std::string symbol;
};

struct OpenOrdersSnapshot {
    bool present = false;
    bool stale = true;
    long long refreshed_at_ms = 0;
    std::vector<OpenOrderItem> items;

    const OpenOrderItem* findTag(const std::string& tag) const {
        for (const auto& item : items) {
            if (item.tag == tag) return &item;
        }
        return nullptr;
    }

    bool containsSymbol(const std::string& symbol) const {
        for (const auto& item : items) {
            if (item.symbol == symbol) return true;
        }
        return false;
    }
};

struct HoldingItem {
    std::string symbol;
    double quantity = 0.0;
    double avg_cost = 0.0;
};

struct HoldingsSnapshot {
    bool present = false;
    bool stale = true;
    long long refreshed_at_ms = 0;
    std::map<std::string, HoldingItem> items;

    double quantityOf(const std::string& symbol) const {
        auto it = items.find(symbol);
        return it == items.end() ? 0.0 : it->second.quantity;
    }
};

struct QuoteItem {
    std::string symbol;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> last;
    std::optional<double> close;
};

struct QuotesSnapshot {
    bool present = false;
    bool stale = true;
    long long refreshed_at_ms = 0;
    std::map<std::string, QuoteItem> items;
};

struct ExecutionEvent {
    std::string event_id;
    std::string tag;
    std::string status;
    // cumulative filled quantity reported for the tag
    double filled = 0.0;
    std::optional<double> price;
    double commission = 0.0;
    std::string broker_order_id;
    long long time_ms = 0;
};

struct CommandResult {
    std::string command_id;
    std::string status;
    long long processed_at_ms = 0;
    std::string broker_order_id;
    std::string reason;
};

struct PendingCommand {
    std::string command_id;
    std::string type;
    long long created_at_ms = 0;
    long long expires_at_ms = 0;
};

struct SubmitCommand {
    std::string command_id;
    std::string symbol;
    double signed_quantity = 0.0;
    std::string tag;
    OrderType order_type = OrderType::MKT;
    std::optional<double> limit_price;
    std::optional<double> prime_price;
    int priority = 0;
    bool outside_rth = false;
    long long created_at_ms = 0;
    long long expires_at_ms = 0;
};

struct CancelCommand {
    std::string command_id;
    std::string tag;
    std::string broker_order_id;
    std::string reason;
    long long created_at_ms = 0;
    long long expires_at_ms = 0;
};

struct IntentRecord {
    std::string id;
    std::string symbol;
    double quantity = 0.0;  // signed: BUY > 0, SELL < 0
    OrderType order_type = OrderType::MKT;
    std::optional<double> limit_price;
    std::optional<double> prime_price;
    bool outside_rth = false;
    std::string session = "regular";
};

struct ExecutionParams {
    int lot_size = 1;
    double min_qty = 1.0;
    double cash_buffer_ratio = 0.0;
    double commission_per_share = 0.005;
    double slippage_bps = 5.0;
    bool manage_unfilled = false;
    long long unfilled_timeout_ms = 0;
    std::string reprice_policy = "none";
    bool exit_on_submit = true;
};

} // namespace core
} // namespace rebalex
