#include "bridge/BridgeCodec.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "common/LotSizeHelper.h"
#include "common/TimeUtils.h"

namespace rebalex {
namespace bridge {

namespace {
std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

std::string stringField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        return {};
    }
    const auto& v = j[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<long long>());
    return {};
}

void putOptional(nlohmann::json& j, const char* key, const std::optional<double>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

bool snapshotStale(const nlohmann::json& j, long long refreshed_at_ms) {
    return j.value("stale", false) || refreshed_at_ms <= 0;
}
} // namespace

long long BridgeCodec::timestampMs(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        return 0;
    }
    const auto& v = j[key];
    if (v.is_number()) {
        return v.get<long long>();
    }
    if (v.is_string()) {
        return utils::TimeUtils::parseIsoUtcMs(v.get<std::string>()).value_or(0);
    }
    return 0;
}

core::BridgeStatus BridgeCodec::parseStatus(const nlohmann::json& j, long long now_ms, long long heartbeat_stale_ms) {
    core::BridgeStatus status;
    status.present = true;
    status.status = j.value("status", std::string());
    status.connected = j.value("connected", false);
    status.last_heartbeat_ms = timestampMs(j, "last_heartbeat");
    status.leader_pid = j.value("leader_pid", 0);
    status.stale = status.last_heartbeat_ms <= 0 || now_ms - status.last_heartbeat_ms > heartbeat_stale_ms;
    return status;
}

core::OpenOrdersSnapshot BridgeCodec::parseOpenOrders(const nlohmann::json& j) {
    core::OpenOrdersSnapshot snapshot;
    snapshot.present = true;
    snapshot.refreshed_at_ms = timestampMs(j, "refreshed_at");
    snapshot.stale = snapshotStale(j, snapshot.refreshed_at_ms);
    for (const auto& row : j.value("items", nlohmann::json::array())) {
        core::OpenOrderItem item;
        item.tag = stringField(row, "tag");
        item.broker_order_id = stringField(row, "broker_order_id");
        item.status = stringField(row, "status");
        item.symbol = common::normalizeSymbol(stringField(row, "symbol"));
        if (item.tag.empty() && item.symbol.empty()) {
            continue;
        }
        snapshot.items.push_back(std::move(item));
    }
    return snapshot;
}

core::HoldingsSnapshot BridgeCodec::parseHoldings(const nlohmann::json& j) {
    core::HoldingsSnapshot snapshot;
    snapshot.present = true;
    snapshot.refreshed_at_ms = timestampMs(j, "refreshed_at");
    snapshot.stale = snapshotStale(j, snapshot.refreshed_at_ms);
    for (const auto& row : j.value("items", nlohmann::json::array())) {
        core::HoldingItem item;
        item.symbol = common::normalizeSymbol(stringField(row, "symbol"));
        if (item.symbol.empty()) {
            continue;
        }
        item.quantity = optionalNumber(row, "quantity").value_or(0.0);
        item.avg_cost = optionalNumber(row, "avg_cost").value_or(0.0);
        auto& slot = snapshot.items[item.symbol];
        slot.symbol = item.symbol;
        slot.quantity += item.quantity;
        if (item.avg_cost > 0.0) {
            slot.avg_cost = item.avg_cost;
        }
    }
    return snapshot;
}

core::QuotesSnapshot BridgeCodec::parseQuotes(const nlohmann::json& j) {
    core::QuotesSnapshot snapshot;
    snapshot.present = true;
    snapshot.refreshed_at_ms = timestampMs(j, "refreshed_at");
    snapshot.stale = snapshotStale(j, snapshot.refreshed_at_ms);
    for (const auto& row : j.value("items", nlohmann::json::array())) {
        core::QuoteItem item;
        item.symbol = common::normalizeSymbol(stringField(row, "symbol"));
        if (item.symbol.empty()) {
            continue;
        }
        item.bid = optionalNumber(row, "bid");
        item.ask = optionalNumber(row, "ask");
        item.last = optionalNumber(row, "last");
        item.close = optionalNumber(row, "close");
        snapshot.items[item.symbol] = item;
    }
    return snapshot;
}

std::optional<core::ExecutionEvent> BridgeCodec::parseExecutionEvent(const nlohmann::json& j) {
    core::ExecutionEvent event;
    event.event_id = stringField(j, "event_id");
    event.tag = stringField(j, "tag");
    if (event.event_id.empty() || event.tag.empty()) {
        return std::nullopt;
    }
    event.status = stringField(j, "status");
    event.filled = optionalNumber(j, "filled").value_or(0.0);
    event.price = optionalNumber(j, "price");
    event.commission = optionalNumber(j, "commission").value_or(0.0);
    event.broker_order_id = stringField(j, "broker_order_id");
    event.time_ms = timestampMs(j, "time");
    return event;
}

std::optional<core::CommandResult> BridgeCodec::parseCommandResult(const nlohmann::json& j) {
    core::CommandResult result;
    result.command_id = stringField(j, "command_id");
    result.status = stringField(j, "status");
    if (result.status.empty()) {
        return std::nullopt;
    }
    result.processed_at_ms = timestampMs(j, "processed_at");
    result.broker_order_id = stringField(j, "broker_order_id");
    result.reason = stringField(j, "reason");
    return result;
}

std::optional<core::PendingCommand> BridgeCodec::parseCommandHeader(const nlohmann::json& j) {
    core::PendingCommand command;
    command.command_id = stringField(j, "command_id");
    if (command.command_id.empty()) {
        return std::nullopt;
    }
    command.type = stringField(j, "type");
    command.created_at_ms = timestampMs(j, "created_at");
    command.expires_at_ms = timestampMs(j, "expires_at");
    return command;
}

nlohmann::json BridgeCodec::toJson(const core::SubmitCommand& command) {
    nlohmann::json j;
    j["command_id"] = command.command_id;
    j["type"] = "submit_order";
    j["symbol"] = command.symbol;
    j["quantity"] = command.signed_quantity;
    j["tag"] = command.tag;
    j["order_type"] = toString(command.order_type);
    putOptional(j, "limit_price", command.limit_price);
    putOptional(j, "prime_price", command.prime_price);
    j["priority"] = command.priority;
    j["outside_rth"] = command.outside_rth;
    j["created_at"] = utils::TimeUtils::formatIsoUtc(command.created_at_ms);
    j["expires_at"] = utils::TimeUtils::formatIsoUtc(command.expires_at_ms);
    return j;
}

nlohmann::json BridgeCodec::toJson(const core::CancelCommand& command) {
    nlohmann::json j;
    j["command_id"] = command.command_id;
    j["type"] = "cancel_order";
    j["tag"] = command.tag;
    j["broker_order_id"] = command.broker_order_id;
    j["reason"] = command.reason;
    j["created_at"] = utils::TimeUtils::formatIsoUtc(command.created_at_ms);
    j["expires_at"] = utils::TimeUtils::formatIsoUtc(command.expires_at_ms);
    return j;
}

nlohmann::json BridgeCodec::toJson(const core::ExecutionParams& params) {
    nlohmann::json j;
    j["lot_size"] = params.lot_size;
    j["min_qty"] = params.min_qty;
    j["cash_buffer_ratio"] = params.cash_buffer_ratio;
    j["commission_per_share"] = params.commission_per_share;
    j["slippage_bps"] = params.slippage_bps;
    j["manage_unfilled"] = params.manage_unfilled;
    j["unfilled_timeout_sec"] = params.unfilled_timeout_ms / 1000;
    j["reprice_policy"] = params.reprice_policy;
    j["exit_on_submit"] = params.exit_on_submit;
    return j;
}

nlohmann::json BridgeCodec::intentToJson(const std::vector<core::IntentRecord>& records) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& record : records) {
        nlohmann::json j;
        j["id"] = record.id;
        j["symbol"] = record.symbol;
        j["quantity"] = record.quantity;
        j["order_type"] = toString(record.order_type);
        putOptional(j, "limit_price", record.limit_price);
        putOptional(j, "prime_price", record.prime_price);
        j["outside_rth"] = record.outside_rth;
        j["session"] = record.session;
        out.push_back(std::move(j));
    }
    return out;
}

std::vector<core::IntentRecord> BridgeCodec::intentFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("intent_not_array");
    }
    std::vector<core::IntentRecord> records;
    for (const auto& row : j) {
        core::IntentRecord record;
        record.id = stringField(row, "id");
        record.symbol = common::normalizeSymbol(stringField(row, "symbol"));
        record.quantity = optionalNumber(row, "quantity").value_or(0.0);
        record.order_type = common::parseOrderType(stringField(row, "order_type")).value_or(OrderType::MKT);
        record.limit_price = optionalNumber(row, "limit_price");
        record.prime_price = optionalNumber(row, "prime_price");
        record.outside_rth = row.value("outside_rth", false);
        record.session = row.value("session", std::string("regular"));
        records.push_back(std::move(record));
    }
    return records;
}

std::optional<double> BridgeCodec::lastCloseFromCsv(const std::string& body) {
    std::istringstream in(body);
    std::string line;
    std::optional<double> last;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto comma = line.find(',');
        if (comma == std::string::npos) {
            continue;
        }
        const std::string field = line.substr(comma + 1);
        char* end = nullptr;
        const double value = std::strtod(field.c_str(), &end);
        if (end == field.c_str() || !(value > 0.0)) {
            continue;
        }
        last = value;
    }
    return last;
}

} // namespace bridge
} // namespace rebalex
