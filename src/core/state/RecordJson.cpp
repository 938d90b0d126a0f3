#include "core/state/RecordJson.h"

#include <stdexcept>

#include "common/LotSizeHelper.h"

namespace rebalex {
namespace core {

namespace {
template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

std::optional<double> optionalDouble(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

std::optional<long long> optionalInt64(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<long long>();
}

OrderType orderTypeFrom(const nlohmann::json& j) {
    const auto parsed = common::parseOrderType(j.value("order_type", std::string("MKT")));
    if (!parsed) {
        throw std::invalid_argument("order_type_invalid");
    }
    return *parsed;
}

nlohmann::json sizingToJson(const SizingConfig& s) {
    nlohmann::json j;
    putOptional(j, "portfolio_value", s.portfolio_value);
    putOptional(j, "cash_available", s.cash_available);
    j["cash_buffer_ratio"] = s.cash_buffer_ratio;
    j["lot_size"] = s.lot_size;
    j["min_qty"] = s.min_qty;
    j["order_type"] = toString(s.order_type);
    j["outside_rth"] = s.outside_rth;
    j["execution_session"] = s.execution_session;
    return j;
}

SizingConfig sizingFromJson(const nlohmann::json& j) {
    SizingConfig s;
    s.portfolio_value = optionalDouble(j, "portfolio_value");
    s.cash_available = optionalDouble(j, "cash_available");
    s.cash_buffer_ratio = j.value("cash_buffer_ratio", 0.0);
    s.lot_size = j.value("lot_size", 1);
    s.min_qty = j.value("min_qty", 1.0);
    s.order_type = orderTypeFrom(j);
    s.outside_rth = j.value("outside_rth", false);
    s.execution_session = j.value("execution_session", std::string("regular"));
    return s;
}

nlohmann::json submissionToJson(const SubmissionInfo& s) {
    nlohmann::json j;
    j["channel"] = toString(s.channel);
    j["intent_path"] = s.intent_path;
    j["params_path"] = s.params_path;
    j["output_dir"] = s.output_dir;
    j["pid"] = s.pid;
    j["pid_start_time"] = s.pid_start_time;
    j["launched_at_ms"] = s.launched_at_ms;
    j["launch_count"] = s.launch_count;
    j["fallback_triggered"] = s.fallback_triggered;
    j["fallback_reason"] = s.fallback_reason;
    j["superseded_orders"] = s.superseded_orders;
    j["fallback_at_ms"] = s.fallback_at_ms;
    j["auto_resumed_at_ms"] = s.auto_resumed_at_ms;
    return j;
}

SubmissionInfo submissionFromJson(const nlohmann::json& j) {
    SubmissionInfo s;
    s.channel = parseSubmissionChannel(j.value("channel", std::string("none")));
    s.intent_path = j.value("intent_path", std::string());
    s.params_path = j.value("params_path", std::string());
    s.output_dir = j.value("output_dir", std::string());
    s.pid = j.value("pid", 0);
    s.pid_start_time = j.value("pid_start_time", 0LL);
    s.launched_at_ms = j.value("launched_at_ms", 0LL);
    s.launch_count = j.value("launch_count", 0);
    s.fallback_triggered = j.value("fallback_triggered", false);
    s.fallback_reason = j.value("fallback_reason", std::string());
    s.superseded_orders = j.value("superseded_orders", 0);
    s.fallback_at_ms = j.value("fallback_at_ms", 0LL);
    s.auto_resumed_at_ms = j.value("auto_resumed_at_ms", 0LL);
    return s;
}

nlohmann::json riskToJson(const RiskSnapshot& r) {
    nlohmann::json j;
    j["evaluated"] = r.evaluated;
    j["ok"] = r.ok;
    j["reasons"] = r.reasons;
    j["total_notional"] = r.total_notional;
    j["symbol_count"] = r.symbol_count;
    j["guard_status"] = r.guard_status;
    j["guard_reason"] = r.guard_reason;
    j["bypassed"] = r.bypassed;
    j["forced"] = r.forced;
    return j;
}

RiskSnapshot riskFromJson(const nlohmann::json& j) {
    RiskSnapshot r;
    r.evaluated = j.value("evaluated", false);
    r.ok = j.value("ok", true);
    r.reasons = j.value("reasons", std::vector<std::string>{});
    r.total_notional = j.value("total_notional", 0.0);
    r.symbol_count = j.value("symbol_count", 0);
    r.guard_status = j.value("guard_status", std::string());
    r.guard_reason = j.value("guard_reason", std::string());
    r.bypassed = j.value("bypassed", false);
    r.forced = j.value("forced", false);
    return r;
}

CompletionSummary completionFromJson(const nlohmann::json& j) {
    CompletionSummary c;
    c.total = j.value("total", 0);
    c.new_count = j.value("new", 0);
    c.submitted = j.value("submitted", 0);
    c.partial = j.value("partial", 0);
    c.filled = j.value("filled", 0);
    c.canceled = j.value("canceled", 0);
    c.rejected = j.value("rejected", 0);
    c.skipped = j.value("skipped", 0);
    c.with_fills = j.value("with_fills", 0);
    c.filled_quantity = j.value("filled_quantity", 0.0);
    c.terminal = j.value("terminal", false);
    if (j.contains("status") && j["status"].is_string()) {
        c.status = parseRunStatus(j["status"].get<std::string>());
    }
    return c;
}

nlohmann::json processToJson(const ProcessOutcome& p) {
    nlohmann::json j;
    j["pid"] = p.pid;
    j["outcome"] = p.outcome;
    j["term_requested_at_ms"] = p.term_requested_at_ms;
    j["finished_at_ms"] = p.finished_at_ms;
    j["start_time"] = p.start_time;
    return j;
}

ProcessOutcome processFromJson(const nlohmann::json& j) {
    ProcessOutcome p;
    p.pid = j.value("pid", 0);
    p.outcome = j.value("outcome", std::string());
    p.term_requested_at_ms = j.value("term_requested_at_ms", 0LL);
    p.finished_at_ms = j.value("finished_at_ms", 0LL);
    p.start_time = j.value("start_time", 0LL);
    return p;
}

nlohmann::json submitMetaToJson(const SubmitCommandMeta& m) {
    nlohmann::json j;
    j["command_id"] = m.command_id;
    j["source"] = m.source;
    j["status"] = m.status;
    j["pending"] = m.pending;
    j["superseded_by"] = m.superseded_by;
    j["reason"] = m.reason;
    j["requested_at_ms"] = m.requested_at_ms;
    j["expires_at_ms"] = m.expires_at_ms;
    j["processed_at_ms"] = m.processed_at_ms;
    return j;
}

nlohmann::json cancelMetaToJson(const CancelRequestMeta& m) {
    nlohmann::json j;
    j["command_id"] = m.command_id;
    j["actor"] = m.actor;
    j["tag"] = m.tag;
    j["status"] = m.status;
    j["result_status"] = m.result_status;
    j["tag_present_in_open_orders"] = m.tag_present_in_open_orders;
    j["requested_at_ms"] = m.requested_at_ms;
    j["completed_at_ms"] = m.completed_at_ms;
    return j;
}

CancelRequestMeta cancelMetaFromJson(const nlohmann::json& j) {
    CancelRequestMeta m;
    m.command_id = j.value("command_id", std::string());
    m.actor = j.value("actor", std::string());
    m.tag = j.value("tag", std::string());
    m.status = j.value("status", std::string());
    m.result_status = j.value("result_status", std::string());
    m.tag_present_in_open_orders = j.value("tag_present_in_open_orders", false);
    m.requested_at_ms = j.value("requested_at_ms", 0LL);
    m.completed_at_ms = j.value("completed_at_ms", 0LL);
    return m;
}

nlohmann::json recoveryMetaToJson(const AutoRecoveryMeta& m) {
    nlohmann::json j;
    j["attempts"] = m.attempts;
    j["origin_order_id"] = m.origin_order_id;
    j["origin_client_order_id"] = m.origin_client_order_id;
    j["triggered_at_ms"] = m.triggered_at_ms;
    j["last_action"] = m.last_action;
    j["last_reason"] = m.last_reason;
    j["last_at_ms"] = m.last_at_ms;
    j["replacement_order_id"] = m.replacement_order_id;
    return j;
}

AutoRecoveryMeta recoveryMetaFromJson(const nlohmann::json& j) {
    AutoRecoveryMeta m;
    m.attempts = j.value("attempts", 0);
    m.origin_order_id = j.value("origin_order_id", 0LL);
    m.origin_client_order_id = j.value("origin_client_order_id", std::string());
    m.triggered_at_ms = j.value("triggered_at_ms", 0LL);
    m.last_action = j.value("last_action", std::string());
    m.last_reason = j.value("last_reason", std::string());
    m.last_at_ms = j.value("last_at_ms", 0LL);
    m.replacement_order_id = j.value("replacement_order_id", std::string());
    return m;
}

SubmitCommandMeta submitMetaFromJson(const nlohmann::json& j) {
    SubmitCommandMeta m;
    m.command_id = j.value("command_id", std::string());
    m.source = j.value("source", std::string());
    m.status = j.value("status", std::string());
    m.pending = j.value("pending", false);
    m.superseded_by = j.value("superseded_by", std::string());
    m.reason = j.value("reason", std::string());
    m.requested_at_ms = j.value("requested_at_ms", 0LL);
    m.expires_at_ms = j.value("expires_at_ms", 0LL);
    m.processed_at_ms = j.value("processed_at_ms", 0LL);
    return m;
}
} // namespace

std::optional<RunStatus> parseRunStatus(const std::string& value) {
    if (value == "queued") return RunStatus::QUEUED;
    if (value == "running") return RunStatus::RUNNING;
    if (value == "stalled") return RunStatus::STALLED;
    if (value == "blocked") return RunStatus::BLOCKED;
    if (value == "done") return RunStatus::DONE;
    if (value == "partial") return RunStatus::PARTIAL;
    if (value == "failed") return RunStatus::FAILED;
    if (value == "canceled") return RunStatus::CANCELED;
    return std::nullopt;
}

std::optional<OrderStatus> parseOrderStatus(const std::string& value) {
    if (value == "NEW") return OrderStatus::NEW;
    if (value == "SUBMITTED") return OrderStatus::SUBMITTED;
    if (value == "PARTIAL") return OrderStatus::PARTIAL;
    if (value == "FILLED") return OrderStatus::FILLED;
    if (value == "CANCELED") return OrderStatus::CANCELED;
    if (value == "REJECTED") return OrderStatus::REJECTED;
    if (value == "SKIPPED") return OrderStatus::SKIPPED;
    return std::nullopt;
}

SubmissionChannel parseSubmissionChannel(const std::string& value) {
    if (value == "leader") return SubmissionChannel::LEADER;
    if (value == "short_lived") return SubmissionChannel::SHORT_LIVED;
    return SubmissionChannel::NONE;
}

nlohmann::json toJson(const CompletionSummary& c) {
    nlohmann::json j;
    j["total"] = c.total;
    j["new"] = c.new_count;
    j["submitted"] = c.submitted;
    j["partial"] = c.partial;
    j["filled"] = c.filled;
    j["canceled"] = c.canceled;
    j["rejected"] = c.rejected;
    j["skipped"] = c.skipped;
    j["with_fills"] = c.with_fills;
    j["filled_quantity"] = c.filled_quantity;
    j["terminal"] = c.terminal;
    if (c.status) {
        j["status"] = toString(*c.status);
    } else {
        j["status"] = nullptr;
    }
    return j;
}

nlohmann::json toJson(const Run& run) {
    nlohmann::json j;
    j["id"] = run.id;
    j["project_id"] = run.project_id;
    j["mode"] = toString(run.mode);
    j["status"] = toString(run.status);
    j["request_key"] = run.request_key;
    j["target_weights"] = run.target_weights;
    j["sizing"] = sizingToJson(run.sizing);
    j["submission"] = submissionToJson(run.submission);
    j["risk"] = riskToJson(run.risk);
    j["completion"] = toJson(run.completion);
    if (run.process) {
        j["process"] = processToJson(*run.process);
    } else {
        j["process"] = nullptr;
    }
    j["bypass_risk"] = run.bypass_risk;
    j["message"] = run.message;
    j["failure_code"] = run.failure_code;
    j["created_at_ms"] = run.created_at_ms;
    j["started_at_ms"] = run.started_at_ms;
    j["ended_at_ms"] = run.ended_at_ms;
    j["updated_at_ms"] = run.updated_at_ms;
    j["last_progress_at_ms"] = run.last_progress_at_ms;
    j["stalled_at_ms"] = run.stalled_at_ms;
    j["stalled_reason"] = run.stalled_reason;
    putOptional(j, "deadline_ms", run.deadline_ms);
    j["extras"] = run.extras;
    return j;
}

Run runFromJson(const nlohmann::json& j) {
    Run run;
    run.id = j.at("id").get<long long>();
    run.project_id = j.value("project_id", 0LL);
    run.mode = common::parseTradingMode(j.value("mode", std::string("paper"))).value_or(TradingMode::PAPER);
    const auto status = parseRunStatus(j.value("status", std::string("queued")));
    if (!status) {
        throw std::invalid_argument("run_status_invalid");
    }
    run.status = *status;
    run.request_key = j.value("request_key", std::string());
    run.target_weights = j.value("target_weights", std::map<std::string, double>{});
    if (j.contains("sizing") && j["sizing"].is_object()) run.sizing = sizingFromJson(j["sizing"]);
    if (j.contains("submission") && j["submission"].is_object()) run.submission = submissionFromJson(j["submission"]);
    if (j.contains("risk") && j["risk"].is_object()) run.risk = riskFromJson(j["risk"]);
    if (j.contains("completion") && j["completion"].is_object()) run.completion = completionFromJson(j["completion"]);
    if (j.contains("process") && j["process"].is_object()) run.process = processFromJson(j["process"]);
    run.bypass_risk = j.value("bypass_risk", false);
    run.message = j.value("message", std::string());
    run.failure_code = j.value("failure_code", std::string());
    run.created_at_ms = j.value("created_at_ms", 0LL);
    run.started_at_ms = j.value("started_at_ms", 0LL);
    run.ended_at_ms = j.value("ended_at_ms", 0LL);
    run.updated_at_ms = j.value("updated_at_ms", 0LL);
    run.last_progress_at_ms = j.value("last_progress_at_ms", 0LL);
    run.stalled_at_ms = j.value("stalled_at_ms", 0LL);
    run.stalled_reason = j.value("stalled_reason", std::string());
    run.deadline_ms = optionalInt64(j, "deadline_ms");
    run.extras = j.value("extras", nlohmann::json::object());
    return run;
}

nlohmann::json toJson(const Order& order) {
    nlohmann::json j;
    j["id"] = order.id;
    putOptional(j, "run_id", order.run_id);
    j["client_order_id"] = order.client_order_id;
    j["symbol"] = order.symbol;
    j["side"] = toString(order.side);
    j["quantity"] = order.quantity;
    j["order_type"] = toString(order.order_type);
    putOptional(j, "limit_price", order.limit_price);
    putOptional(j, "prime_price", order.prime_price);
    j["status"] = toString(order.status);
    j["filled_quantity"] = order.filled_quantity;
    j["avg_fill_price"] = order.avg_fill_price;
    j["broker_order_id"] = order.broker_order_id;
    j["rejected_reason"] = order.rejected_reason;
    j["submit_command"] = submitMetaToJson(order.submit_command);
    if (!order.cancel_request.command_id.empty()) {
        j["cancel_request"] = cancelMetaToJson(order.cancel_request);
    }
    if (order.auto_recovery.attempts > 0 || !order.auto_recovery.last_action.empty()) {
        j["auto_recovery"] = recoveryMetaToJson(order.auto_recovery);
    }
    j["baseline"] = {
        {"captured", order.baseline.captured},
        {"quantity", order.baseline.quantity},
        {"captured_at_ms", order.baseline.captured_at_ms}
    };
    j["low_confidence"] = order.low_confidence;
    j["low_confidence_reason"] = order.low_confidence_reason;
    j["low_confidence_at_ms"] = order.low_confidence_at_ms;
    j["applied_event_ids"] = order.applied_event_ids;
    j["provenance"] = order.provenance;
    j["created_at_ms"] = order.created_at_ms;
    j["updated_at_ms"] = order.updated_at_ms;
    j["last_progress_at_ms"] = order.last_progress_at_ms;
    return j;
}

Order orderFromJson(const nlohmann::json& j) {
    Order order;
    order.id = j.at("id").get<long long>();
    order.run_id = optionalInt64(j, "run_id");
    order.client_order_id = j.at("client_order_id").get<std::string>();
    order.symbol = j.at("symbol").get<std::string>();
    const auto side = common::parseOrderSide(j.value("side", std::string("BUY")));
    if (!side) {
        throw std::invalid_argument("order_side_invalid");
    }
    order.side = *side;
    order.quantity = j.value("quantity", 0.0);
    order.order_type = orderTypeFrom(j);
    order.limit_price = optionalDouble(j, "limit_price");
    order.prime_price = optionalDouble(j, "prime_price");
    const auto status = parseOrderStatus(j.value("status", std::string("NEW")));
    if (!status) {
        throw std::invalid_argument("order_status_invalid");
    }
    order.status = *status;
    order.filled_quantity = j.value("filled_quantity", 0.0);
    order.avg_fill_price = j.value("avg_fill_price", 0.0);
    order.broker_order_id = j.value("broker_order_id", std::string());
    order.rejected_reason = j.value("rejected_reason", std::string());
    if (j.contains("submit_command") && j["submit_command"].is_object()) {
        order.submit_command = submitMetaFromJson(j["submit_command"]);
    }
    if (j.contains("cancel_request") && j["cancel_request"].is_object()) {
        order.cancel_request = cancelMetaFromJson(j["cancel_request"]);
    }
    if (j.contains("auto_recovery") && j["auto_recovery"].is_object()) {
        order.auto_recovery = recoveryMetaFromJson(j["auto_recovery"]);
    }
    if (j.contains("baseline") && j["baseline"].is_object()) {
        const auto& b = j["baseline"];
        order.baseline.captured = b.value("captured", false);
        order.baseline.quantity = b.value("quantity", 0.0);
        order.baseline.captured_at_ms = b.value("captured_at_ms", 0LL);
    }
    order.low_confidence = j.value("low_confidence", false);
    order.low_confidence_reason = j.value("low_confidence_reason", std::string());
    order.low_confidence_at_ms = j.value("low_confidence_at_ms", 0LL);
    order.applied_event_ids = j.value("applied_event_ids", std::vector<std::string>{});
    order.provenance = j.value("provenance", nlohmann::json::object());
    order.created_at_ms = j.value("created_at_ms", 0LL);
    order.updated_at_ms = j.value("updated_at_ms", 0LL);
    order.last_progress_at_ms = j.value("last_progress_at_ms", 0LL);
    return order;
}

nlohmann::json toJson(const Fill& fill) {
    nlohmann::json j;
    j["id"] = fill.id;
    j["order_id"] = fill.order_id;
    j["quantity"] = fill.quantity;
    j["price"] = fill.price;
    j["commission"] = fill.commission;
    j["fill_time_ms"] = fill.fill_time_ms;
    j["source"] = fill.source;
    j["exec_token"] = fill.exec_token;
    return j;
}

Fill fillFromJson(const nlohmann::json& j) {
    Fill fill;
    fill.id = j.at("id").get<long long>();
    fill.order_id = j.at("order_id").get<long long>();
    fill.quantity = j.value("quantity", 0.0);
    fill.price = j.value("price", 0.0);
    fill.commission = j.value("commission", 0.0);
    fill.fill_time_ms = j.value("fill_time_ms", 0LL);
    fill.source = j.value("source", std::string());
    fill.exec_token = j.at("exec_token").get<std::string>();
    return fill;
}

} // namespace core
} // namespace rebalex
