#pragma once

#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace rebalex {
namespace core {

struct SizingConfig {
    std::optional<double> portfolio_value;
    std::optional<double> cash_available;
    double cash_buffer_ratio = 0.0;
    int lot_size = 1;
    double min_qty = 1.0;
    OrderType order_type = OrderType::MKT;
    bool outside_rth = false;
    std::string execution_session = "regular";
};

struct SubmissionInfo {
    SubmissionChannel channel = SubmissionChannel::NONE;
    std::string intent_path;
    std::string params_path;
    std::string output_dir;
    int pid = 0;
    // kernel start time of pid, 0 when unknown
    long long pid_start_time = 0;
    long long launched_at_ms = 0;
    int launch_count = 0;
    bool fallback_triggered = false;
    std::string fallback_reason;
    int superseded_orders = 0;
    long long fallback_at_ms = 0;
    long long auto_resumed_at_ms = 0;
};

struct RiskSnapshot {
    bool evaluated = false;
    bool ok = true;
    std::vector<std::string> reasons;
    double total_notional = 0.0;
    int symbol_count = 0;
    std::string guard_status;
    std::string guard_reason;
    bool bypassed = false;
    bool forced = false;
};

struct CompletionSummary {
    int total = 0;
    int new_count = 0;
    int submitted = 0;
    int partial = 0;
    int filled = 0;
    int canceled = 0;
    int rejected = 0;
    int skipped = 0;
    int with_fills = 0;
    double filled_quantity = 0.0;
    bool terminal = false;
    std::optional<RunStatus> status;

    bool operator==(const CompletionSummary& other) const {
        return total == other.total && new_count == other.new_count &&
               submitted == other.submitted && partial == other.partial &&
               filled == other.filled && canceled == other.canceled &&
               rejected == other.rejected && skipped == other.skipped &&
               with_fills == other.with_fills && terminal == other.terminal &&
               status == other.status &&
               std::fabs(filled_quantity - other.filled_quantity) <= kQuantityTolerance;
    }
    bool operator!=(const CompletionSummary& other) const { return !(*this == other); }
};

struct ProcessOutcome {
    int pid = 0;
    // "not_running" | "term_requested" | "terminated" | "killed" | "leader_skipped" | "signal_failed"
    std::string outcome;
    long long term_requested_at_ms = 0;
    long long finished_at_ms = 0;
    long long start_time = 0;
};

struct Run {
    long long id = 0;
    long long project_id = 0;
    TradingMode mode = TradingMode::PAPER;
    RunStatus status = RunStatus::QUEUED;
    std::string request_key;
    std::map<std::string, double> target_weights;
    SizingConfig sizing;
    SubmissionInfo submission;
    RiskSnapshot risk;
    CompletionSummary completion;
    std::optional<ProcessOutcome> process;
    bool bypass_risk = false;
    std::string message;
    std::string failure_code;
    long long created_at_ms = 0;
    long long started_at_ms = 0;
    long long ended_at_ms = 0;
    long long updated_at_ms = 0;
    long long last_progress_at_ms = 0;
    long long stalled_at_ms = 0;
    std::string stalled_reason;
    std::optional<long long> deadline_ms;
    nlohmann::json extras = nlohmann::json::object();
};

struct SubmitCommandMeta {
    std::string command_id;
    // "leader_command" | "short_lived" | "short_lived_fallback" | "direct"
    std::string source;
    // "pending" | "submitted" | "rejected" | "superseded" | "launched"
    std::string status;
    bool pending = false;
    std::string superseded_by;
    std::string reason;
    long long requested_at_ms = 0;
    long long expires_at_ms = 0;
    long long processed_at_ms = 0;
};

// Operator cancel of a single order. The order keeps its status until a
// cancel command result or the broker confirms it.
struct CancelRequestMeta {
    std::string command_id;
    std::string actor;
    std::string tag;
    // "" | "requested" | "completed" | "failed"
    std::string status;
    std::string result_status;
    bool tag_present_in_open_orders = false;
    long long requested_at_ms = 0;
    long long completed_at_ms = 0;
};

struct AutoRecoveryMeta {
    int attempts = 0;
    long long origin_order_id = 0;
    std::string origin_client_order_id;
    long long triggered_at_ms = 0;
    // "stop" | "cancel" | "replace"
    std::string last_action;
    std::string last_reason;
    long long last_at_ms = 0;
    std::string replacement_order_id;
};

struct HoldingsBaseline {
    bool captured = false;
    double quantity = 0.0;
    long long captured_at_ms = 0;
};

struct Order {
    long long id = 0;
    std::optional<long long> run_id;
    std::string client_order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;
    OrderType order_type = OrderType::MKT;
    std::optional<double> limit_price;
    std::optional<double> prime_price;
    OrderStatus status = OrderStatus::NEW;
    double filled_quantity = 0.0;
    double avg_fill_price = 0.0;
    std::string broker_order_id;
    std::string rejected_reason;
    SubmitCommandMeta submit_command;
    CancelRequestMeta cancel_request;
    AutoRecoveryMeta auto_recovery;
    HoldingsBaseline baseline;
    bool low_confidence = false;
    std::string low_confidence_reason;
    long long low_confidence_at_ms = 0;
    std::vector<std::string> applied_event_ids;
    nlohmann::json provenance = nlohmann::json::object();
    long long created_at_ms = 0;
    long long updated_at_ms = 0;
    long long last_progress_at_ms = 0;
};

struct Fill {
    long long id = 0;
    long long order_id = 0;
    double quantity = 0.0;
    double price = 0.0;
    double commission = 0.0;
    long long fill_time_ms = 0;
    // "execution_event" | "holdings"
    std::string source;
    std::string exec_token;
};

enum class JournalEventType {
    RUN_CREATED,
    RUN_STATUS_CHANGED,
    ORDER_CREATED,
    ORDER_STATUS_CHANGED,
    FILL_APPLIED,
    COMMAND_WRITTEN,
    COMMAND_SUPERSEDED,
    PROCESS_LAUNCHED,
    PROCESS_TERMINATED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::ORDER_STATUS_CHANGED;
    std::string symbol;
    std::string entity_id;
    nlohmann::json payload;
};

} // namespace core
} // namespace rebalex
