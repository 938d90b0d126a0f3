#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Clock.h"
#include "common/TimeUtils.h"
#include "core/contracts/IBrokerBridge.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionStore.h"
#include "core/model/ExecutionTypes.h"
#include "execution/ReconciliationEngine.h"
#include "execution/SubmissionDispatcher.h"
#include "risk/RiskGate.h"

namespace rebalex {
namespace core {

struct OrderRequest {
    std::string client_order_id;
    std::string symbol;
    std::string side = "BUY";
    double quantity = 0.0;
    std::string order_type = "MKT";
    std::optional<double> limit_price;
};

struct RunCreateRequest {
    long long project_id = 0;
    std::string mode = "paper";
    std::string live_confirm_token;
    // repeated requests with the same key reuse an active run
    std::string request_key;
    std::map<std::string, double> target_weights;
    std::vector<OrderRequest> orders;
    std::optional<double> portfolio_value;
    std::optional<double> cash_available;
    std::optional<std::string> order_type;
    bool bypass_risk = false;
    std::optional<long long> deadline_ms;
};

struct RunCreateResult {
    Run run;
    int orders_created = 0;
    bool reused = false;
};

struct ExecuteOptions {
    bool dry_run = false;
    // re-execute a blocked run and ignore a halted guard
    bool force = false;
    std::string live_confirm_token;
};

struct ExecuteResult {
    long long run_id = 0;
    RunStatus status = RunStatus::QUEUED;
    std::string message;
    bool dry_run = false;
    SubmissionChannel channel = SubmissionChannel::NONE;
    int orders_total = 0;
    std::vector<std::string> risk_reasons;
    std::vector<std::string> missing_prices;
    CompletionSummary completion;
};

struct RunStatusView {
    Run run;
    std::vector<Order> orders;
};

struct DirectOrderResult {
    Order order;
    bool created = false;
    bool submitted = false;
    std::string reason;
};

struct SymbolSummary {
    std::string symbol;
    std::optional<double> target_weight;
    double requested_quantity = 0.0;
    double filled_quantity = 0.0;
    double avg_fill_price = 0.0;
    std::optional<double> current_holding;
    std::optional<OrderStatus> last_status;
};

struct CancelOrderResult {
    Order order;
    bool noop = false;
    std::string command_id;
    std::string reason;
};

// Replacement of NEW orders that never reached the broker.
struct AutoRecoveryOptions {
    bool enabled = false;
    long long new_timeout_ms = 45000;
    int max_auto_retries = 1;
    // 0 disables the limit-price drift check
    double max_price_deviation_pct = 1.5;
    bool allow_replace_outside_rth = false;
};

struct AutoRecoveryReport {
    int scanned = 0;
    int cancelled = 0;
    int replaced = 0;
    int skipped = 0;
    int failed = 0;
    // set when the whole pass was skipped
    std::string reason;
};

struct CoordinatorOptions {
    SizingConfig default_sizing;
    rebalex::execution::ReconcileOptions reconcile;
    utils::MarketSession market_session;
    AutoRecoveryOptions auto_recovery;
    long long quote_stale_ms = 60000;
    std::filesystem::path lock_dir = "data/locks";
};

class TradeRunCoordinator {
public:
    TradeRunCoordinator(
        std::shared_ptr<IExecutionStore> store,
        std::shared_ptr<IBrokerBridge> bridge,
        std::shared_ptr<risk::RiskGate> risk_gate,
        std::shared_ptr<rebalex::execution::SubmissionDispatcher> dispatcher,
        std::shared_ptr<rebalex::execution::ReconciliationEngine> reconciler,
        std::shared_ptr<IEventJournal> journal,
        std::shared_ptr<const IClock> clock,
        CoordinatorOptions options
    );

    // Throws std::invalid_argument with a reason code on invalid input.
    RunCreateResult createRun(const RunCreateRequest& request);

    ExecuteResult executeRun(long long run_id, const ExecuteOptions& options);

    RunStatusView getRunStatus(long long run_id);
    rebalex::execution::ReconcileReport refreshRun(long long run_id);

    // Throws std::runtime_error("run_not_stalled").
    Run resumeRun(long long run_id, const std::string& reason);
    // Throws std::runtime_error("run_already_completed").
    Run terminateRun(long long run_id, const std::string& reason);

    DirectOrderResult createDirectOrder(const OrderRequest& request);

    // order_ref is an order id or a client order id.
    // Throws std::invalid_argument("order_not_found") or ("order_tag_missing").
    CancelOrderResult cancelOrder(const std::string& order_ref, const std::string& actor);

    // Cancels NEW orders older than the timeout that nothing else will
    // dispatch, and places one replacement per allowed retry.
    AutoRecoveryReport recoverStuckOrders();
    bool autoRecoveryEnabled() const { return options_.auto_recovery.enabled; }

    std::vector<SymbolSummary> symbolSummary(long long run_id);

    // One pass over every running or stalled run, every closed run that still
    // needs follow-up, and the free-standing orders. Returns the number of
    // runs whose state changed.
    int reconcileActiveRuns();

    rebalex::execution::ReconcileOptions currentReconcileOptions() const;

private:
    Run requireRun(long long run_id);
    Order validateOrderRequest(const OrderRequest& request) const;
    ExecuteResult executeLocked(const Run& run, const ExecuteOptions& options);
    std::vector<Order> stuckOrders(long long now_ms);
    void noteRecovery(const Order& order, const std::string& action, const std::string& reason, long long now_ms);
    void finishRun(long long run_id, RunStatus to, const std::string& message, const std::string& failure_code,
                   ExecuteResult& result);
    bool transitionRun(long long run_id, RunStatus to, const std::string& message,
                       const IExecutionStore::RunMutator& extra = nullptr);
    void journal(JournalEventType type, const std::string& symbol, const std::string& entity_id,
                 nlohmann::json payload);

    std::shared_ptr<IExecutionStore> store_;
    std::shared_ptr<IBrokerBridge> bridge_;
    std::shared_ptr<risk::RiskGate> risk_gate_;
    std::shared_ptr<rebalex::execution::SubmissionDispatcher> dispatcher_;
    std::shared_ptr<rebalex::execution::ReconciliationEngine> reconciler_;
    std::shared_ptr<IEventJournal> journal_;
    std::shared_ptr<const IClock> clock_;
    CoordinatorOptions options_;
    std::mutex create_mutex_;
};

} // namespace core
} // namespace rebalex
