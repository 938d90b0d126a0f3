#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/Clock.h"
#include "core/contracts/IBrokerBridge.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionStore.h"
#include "execution/ProcessLifecycleManager.h"
#include "execution/SubmissionDispatcher.h"

namespace rebalex {
namespace execution {

struct ReconcileOptions {
    // snapshot freshness
    long long open_orders_fresh_ms = 60000;
    long long holdings_fresh_ms = 60000;

    // how long an order may be missing from open orders after submission
    long long new_order_missing_grace_ms = 60000;
    long long active_order_missing_grace_ms = 180000;
    long long fallback_missing_grace_ms = 300000;

    long long low_confidence_recovery_window_ms = 30 * 60 * 1000;
    long long stall_window_ms = 15 * 60 * 1000;
    bool market_open = true;

    bool ingest_leader_events = true;
    bool infer_fills_from_holdings = true;
    bool escalate_pending = true;
};

struct ReconcileReport {
    long long run_id = 0;
    RunStatus status_before = RunStatus::QUEUED;
    RunStatus status_after = RunStatus::QUEUED;
    int events_applied = 0;
    int command_results_applied = 0;
    int low_confidence_marked = 0;
    int recovered = 0;
    int fills_recorded = 0;
    int forced_terminal = 0;
    int cancels_confirmed = 0;
    bool fallback_triggered = false;
    bool auto_resumed = false;
    std::string diagnostic;
    std::optional<core::ProcessOutcome> process;

    bool changed() const {
        return status_before != status_after || events_applied > 0 || command_results_applied > 0 ||
               low_confidence_marked > 0 || recovered > 0 || fills_recorded > 0 || forced_terminal > 0 ||
               cancels_confirmed > 0 || fallback_triggered;
    }
};

// Merges the execution event logs, command results, open-orders snapshot and
// holdings snapshot into persisted order and run state. A pass is idempotent:
// against unchanged inputs it writes nothing.
class ReconciliationEngine {
public:
    ReconciliationEngine(
        std::shared_ptr<core::IExecutionStore> store,
        std::shared_ptr<core::IBrokerBridge> bridge,
        std::shared_ptr<SubmissionDispatcher> dispatcher,
        std::shared_ptr<ProcessLifecycleManager> processes,
        std::shared_ptr<core::IEventJournal> journal,
        std::shared_ptr<const IClock> clock
    );

    ReconcileReport reconcileRun(long long run_id, const ReconcileOptions& options);

    // A terminal run still needs passes while its submission process is not
    // settled or one of its orders holds a low-confidence close that can
    // still be overturned.
    bool needsFollowUp(const core::Run& run, const ReconcileOptions& options);

    // Orders created without a run. Returns how many orders changed.
    int reconcileFreeOrders(const ReconcileOptions& options);

    // Runtime-fault markers recognised in a broker session log.
    static std::string detectSessionFault(const std::vector<std::string>& lines,
                                          std::vector<std::string>& affected_symbols);

    static std::string fillToken(long long order_id, const std::string& source, const std::string& watermark);

private:
    struct PassContext {
        const ReconcileOptions& options;
        long long now_ms;
        ReconcileReport& report;
        core::OpenOrdersSnapshot open_orders;
        bool open_orders_fresh = false;
        core::HoldingsSnapshot holdings;
        bool holdings_fresh = false;
        int leader_pid = 0;
    };

    PassContext loadSnapshots(const ReconcileOptions& options, ReconcileReport& report);

    void ingestEvents(const std::vector<core::ExecutionEvent>& events, std::vector<core::Order>& orders, PassContext& ctx);
    void applyCommandResults(std::vector<core::Order>& orders, PassContext& ctx);
    void applyCancelResults(std::vector<core::Order>& orders, PassContext& ctx);
    void applyOpenOrders(std::vector<core::Order>& orders, PassContext& ctx);
    void inferFillsFromHoldings(std::vector<core::Order>& orders, PassContext& ctx);
    void applySessionDiagnostics(const core::Run& run, std::vector<core::Order>& orders, PassContext& ctx);
    void forceTerminal(std::vector<core::Order>& orders, const std::string& code,
                       const std::vector<std::string>& affected_symbols, PassContext& ctx);
    void updateRunState(long long run_id, std::vector<core::Order>& orders, PassContext& ctx);
    void cleanupProcess(const core::Run& run, PassContext& ctx);
    void reviseClosedRun(const core::Run& run, PassContext& ctx);
    std::vector<core::ExecutionEvent> readEvents(long long run_id, const ReconcileOptions& options);

    bool recordFill(const core::Order& order, double new_filled_total, double price, double commission,
                    const std::string& source, const std::string& watermark, OrderStatus target,
                    const std::string& broker_order_id, const std::string& event_id,
                    std::vector<core::Order>& orders, PassContext& ctx);
    bool updateOrderTracked(const core::Order& before, const core::IExecutionStore::OrderMutator& mutator,
                            std::vector<core::Order>& orders, PassContext& ctx);
    void changeRunStatus(core::Run& row, RunStatus to, const std::string& message, long long now_ms);
    void refresh(std::vector<core::Order>& orders, const core::Order& updated);
    bool isHighConfidenceTerminal(const core::Order& order, const PassContext& ctx) const;
    static double lastKnownPrice(const core::Order& order);
    void journal(core::JournalEventType type, const std::string& symbol, const std::string& entity_id,
                 nlohmann::json payload, long long now_ms);

    std::shared_ptr<core::IExecutionStore> store_;
    std::shared_ptr<core::IBrokerBridge> bridge_;
    std::shared_ptr<SubmissionDispatcher> dispatcher_;
    std::shared_ptr<ProcessLifecycleManager> processes_;
    std::shared_ptr<core::IEventJournal> journal_;
    std::shared_ptr<const IClock> clock_;
};

} // namespace execution
} // namespace rebalex
