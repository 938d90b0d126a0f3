#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/Clock.h"
#include "core/contracts/IBrokerBridge.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionStore.h"
#include "execution/ProcessLifecycleManager.h"
#include "execution/RateLimiter.h"

namespace rebalex {
namespace execution {

struct DispatchOptions {
    long long leader_command_stale_ms = 15000;
    long long leader_pending_timeout_ms = 45000;
    long long command_expiry_ms = 120000;
    bool prefer_leader = true;

    // argv template; {run_id} {intent} {params} {output_dir} are substituted
    std::vector<std::string> launcher_command;
    std::string working_dir;
    bool exit_on_submit = true;
    bool manage_unfilled = false;
    long long unfilled_timeout_ms = 0;
    std::string reprice_policy = "none";
    double commission_per_share = 0.005;
    double slippage_bps = 5.0;

    int launch_limit_per_window = 1;
    long long launch_window_ms = 60000;

    std::filesystem::path lock_dir = "data/locks";
};

struct ChannelHealth {
    bool healthy = false;
    std::string reason;
    int leader_pid = 0;
};

struct DispatchResult {
    bool ok = false;
    SubmissionChannel channel = SubmissionChannel::NONE;
    std::string message;
    std::string reason;
    int commands_written = 0;
    int orders_launched = 0;
    std::optional<int> pid;
};

struct FallbackResult {
    bool triggered = false;
    int superseded = 0;
    bool launched = false;
    std::optional<int> pid;
    std::string reason;
};

struct CancelRequestResult {
    // terminal orders are left as they are
    bool noop = false;
    bool written = false;
    std::string command_id;
    std::string reason;
};

class SubmissionDispatcher {
public:
    static constexpr const char* kJobLockName = "trade_execution";

    SubmissionDispatcher(
        std::shared_ptr<core::IExecutionStore> store,
        std::shared_ptr<core::IBrokerBridge> bridge,
        std::shared_ptr<ProcessLifecycleManager> processes,
        std::shared_ptr<RateLimiter> limiter,
        std::shared_ptr<core::IEventJournal> journal,
        std::shared_ptr<const IClock> clock,
        DispatchOptions options
    );

    // include_backlog=false checks only the heartbeat and connection.
    ChannelHealth checkLeaderHealth(bool include_backlog = true);

    // Caller holds the trade_execution job lock.
    DispatchResult submitRun(const core::Run& run, const core::HoldingsSnapshot& holdings);

    // Supersedes leader commands pending past the timeout and launches a
    // fallback process for them. Takes the job lock itself and skips the
    // pass when it is busy.
    FallbackResult escalatePendingTimeouts(long long run_id);

    // Writes cancel_order commands for live orders and expires pending
    // submit commands. Returns the number of commands written.
    int cancelActiveOrders(const std::vector<core::Order>& orders, const std::string& reason);

    DispatchResult submitDirectOrder(const core::Order& order);

    // Writes a cancel_order command for one order whatever the leader health,
    // and records it on the order. Repeating the request while one is open
    // returns the open command. Throws std::invalid_argument("order_tag_missing")
    // and std::runtime_error("cancel_command_write_failed").
    CancelRequestResult requestCancel(const core::Order& order, const std::string& actor);

    // Expires a pending submit command and marks it withdrawn, so neither the
    // leader nor a fallback launch picks the order up again.
    bool withdrawSubmitCommand(const core::Order& order, const std::string& reason);

    const DispatchOptions& options() const { return options_; }

private:
    void captureBaselines(const std::vector<core::Order>& orders, const core::HoldingsSnapshot& holdings);
    DispatchResult submitViaLeader(const core::Run& run, const std::vector<core::Order>& orders);
    DispatchResult launchShortLived(
        const core::Run& run,
        const std::vector<core::Order>& orders,
        const std::string& source,
        const std::string& reason
    );
    bool writeSubmitCommandFor(const core::Order& order, int priority, const std::string& source, std::string& command_id);
    void supersede(const core::Order& order, const std::string& reason);
    std::vector<std::string> renderLaunchArgv(long long run_id, const std::string& intent_path,
                                              const std::string& params_path, const std::string& output_dir) const;
    void journal(core::JournalEventType type, const std::string& symbol, const std::string& entity_id,
                 nlohmann::json payload);

    std::shared_ptr<core::IExecutionStore> store_;
    std::shared_ptr<core::IBrokerBridge> bridge_;
    std::shared_ptr<ProcessLifecycleManager> processes_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<core::IEventJournal> journal_;
    std::shared_ptr<const IClock> clock_;
    DispatchOptions options_;
};

} // namespace execution
} // namespace rebalex
