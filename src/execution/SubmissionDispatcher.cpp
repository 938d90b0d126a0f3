#include "execution/SubmissionDispatcher.h"

#include <algorithm>
#include <stdexcept>

#include "common/Logger.h"
#include "common/LotSizeHelper.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "execution/JobLock.h"
#include "execution/OrderIntentBuilder.h"

namespace rebalex {
namespace execution {

namespace {
constexpr const char* kLaunchGroup = "short_lived_launch";

bool leaderStatusOk(const std::string& status) {
    return status == "ok" || status == "healthy" || status == "running" ||
           status == "ready" || status == "connected";
}

bool neverDispatched(const core::Order& order) {
    return order.status == OrderStatus::NEW && order.submit_command.status.empty();
}

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}
} // namespace

SubmissionDispatcher::SubmissionDispatcher(
    std::shared_ptr<core::IExecutionStore> store,
    std::shared_ptr<core::IBrokerBridge> bridge,
    std::shared_ptr<ProcessLifecycleManager> processes,
    std::shared_ptr<RateLimiter> limiter,
    std::shared_ptr<core::IEventJournal> journal,
    std::shared_ptr<const IClock> clock,
    DispatchOptions options
) : store_(std::move(store)),
    bridge_(std::move(bridge)),
    processes_(std::move(processes)),
    limiter_(std::move(limiter)),
    journal_(std::move(journal)),
    clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
    options_(std::move(options)) {
    limiter_->configureGroup(kLaunchGroup, options_.launch_limit_per_window, options_.launch_window_ms);
}

void SubmissionDispatcher::journal(
    core::JournalEventType type,
    const std::string& symbol,
    const std::string& entity_id,
    nlohmann::json payload
) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = clock_->nowMs();
    event.type = type;
    event.symbol = symbol;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("journal append failed for {}", entity_id);
    }
}

ChannelHealth SubmissionDispatcher::checkLeaderHealth(bool include_backlog) {
    ChannelHealth health;
    const auto status = bridge_->readStatus();
    health.leader_pid = status.leader_pid;

    if (!status.present) {
        health.reason = "leader_status_missing";
        return health;
    }
    if (status.stale) {
        health.reason = "leader_heartbeat_stale";
        return health;
    }
    if (!status.connected) {
        health.reason = "leader_disconnected";
        return health;
    }
    if (!leaderStatusOk(status.status)) {
        health.reason = "leader_status:" + status.status;
        return health;
    }

    if (!include_backlog) {
        health.healthy = true;
        return health;
    }

    const long long now = clock_->nowMs();
    for (const auto& command : bridge_->listPendingCommands()) {
        if (command.expires_at_ms > 0 && command.expires_at_ms <= now) {
            continue;
        }
        if (command.created_at_ms > 0 && now - command.created_at_ms > options_.leader_command_stale_ms) {
            health.reason = "leader_queue_backlog:" + command.command_id;
            return health;
        }
    }

    health.healthy = true;
    return health;
}

void SubmissionDispatcher::captureBaselines(
    const std::vector<core::Order>& orders,
    const core::HoldingsSnapshot& holdings
) {
    if (!holdings.present || holdings.stale) {
        LOG_WARN("holdings snapshot unavailable, fills will not be inferred from holdings");
        return;
    }
    const long long now = clock_->nowMs();
    for (const auto& order : orders) {
        const double quantity = holdings.quantityOf(order.symbol);
        store_->updateOrder(order.id, [&](core::Order& row) {
            if (row.baseline.captured) {
                return false;
            }
            row.baseline.captured = true;
            row.baseline.quantity = quantity;
            row.baseline.captured_at_ms = now;
            return true;
        });
    }
}

DispatchResult SubmissionDispatcher::submitRun(const core::Run& run, const core::HoldingsSnapshot& holdings) {
    std::vector<core::Order> orders;
    for (const auto& order : store_->listOrdersForRun(run.id)) {
        if (neverDispatched(order)) {
            orders.push_back(order);
        }
    }
    if (orders.empty()) {
        DispatchResult result;
        result.reason = "no_orders_to_submit";
        return result;
    }

    captureBaselines(orders, holdings);

    const auto health = checkLeaderHealth();
    if (health.healthy && options_.prefer_leader) {
        auto result = submitViaLeader(run, orders);
        if (result.ok) {
            return result;
        }
        LOG_WARN("run {} leader submission failed ({}), falling back", run.id, result.reason);
        std::vector<core::Order> relaunch;
        for (const auto& order : store_->listOrdersForRun(run.id)) {
            if (order.status == OrderStatus::NEW && order.submit_command.status == "superseded") {
                relaunch.push_back(order);
            } else if (neverDispatched(order)) {
                relaunch.push_back(order);
            }
        }
        return launchShortLived(run, relaunch, "short_lived_fallback", result.reason);
    }

    if (!health.healthy) {
        LOG_INFO("run {} leader channel unavailable ({}), using short-lived process", run.id, health.reason);
    }
    return launchShortLived(run, orders, "short_lived", health.healthy ? "leader_not_preferred" : health.reason);
}

bool SubmissionDispatcher::writeSubmitCommandFor(
    const core::Order& order,
    int priority,
    const std::string& source,
    std::string& command_id
) {
    const long long now = clock_->nowMs();
    command_id = "cmd_" + std::to_string(order.id) + "_" + std::to_string(now);

    core::SubmitCommand command;
    command.command_id = command_id;
    command.symbol = order.symbol;
    command.signed_quantity = common::signedQuantity(order.side, order.quantity);
    command.tag = order.client_order_id;
    command.order_type = order.order_type;
    command.limit_price = order.limit_price;
    command.prime_price = order.prime_price;
    command.priority = priority;
    command.created_at_ms = now;
    command.expires_at_ms = now + options_.command_expiry_ms;

    if (!bridge_->writeSubmitCommand(command)) {
        return false;
    }

    const auto updated = store_->updateOrder(order.id, [&](core::Order& row) {
        if (row.status != OrderStatus::NEW || row.submit_command.pending ||
            row.submit_command.status == "superseded") {
            return false;
        }
        row.submit_command.command_id = command_id;
        row.submit_command.source = source;
        row.submit_command.status = "pending";
        row.submit_command.pending = true;
        row.submit_command.reason.clear();
        row.submit_command.requested_at_ms = now;
        row.submit_command.expires_at_ms = command.expires_at_ms;
        return true;
    });
    if (!updated || updated->submit_command.command_id != command_id) {
        bridge_->expireCommand(command_id, now);
        return false;
    }

    journal(core::JournalEventType::COMMAND_WRITTEN, order.symbol, order.client_order_id,
            {{"command_id", command_id}, {"quantity", command.signed_quantity}});
    return true;
}

DispatchResult SubmissionDispatcher::submitViaLeader(const core::Run& run, const std::vector<core::Order>& orders) {
    DispatchResult result;
    result.channel = SubmissionChannel::LEADER;

    // Sells go first so the proceeds can fund the buys.
    std::vector<core::Order> ordered = orders;
    std::stable_sort(ordered.begin(), ordered.end(), [](const core::Order& a, const core::Order& b) {
        return a.side == OrderSide::SELL && b.side == OrderSide::BUY;
    });

    std::vector<core::Order> written;
    int priority = static_cast<int>(ordered.size());
    for (const auto& order : ordered) {
        std::string command_id;
        if (!writeSubmitCommandFor(order, priority--, "leader_command", command_id)) {
            result.reason = "command_write_failed";
            break;
        }
        written.push_back(order);
        result.commands_written++;
    }

    if (!result.reason.empty()) {
        // Keep the run on a single channel: withdraw what was written.
        for (const auto& order : written) {
            const auto fresh = store_->getOrder(order.id);
            if (fresh) {
                supersede(*fresh, "command_write_failed");
            }
        }
        return result;
    }

    const long long now = clock_->nowMs();
    store_->updateRun(run.id, [&](core::Run& row) {
        row.submission.channel = SubmissionChannel::LEADER;
        row.submission.output_dir = bridge_->runOutputDir(run.id);
        row.submission.launched_at_ms = now;
        return true;
    });

    result.ok = true;
    result.message = "submitted_leader";
    LOG_INFO("run {}: {} leader commands written", run.id, result.commands_written);
    return result;
}

std::vector<std::string> SubmissionDispatcher::renderLaunchArgv(
    long long run_id,
    const std::string& intent_path,
    const std::string& params_path,
    const std::string& output_dir
) const {
    std::vector<std::string> argv;
    for (const auto& part : options_.launcher_command) {
        std::string rendered = replaceAll(part, "{run_id}", std::to_string(run_id));
        rendered = replaceAll(rendered, "{intent}", intent_path);
        rendered = replaceAll(rendered, "{params}", params_path);
        rendered = replaceAll(rendered, "{output_dir}", output_dir);
        argv.push_back(std::move(rendered));
    }
    return argv;
}

DispatchResult SubmissionDispatcher::launchShortLived(
    const core::Run& run,
    const std::vector<core::Order>& orders,
    const std::string& source,
    const std::string& reason
) {
    DispatchResult result;
    result.channel = SubmissionChannel::SHORT_LIVED;
    result.reason = reason;

    if (orders.empty()) {
        result.reason = "no_orders_to_submit";
        return result;
    }
    if (options_.launcher_command.empty()) {
        result.reason = "launcher_not_configured";
        LOG_ERROR("run {}: cannot launch short-lived process, launcher command not configured", run.id);
        return result;
    }

    std::vector<core::IntentRecord> records;
    records.reserve(orders.size());
    for (const auto& order : orders) {
        records.push_back(OrderIntentBuilder::toIntentRecord(order, run.sizing));
    }

    core::ExecutionParams params;
    params.lot_size = run.sizing.lot_size;
    params.min_qty = run.sizing.min_qty;
    params.cash_buffer_ratio = run.sizing.cash_buffer_ratio;
    params.commission_per_share = options_.commission_per_share;
    params.slippage_bps = options_.slippage_bps;
    params.manage_unfilled = options_.manage_unfilled;
    params.unfilled_timeout_ms = options_.unfilled_timeout_ms;
    params.reprice_policy = options_.reprice_policy;
    params.exit_on_submit = options_.exit_on_submit && !options_.manage_unfilled;

    const auto intent_path = bridge_->writeOrderIntent(run.id, records);
    const auto params_path = bridge_->writeExecutionParams(run.id, params);
    if (!intent_path || !params_path) {
        result.reason = "intent_write_failed";
        return result;
    }

    const std::string limiter_key = std::to_string(run.id);
    if (!limiter_->tryAcquire(kLaunchGroup, limiter_key)) {
        result.reason = "launch_rate_limited";
        LOG_WARN("run {}: short-lived launch rate limited", run.id);
        return result;
    }

    const std::string output_dir = bridge_->runOutputDir(run.id);
    core::LaunchSpec spec;
    spec.argv = renderLaunchArgv(run.id, *intent_path, *params_path, output_dir);
    spec.working_dir = options_.working_dir;
    spec.log_path = output_dir + "/session.log";
    spec.env["REBALEX_RUN_ID"] = std::to_string(run.id);
    spec.env["REBALEX_INTENT_PATH"] = *intent_path;
    spec.env["REBALEX_PARAMS_PATH"] = *params_path;
    spec.env["REBALEX_OUTPUT_DIR"] = output_dir;

    const auto pid = processes_->launch(spec);
    if (!pid) {
        limiter_->blockUntil(kLaunchGroup, limiter_key, clock_->nowMs() + options_.launch_window_ms);
        result.reason = "launch_failed";
        return result;
    }

    const auto start_time = processes_->startTime(*pid);
    const long long now = clock_->nowMs();
    for (const auto& order : orders) {
        store_->updateOrder(order.id, [&](core::Order& row) {
            if (row.status != OrderStatus::NEW || row.submit_command.pending) {
                return false;
            }
            row.submit_command.source = source;
            row.submit_command.status = "launched";
            row.submit_command.requested_at_ms = now;
            row.submit_command.expires_at_ms = 0;
            return true;
        });
        result.orders_launched++;
    }

    store_->updateRun(run.id, [&](core::Run& row) {
        row.submission.channel = SubmissionChannel::SHORT_LIVED;
        row.submission.intent_path = *intent_path;
        row.submission.params_path = *params_path;
        row.submission.output_dir = output_dir;
        row.submission.pid = *pid;
        row.submission.pid_start_time = start_time.value_or(0);
        row.submission.launched_at_ms = now;
        row.submission.launch_count++;
        if (source == "short_lived_fallback") {
            row.submission.fallback_triggered = true;
            row.submission.fallback_reason = reason;
            row.submission.fallback_at_ms = now;
        }
        return true;
    });

    journal(core::JournalEventType::PROCESS_LAUNCHED, std::string(), "run_" + std::to_string(run.id),
            {{"pid", *pid}, {"source", source}, {"reason", reason}, {"orders", result.orders_launched}});

    result.ok = true;
    result.pid = pid;
    result.message = source == "short_lived_fallback" ? "submitted_short_lived_fallback" : "submitted_short_lived";
    return result;
}

void SubmissionDispatcher::supersede(const core::Order& order, const std::string& reason) {
    const long long now = clock_->nowMs();
    if (!order.submit_command.command_id.empty()) {
        bridge_->expireCommand(order.submit_command.command_id, now);
    }
    const auto updated = store_->updateOrder(order.id, [&](core::Order& row) {
        if (!row.submit_command.pending || row.status != OrderStatus::NEW) {
            return false;
        }
        row.submit_command.pending = false;
        row.submit_command.status = "superseded";
        row.submit_command.superseded_by = "short_lived_fallback";
        row.submit_command.reason = reason;
        row.submit_command.processed_at_ms = now;
        return true;
    });
    if (updated && updated->submit_command.status == "superseded") {
        journal(core::JournalEventType::COMMAND_SUPERSEDED, order.symbol, order.client_order_id,
                {{"command_id", order.submit_command.command_id}, {"reason", reason}});
    }
}

FallbackResult SubmissionDispatcher::escalatePendingTimeouts(long long run_id) {
    FallbackResult result;
    const auto run = store_->getRun(run_id);
    if (!run) {
        return result;
    }

    const long long now = clock_->nowMs();
    std::vector<core::Order> timed_out;
    bool any_superseded_unlaunched = false;
    for (const auto& order : store_->listOrdersForRun(run_id)) {
        if (order.status != OrderStatus::NEW) {
            continue;
        }
        if (order.submit_command.pending &&
            now - order.submit_command.requested_at_ms >= options_.leader_pending_timeout_ms) {
            timed_out.push_back(order);
        } else if (order.submit_command.status == "superseded") {
            any_superseded_unlaunched = true;
        }
    }
    if (timed_out.empty() && !any_superseded_unlaunched) {
        return result;
    }

    JobLock lock(kJobLockName, options_.lock_dir);
    if (!lock.tryAcquire()) {
        result.reason = "trade_execution_lock_busy";
        return result;
    }

    const std::string reason = "leader_submit_pending_timeout";
    for (const auto& order : timed_out) {
        // The leader may have answered in the meantime.
        if (bridge_->readCommandResult(order.submit_command.command_id)) {
            continue;
        }
        supersede(order, reason);
        result.superseded++;
    }

    std::vector<core::Order> launch_set;
    for (const auto& order : store_->listOrdersForRun(run_id)) {
        if (order.status == OrderStatus::NEW && order.submit_command.status == "superseded") {
            launch_set.push_back(order);
        }
    }
    if (launch_set.empty()) {
        return result;
    }

    result.triggered = true;
    result.reason = reason;
    if (result.superseded > 0) {
        store_->updateRun(run_id, [&](core::Run& row) {
            row.submission.superseded_orders += result.superseded;
            return true;
        });
        LOG_WARN("run {}: {} leader commands pending past {} ms, superseded", run_id, result.superseded,
                 options_.leader_pending_timeout_ms);
    }

    const auto fresh_run = store_->getRun(run_id);
    const auto launched = launchShortLived(*fresh_run, launch_set, "short_lived_fallback", reason);
    result.launched = launched.ok;
    result.pid = launched.pid;
    if (!launched.ok) {
        result.reason = launched.reason;
    }
    return result;
}

int SubmissionDispatcher::cancelActiveOrders(const std::vector<core::Order>& orders, const std::string& reason) {
    const long long now = clock_->nowMs();
    for (const auto& order : orders) {
        if (order.submit_command.pending && !order.submit_command.command_id.empty()) {
            bridge_->expireCommand(order.submit_command.command_id, now);
        }
    }

    const auto health = checkLeaderHealth();
    if (!health.healthy) {
        LOG_WARN("cancel: leader unavailable ({}), no cancel commands written", health.reason);
        return 0;
    }

    int written = 0;
    for (const auto& order : orders) {
        if (order.status != OrderStatus::SUBMITTED && order.status != OrderStatus::PARTIAL) {
            continue;
        }
        core::CancelCommand command;
        command.command_id = "cxl_" + std::to_string(order.id) + "_" + std::to_string(now);
        command.tag = order.client_order_id;
        command.broker_order_id = order.broker_order_id;
        command.reason = reason;
        command.created_at_ms = now;
        command.expires_at_ms = now + options_.command_expiry_ms;
        if (bridge_->writeCancelCommand(command)) {
            written++;
            journal(core::JournalEventType::COMMAND_WRITTEN, order.symbol, order.client_order_id,
                    {{"command_id", command.command_id}, {"type", "cancel_order"}, {"reason", reason}});
        } else {
            LOG_ERROR("cancel: failed to write cancel command for {}", order.client_order_id);
        }
    }
    return written;
}

DispatchResult SubmissionDispatcher::submitDirectOrder(const core::Order& order) {
    DispatchResult result;
    result.channel = SubmissionChannel::LEADER;

    const auto health = checkLeaderHealth();
    if (!health.healthy) {
        result.reason = "leader_channel_unavailable:" + health.reason;
        return result;
    }
    std::string command_id;
    if (!writeSubmitCommandFor(order, 0, "direct", command_id)) {
        result.reason = "command_write_failed";
        return result;
    }
    result.ok = true;
    result.commands_written = 1;
    result.message = "submitted_leader";
    return result;
}

CancelRequestResult SubmissionDispatcher::requestCancel(const core::Order& order, const std::string& actor) {
    CancelRequestResult result;
    if (core::execution::OrderLifecycleStateMachine::isTerminal(order.status)) {
        result.noop = true;
        result.reason = "order_terminal";
        return result;
    }
    const std::string& tag = order.client_order_id;
    if (tag.find_first_not_of(" \t") == std::string::npos) {
        throw std::invalid_argument("order_tag_missing");
    }
    if (order.cancel_request.status == "requested") {
        result.command_id = order.cancel_request.command_id;
        result.reason = "cancel_already_requested";
        return result;
    }

    const long long now = clock_->nowMs();
    const auto open_orders = bridge_->readOpenOrders();
    const bool tag_present = open_orders.present && !open_orders.stale && open_orders.findTag(tag) != nullptr;
    if (order.submit_command.pending && !order.submit_command.command_id.empty()) {
        bridge_->expireCommand(order.submit_command.command_id, now);
    }

    core::CancelCommand command;
    command.command_id = "cxl_" + std::to_string(order.id) + "_" + std::to_string(now);
    command.tag = tag;
    command.broker_order_id = order.broker_order_id;
    command.reason = "user_cancel";
    command.created_at_ms = now;
    command.expires_at_ms = now + options_.command_expiry_ms;
    if (!bridge_->writeCancelCommand(command)) {
        LOG_ERROR("cancel: failed to write cancel command for {}", tag);
        throw std::runtime_error("cancel_command_write_failed");
    }
    result.written = true;
    result.command_id = command.command_id;

    store_->updateOrder(order.id, [&](core::Order& row) {
        if (core::execution::OrderLifecycleStateMachine::isTerminal(row.status)) {
            return false;
        }
        row.cancel_request.command_id = command.command_id;
        row.cancel_request.actor = actor;
        row.cancel_request.tag = tag;
        row.cancel_request.status = "requested";
        row.cancel_request.result_status.clear();
        row.cancel_request.tag_present_in_open_orders = tag_present;
        row.cancel_request.requested_at_ms = now;
        row.cancel_request.completed_at_ms = 0;
        // an order not yet handed to the broker must not be dispatched later
        if (row.status == OrderStatus::NEW && row.submit_command.status != "launched") {
            row.submit_command.pending = false;
            row.submit_command.status = "withdrawn";
            row.submit_command.reason = "user_cancel";
            row.submit_command.processed_at_ms = now;
        }
        return true;
    });

    LOG_INFO("cancel: order {} cancel requested by {} ({}, {} in open orders)", tag, actor, command.command_id,
             tag_present ? "present" : "not");
    journal(core::JournalEventType::COMMAND_WRITTEN, order.symbol, tag,
            {{"command_id", command.command_id}, {"type", "cancel_order"}, {"reason", "user_cancel"},
             {"actor", actor}, {"tag_present", tag_present}});
    return result;
}

bool SubmissionDispatcher::withdrawSubmitCommand(const core::Order& order, const std::string& reason) {
    const long long now = clock_->nowMs();
    if (order.submit_command.pending && !order.submit_command.command_id.empty()) {
        bridge_->expireCommand(order.submit_command.command_id, now);
    }
    const auto updated = store_->updateOrder(order.id, [&](core::Order& row) {
        if (row.status != OrderStatus::NEW || row.submit_command.status == "launched" ||
            row.submit_command.status == "withdrawn") {
            return false;
        }
        row.submit_command.pending = false;
        row.submit_command.status = "withdrawn";
        row.submit_command.reason = reason;
        row.submit_command.processed_at_ms = now;
        return true;
    });
    if (updated && updated->submit_command.status == "withdrawn" && !order.submit_command.command_id.empty()) {
        journal(core::JournalEventType::COMMAND_SUPERSEDED, order.symbol, order.client_order_id,
                {{"command_id", order.submit_command.command_id}, {"reason", reason}});
    }
    return updated.has_value();
}

} // namespace execution
} // namespace rebalex
