#include "core/orchestration/TradeRunCoordinator.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>

#include "common/Logger.h"
#include "common/LotSizeHelper.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/execution/RunLifecycleStateMachine.h"
#include "execution/JobLock.h"
#include "execution/OrderIntentBuilder.h"
#include "execution/PriceResolver.h"

namespace rebalex {
namespace core {

using core::execution::OrderLifecycleStateMachine;
using core::execution::RunLifecycleStateMachine;

namespace {
bool liveConfirmed(const std::string& token) {
    return common::normalizeSymbol(token) == "LIVE";
}

risk::RiskOrderLine lineFor(const Order& order, double price) {
    risk::RiskOrderLine line;
    line.symbol = order.symbol;
    line.side = order.side;
    line.quantity = order.quantity;
    line.price = price;
    return line;
}

std::optional<double> latestQuotePrice(const QuotesSnapshot& quotes, const std::string& symbol) {
    const auto it = quotes.items.find(symbol);
    if (it == quotes.items.end()) {
        return std::nullopt;
    }
    for (const auto& candidate : {it->second.last, it->second.close, it->second.bid, it->second.ask}) {
        if (candidate && *candidate > 0.0) {
            return candidate;
        }
    }
    return std::nullopt;
}

RiskSnapshot snapshotFrom(const risk::RiskGateResult& result) {
    RiskSnapshot snapshot;
    snapshot.evaluated = true;
    snapshot.ok = result.allowed;
    snapshot.reasons = result.reasons;
    snapshot.total_notional = result.total_notional;
    snapshot.symbol_count = result.symbol_count;
    snapshot.guard_status = result.guard_status;
    snapshot.guard_reason = result.guard_reason;
    snapshot.bypassed = result.bypassed;
    snapshot.forced = result.forced;
    return snapshot;
}
} // namespace

TradeRunCoordinator::TradeRunCoordinator(
    std::shared_ptr<IExecutionStore> store,
    std::shared_ptr<IBrokerBridge> bridge,
    std::shared_ptr<risk::RiskGate> risk_gate,
    std::shared_ptr<rebalex::execution::SubmissionDispatcher> dispatcher,
    std::shared_ptr<rebalex::execution::ReconciliationEngine> reconciler,
    std::shared_ptr<IEventJournal> journal,
    std::shared_ptr<const IClock> clock,
    CoordinatorOptions options
) : store_(std::move(store)),
    bridge_(std::move(bridge)),
    risk_gate_(std::move(risk_gate)),
    dispatcher_(std::move(dispatcher)),
    reconciler_(std::move(reconciler)),
    journal_(std::move(journal)),
    clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
    options_(std::move(options)) {}

void TradeRunCoordinator::journal(
    JournalEventType type,
    const std::string& symbol,
    const std::string& entity_id,
    nlohmann::json payload
) {
    if (!journal_) {
        return;
    }
    JournalEvent event;
    event.ts_ms = clock_->nowMs();
    event.type = type;
    event.symbol = symbol;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("journal append failed for {}", entity_id);
    }
}

Run TradeRunCoordinator::requireRun(long long run_id) {
    auto run = store_->getRun(run_id);
    if (!run) {
        throw std::invalid_argument("run_not_found");
    }
    return *run;
}

rebalex::execution::ReconcileOptions TradeRunCoordinator::currentReconcileOptions() const {
    auto options = options_.reconcile;
    options.market_open = utils::TimeUtils::isMarketOpen(clock_->nowMs(), options_.market_session);
    return options;
}

bool TradeRunCoordinator::transitionRun(
    long long run_id,
    RunStatus to,
    const std::string& message,
    const IExecutionStore::RunMutator& extra
) {
    const long long now = clock_->nowMs();
    RunStatus from = RunStatus::QUEUED;
    bool moved = false;
    store_->updateRun(run_id, [&](Run& row) {
        from = row.status;
        if (row.status != to && !RunLifecycleStateMachine::canTransition(row.status, to)) {
            return false;
        }
        moved = row.status != to;
        row.status = to;
        row.message = message;
        if (to == RunStatus::RUNNING && row.started_at_ms == 0) {
            row.started_at_ms = now;
        }
        if (RunLifecycleStateMachine::isTerminal(to)) {
            row.ended_at_ms = now;
        }
        if (extra) {
            extra(row);
        }
        return true;
    });
    if (moved) {
        Logger::getInstance().logRunTransition(run_id, toString(from), toString(to), message);
        journal(JournalEventType::RUN_STATUS_CHANGED, std::string(), "run_" + std::to_string(run_id),
                {{"from", toString(from)}, {"to", toString(to)}, {"message", message}});
    }
    return moved;
}

Order TradeRunCoordinator::validateOrderRequest(const OrderRequest& request) const {
    Order order;
    order.client_order_id = request.client_order_id;
    order.symbol = common::normalizeSymbol(request.symbol);
    if (order.symbol.empty()) {
        throw std::invalid_argument("symbol_required");
    }
    const auto side = common::parseOrderSide(request.side);
    if (!side) {
        throw std::invalid_argument("side_invalid");
    }
    order.side = *side;
    const auto type = common::parseOrderType(request.order_type);
    if (!type) {
        throw std::invalid_argument("order_type_invalid");
    }
    order.order_type = *type;
    if (!(request.quantity > 0.0)) {
        throw std::invalid_argument("quantity_must_be_positive");
    }
    order.quantity = request.quantity;
    if (request.limit_price) {
        if (*request.limit_price <= 0.0) {
            throw std::invalid_argument("limit_price_invalid");
        }
        order.limit_price = request.limit_price;
    }
    if (order.order_type == OrderType::LMT && !order.limit_price) {
        throw std::invalid_argument("limit_price_required");
    }
    if (common::requiresPrimePrice(order.order_type) && order.limit_price) {
        order.prime_price = order.limit_price;
    }
    return order;
}

RunCreateResult TradeRunCoordinator::createRun(const RunCreateRequest& request) {
    const auto mode = common::parseTradingMode(request.mode);
    if (!mode) {
        throw std::invalid_argument("mode_invalid");
    }
    if (*mode == TradingMode::LIVE && !liveConfirmed(request.live_confirm_token)) {
        throw std::invalid_argument("live_confirm_required");
    }
    if (request.orders.empty() && request.target_weights.empty()) {
        throw std::invalid_argument("targets_or_orders_required");
    }
    for (const auto& [symbol, weight] : request.target_weights) {
        if (common::normalizeSymbol(symbol).empty() || weight < 0.0) {
            throw std::invalid_argument("target_weight_invalid");
        }
    }
    std::vector<Order> explicit_orders;
    for (const auto& order : request.orders) {
        explicit_orders.push_back(validateOrderRequest(order));
    }

    SizingConfig sizing = options_.default_sizing;
    if (request.portfolio_value) sizing.portfolio_value = request.portfolio_value;
    if (request.cash_available) sizing.cash_available = request.cash_available;
    if (request.order_type) {
        const auto type = common::parseOrderType(*request.order_type);
        if (!type) {
            throw std::invalid_argument("order_type_invalid");
        }
        sizing.order_type = *type;
    }

    std::lock_guard<std::mutex> lock(create_mutex_);
    if (!request.request_key.empty()) {
        for (const auto& existing : store_->listRuns()) {
            if (existing.project_id == request.project_id && existing.mode == *mode &&
                existing.request_key == request.request_key &&
                RunLifecycleStateMachine::isActive(existing.status)) {
                LOG_INFO("run {} reused for request key {}", existing.id, request.request_key);
                RunCreateResult reused;
                reused.run = existing;
                reused.reused = true;
                return reused;
            }
        }
    }

    Run run;
    run.project_id = request.project_id;
    run.mode = *mode;
    run.status = RunStatus::QUEUED;
    run.request_key = request.request_key;
    for (const auto& [symbol, weight] : request.target_weights) {
        run.target_weights[common::normalizeSymbol(symbol)] += weight;
    }
    run.sizing = sizing;
    run.bypass_risk = request.bypass_risk;
    run.deadline_ms = request.deadline_ms;
    run.message = "created";
    run = store_->createRun(run);
    journal(JournalEventType::RUN_CREATED, std::string(), "run_" + std::to_string(run.id),
            {{"project_id", run.project_id}, {"mode", toString(run.mode)},
             {"targets", run.target_weights.size()}, {"orders", explicit_orders.size()}});

    RunCreateResult result;
    int sequence = 1;
    for (auto order : explicit_orders) {
        order.run_id = run.id;
        if (order.client_order_id.empty()) {
            order.client_order_id = "mo_" + std::to_string(run.id) + "_" + std::to_string(sequence);
        }
        sequence++;
        try {
            const auto created = store_->createOrder(order);
            if (created.created) {
                result.orders_created++;
                journal(JournalEventType::ORDER_CREATED, created.order.symbol, created.order.client_order_id,
                        {{"run_id", run.id}, {"side", toString(created.order.side)},
                         {"quantity", created.order.quantity}});
            }
        } catch (const std::invalid_argument& e) {
            transitionRun(run.id, RunStatus::FAILED, e.what(), [&](Run& row) {
                row.failure_code = e.what();
                return true;
            });
            throw;
        }
    }

    result.run = requireRun(run.id);
    LOG_INFO("run {} created (project {}, {}, {} orders)", run.id, run.project_id, toString(run.mode),
             result.orders_created);
    return result;
}

void TradeRunCoordinator::finishRun(
    long long run_id,
    RunStatus to,
    const std::string& message,
    const std::string& failure_code,
    ExecuteResult& result
) {
    transitionRun(run_id, to, message, [&](Run& row) {
        if (!failure_code.empty()) {
            row.failure_code = failure_code;
        }
        return true;
    });
    result.status = to;
    result.message = message;
}

ExecuteResult TradeRunCoordinator::executeRun(long long run_id, const ExecuteOptions& options) {
    const Run run = requireRun(run_id);
    if (run.mode == TradingMode::LIVE && !liveConfirmed(options.live_confirm_token)) {
        throw std::invalid_argument("live_confirm_required");
    }
    const bool executable = run.status == RunStatus::QUEUED || (run.status == RunStatus::BLOCKED && options.force);
    if (!executable) {
        throw std::runtime_error("run_not_executable:" + toString(run.status));
    }

    ExecuteResult result;
    result.run_id = run_id;
    result.status = run.status;
    result.dry_run = options.dry_run;

    rebalex::execution::JobLock lock(rebalex::execution::SubmissionDispatcher::kJobLockName, options_.lock_dir);
    if (!lock.tryAcquire()) {
        result.message = "trade_execution_lock_busy";
        LOG_WARN("run {}: {}", run_id, result.message);
        return result;
    }

    try {
        return executeLocked(run, options);
    } catch (const std::exception& e) {
        LOG_ERROR("run {} execution failed: {}", run_id, e.what());
        const std::string code = e.what();
        const auto orders = store_->listOrdersForRun(run_id);
        for (const auto& order : orders) {
            // a launched order may still reach the broker; everything else never left
            if (order.status != OrderStatus::NEW || order.submit_command.pending ||
                order.submit_command.status == "launched") {
                continue;
            }
            store_->updateOrder(order.id, [&](Order& row) {
                if (row.status != OrderStatus::NEW || row.submit_command.pending ||
                    row.submit_command.status == "launched") {
                    return false;
                }
                row.status = OrderStatus::REJECTED;
                row.rejected_reason = "execution_error:" + code;
                return true;
            });
        }
        finishRun(run_id, RunStatus::FAILED, "execution_error:" + code, code, result);
        return result;
    }
}

ExecuteResult TradeRunCoordinator::executeLocked(const Run& run, const ExecuteOptions& options) {
    ExecuteResult result;
    result.run_id = run.id;
    result.status = run.status;
    result.dry_run = options.dry_run;
    const long long now = clock_->nowMs();

    auto block = [&](const std::string& message) {
        if (options.dry_run) {
            result.message = "dry_run_blocked:" + message;
            store_->updateRun(run.id, [&](Run& row) {
                row.message = result.message;
                return true;
            });
            return result;
        }
        finishRun(run.id, RunStatus::BLOCKED, message, std::string(), result);
        return result;
    };

    if (!bridge_->reachable()) {
        return block("bridge_unreachable");
    }

    const auto holdings = bridge_->readHoldings();
    auto orders = store_->listOrdersForRun(run.id);
    const bool from_targets = orders.empty();
    if (from_targets && run.target_weights.empty()) {
        return block("targets_or_orders_required");
    }
    if (from_targets && (!holdings.present || holdings.stale)) {
        return block("holdings_unavailable");
    }

    std::set<std::string> symbols;
    for (const auto& [symbol, weight] : run.target_weights) symbols.insert(symbol);
    for (const auto& [symbol, item] : holdings.items) symbols.insert(symbol);
    for (const auto& order : orders) symbols.insert(order.symbol);
    const rebalex::execution::PriceResolver resolver(
        bridge_->readQuotes(),
        bridge_->readHistoricalCloses(std::vector<std::string>(symbols.begin(), symbols.end())),
        now,
        options_.quote_stale_ms);

    std::vector<risk::RiskOrderLine> lines;
    std::vector<Order> planned;
    if (from_targets) {
        rebalex::execution::IntentBuildInput input;
        input.run_id = run.id;
        input.target_weights = run.target_weights;
        input.holdings = holdings.items;
        input.sizing = run.sizing;
        input.notional_limits_configured = risk_gate_->limits().notionalLimitsConfigured();
        const double investable = run.sizing.portfolio_value.value_or(0.0) *
                                  (1.0 - std::clamp(run.sizing.cash_buffer_ratio, 0.0, 1.0));
        for (const auto& symbol : symbols) {
            const auto price = resolver.referencePrice(symbol);
            if (!price) {
                continue;
            }
            input.prices[symbol] = price->price;
            const auto weight = run.target_weights.find(symbol);
            const double target_value = weight == run.target_weights.end() ? 0.0 : weight->second * investable;
            const OrderSide side = target_value > holdings.quantityOf(symbol) * price->price
                ? OrderSide::BUY : OrderSide::SELL;
            const auto limit = resolver.limitPrice(symbol, side);
            if (limit) {
                input.limit_prices[symbol] = limit->price;
            }
        }

        rebalex::execution::IntentBuildResult built;
        try {
            built = rebalex::execution::OrderIntentBuilder::build(input);
        } catch (const rebalex::execution::IntentBuildError& e) {
            switch (e.code()) {
                case rebalex::execution::IntentBuildErrorCode::ORDERS_EMPTY:
                    if (options.dry_run) {
                        result.message = "dry_run_noop";
                        return result;
                    }
                    transitionRun(run.id, RunStatus::RUNNING, "executing");
                    finishRun(run.id, RunStatus::DONE, "orders_empty_noop", std::string(), result);
                    return result;
                case rebalex::execution::IntentBuildErrorCode::PORTFOLIO_VALUE_REQUIRED:
                case rebalex::execution::IntentBuildErrorCode::PRICE_MISSING:
                    return block(e.what());
            }
            throw;
        }
        result.missing_prices = built.missing_prices;
        for (const auto& intent : built.intents) {
            Order order;
            order.run_id = run.id;
            order.client_order_id = intent.intent_id;
            order.symbol = intent.symbol;
            order.side = intent.side;
            order.quantity = intent.quantity;
            order.order_type = intent.order_type;
            order.limit_price = intent.limit_price;
            order.prime_price = intent.prime_price;
            lines.push_back(lineFor(order, intent.reference_price));
            planned.push_back(order);
        }
    } else {
        const bool notional_limits = risk_gate_->limits().notionalLimitsConfigured();
        for (const auto& order : orders) {
            double price = order.limit_price.value_or(0.0);
            if (price <= 0.0) {
                const auto resolved = resolver.referencePrice(order.symbol);
                price = resolved ? resolved->price : 0.0;
            }
            if (price <= 0.0) {
                result.missing_prices.push_back(order.symbol);
                if (notional_limits) {
                    LOG_WARN("run {}: no price for {}, notional limits cannot be checked", run.id, order.symbol);
                    return block("price_missing:" + order.symbol);
                }
            }
            lines.push_back(lineFor(order, price));
        }
    }

    risk::RiskGateInput risk_input;
    risk_input.project_id = run.project_id;
    risk_input.mode = run.mode;
    risk_input.orders = lines;
    for (const auto& [symbol, item] : holdings.items) {
        risk_input.held_quantity[symbol] = item.quantity;
    }
    risk_input.portfolio_value = run.sizing.portfolio_value;
    risk_input.cash_available = run.sizing.cash_available;
    risk_input.bypass_limits = run.bypass_risk;
    risk_input.force_guard = options.force;
    const auto risk = risk_gate_->evaluate(risk_input);
    result.risk_reasons = risk.reasons;
    result.orders_total = static_cast<int>(from_targets ? planned.size() : orders.size());

    store_->updateRun(run.id, [&](Run& row) {
        row.risk = snapshotFrom(risk);
        return true;
    });
    if (!risk.allowed) {
        LOG_WARN("run {} risk blocked: {}", run.id, risk.firstReason());
        return block("risk_blocked:" + risk.firstReason());
    }

    if (options.dry_run) {
        result.message = "dry_run_ok";
        store_->updateRun(run.id, [&](Run& row) {
            row.message = result.message;
            return true;
        });
        return result;
    }

    for (const auto& order : planned) {
        const auto created = store_->createOrder(order);
        if (created.created) {
            journal(JournalEventType::ORDER_CREATED, created.order.symbol, created.order.client_order_id,
                    {{"run_id", run.id}, {"side", toString(created.order.side)},
                     {"quantity", created.order.quantity}});
        }
    }

    transitionRun(run.id, RunStatus::RUNNING, "executing", [&](Run& row) {
        row.last_progress_at_ms = now;
        row.stalled_at_ms = 0;
        row.stalled_reason.clear();
        return true;
    });

    const Run running = requireRun(run.id);
    const auto dispatched = dispatcher_->submitRun(running, holdings);
    result.channel = dispatched.channel;
    if (!dispatched.ok) {
        throw std::runtime_error(dispatched.reason.empty() ? "submission_failed" : dispatched.reason);
    }

    store_->updateRun(run.id, [&](Run& row) {
        row.message = dispatched.message;
        row.last_progress_at_ms = clock_->nowMs();
        return true;
    });
    LOG_INFO("run {} {} ({} commands, {} launched)", run.id, dispatched.message, dispatched.commands_written,
             dispatched.orders_launched);

    const Run after = requireRun(run.id);
    result.status = after.status;
    result.message = after.message;
    result.completion = RunLifecycleStateMachine::summarize(store_->listOrdersForRun(run.id));
    return result;
}

RunStatusView TradeRunCoordinator::getRunStatus(long long run_id) {
    requireRun(run_id);
    reconciler_->reconcileRun(run_id, currentReconcileOptions());
    RunStatusView view;
    view.run = requireRun(run_id);
    view.orders = store_->listOrdersForRun(run_id);
    return view;
}

rebalex::execution::ReconcileReport TradeRunCoordinator::refreshRun(long long run_id) {
    return reconciler_->reconcileRun(run_id, currentReconcileOptions());
}

Run TradeRunCoordinator::resumeRun(long long run_id, const std::string& reason) {
    const Run run = requireRun(run_id);
    if (run.status != RunStatus::STALLED) {
        throw std::runtime_error("run_not_stalled");
    }
    const long long now = clock_->nowMs();
    transitionRun(run_id, RunStatus::RUNNING, "manual_resume", [&](Run& row) {
        row.stalled_at_ms = 0;
        row.stalled_reason.clear();
        row.last_progress_at_ms = now;
        row.extras["resume_reason"] = reason;
        return true;
    });
    return requireRun(run_id);
}

Run TradeRunCoordinator::terminateRun(long long run_id, const std::string& reason) {
    const Run run = requireRun(run_id);
    if (RunLifecycleStateMachine::isTerminal(run.status)) {
        throw std::runtime_error("run_already_completed");
    }
    const long long now = clock_->nowMs();
    const std::string why = reason.empty() ? std::string("manual_terminate") : reason;

    std::vector<Order> live;
    for (const auto& order : store_->listOrdersForRun(run_id)) {
        if (!OrderLifecycleStateMachine::isTerminal(order.status)) {
            live.push_back(order);
        }
    }
    const int cancels = dispatcher_->cancelActiveOrders(live, why);

    for (const auto& order : live) {
        const auto updated = store_->updateOrder(order.id, [&](Order& row) {
            if (OrderLifecycleStateMachine::isTerminal(row.status)) {
                return false;
            }
            const OrderStatus from = row.status;
            const bool never_submitted = row.status == OrderStatus::NEW && row.broker_order_id.empty() &&
                                         row.filled_quantity <= 0.0;
            row.status = never_submitted ? OrderStatus::REJECTED : OrderStatus::CANCELED;
            if (never_submitted) {
                row.rejected_reason = "terminated:" + why;
            }
            row.submit_command.pending = false;
            row.low_confidence = false;
            row.low_confidence_reason.clear();
            row.provenance = {{"sync_reason", "manual_terminate"}, {"from", toString(from)}, {"at_ms", now}};
            return true;
        });
        if (updated) {
            journal(JournalEventType::ORDER_STATUS_CHANGED, updated->symbol, updated->client_order_id,
                    {{"from", toString(order.status)}, {"to", toString(updated->status)},
                     {"provenance", updated->provenance}});
        }
    }

    const auto summary = RunLifecycleStateMachine::summarize(store_->listOrdersForRun(run_id));
    transitionRun(run_id, RunStatus::CANCELED, "manual_terminate", [&](Run& row) {
        row.completion = summary;
        row.failure_code = why;
        row.stalled_at_ms = 0;
        row.stalled_reason.clear();
        row.extras["terminate_reason"] = why;
        row.extras["cancel_commands"] = cancels;
        return true;
    });

    // terminal run: the pass only advances process cleanup
    reconciler_->reconcileRun(run_id, currentReconcileOptions());
    return requireRun(run_id);
}

DirectOrderResult TradeRunCoordinator::createDirectOrder(const OrderRequest& request) {
    Order order = validateOrderRequest(request);
    if (order.client_order_id.empty()) {
        throw std::invalid_argument("client_order_id_required");
    }

    DirectOrderResult result;
    const auto created = store_->createOrder(order);
    result.order = created.order;
    result.created = created.created;
    if (created.created) {
        journal(JournalEventType::ORDER_CREATED, created.order.symbol, created.order.client_order_id,
                {{"side", toString(created.order.side)}, {"quantity", created.order.quantity}});
    }
    if (created.order.status != OrderStatus::NEW || !created.order.submit_command.status.empty()) {
        result.reason = "already_dispatched";
        return result;
    }

    const auto dispatched = dispatcher_->submitDirectOrder(created.order);
    result.submitted = dispatched.ok;
    result.reason = dispatched.reason;
    if (!dispatched.ok) {
        LOG_WARN("direct order {} not submitted: {}", created.order.client_order_id, dispatched.reason);
        store_->updateOrder(created.order.id, [&](Order& row) {
            if (row.status != OrderStatus::NEW) {
                return false;
            }
            row.status = OrderStatus::REJECTED;
            row.rejected_reason = dispatched.reason;
            return true;
        });
    }
    const auto fresh = store_->getOrder(created.order.id);
    if (fresh) {
        result.order = *fresh;
    }
    return result;
}

CancelOrderResult TradeRunCoordinator::cancelOrder(const std::string& order_ref, const std::string& actor) {
    std::optional<Order> order = store_->findOrderByClientId(order_ref);
    const bool numeric = !order_ref.empty() && order_ref.size() < 19 &&
        std::all_of(order_ref.begin(), order_ref.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!order && numeric) {
        order = store_->getOrder(std::stoll(order_ref));
    }
    if (!order) {
        throw std::invalid_argument("order_not_found");
    }

    const auto requested = dispatcher_->requestCancel(*order, actor.empty() ? "system" : actor);
    CancelOrderResult result;
    result.noop = requested.noop;
    result.command_id = requested.command_id;
    result.reason = requested.reason;
    const auto fresh = store_->getOrder(order->id);
    result.order = fresh ? *fresh : *order;
    return result;
}

std::vector<Order> TradeRunCoordinator::stuckOrders(long long now_ms) {
    const long long cutoff = now_ms - std::max(options_.auto_recovery.new_timeout_ms, 0LL);
    std::vector<Order> out;
    auto consider = [&](const Order& order, bool free_standing) {
        if (order.status != OrderStatus::NEW || order.filled_quantity > 0.0 || order.created_at_ms > cutoff) {
            return;
        }
        if (order.cancel_request.status == "requested" || !order.auto_recovery.replacement_order_id.empty()) {
            return;
        }
        // launched orders and run commands past their timeout belong to the fallback path
        const auto& submit = order.submit_command;
        if (submit.status == "launched") {
            return;
        }
        if (!free_standing && (submit.pending || submit.status == "superseded")) {
            return;
        }
        out.push_back(order);
    };

    for (const auto& order : store_->listFreeOrders()) {
        consider(order, true);
    }
    for (const auto& run : store_->listRuns()) {
        if (run.status != RunStatus::RUNNING && run.status != RunStatus::STALLED) {
            continue;
        }
        for (const auto& order : store_->listOrdersForRun(run.id)) {
            consider(order, false);
        }
    }
    std::sort(out.begin(), out.end(), [](const Order& a, const Order& b) {
        return a.created_at_ms < b.created_at_ms;
    });
    return out;
}

void TradeRunCoordinator::noteRecovery(
    const Order& order,
    const std::string& action,
    const std::string& reason,
    long long now_ms
) {
    store_->updateOrder(order.id, [&](Order& row) {
        if (row.auto_recovery.last_action == action && row.auto_recovery.last_reason == reason) {
            return false;
        }
        row.auto_recovery.last_action = action;
        row.auto_recovery.last_reason = reason;
        row.auto_recovery.last_at_ms = now_ms;
        return true;
    });
    LOG_INFO("auto recovery {}: {} ({})", order.client_order_id, action, reason);
}

AutoRecoveryReport TradeRunCoordinator::recoverStuckOrders() {
    AutoRecoveryReport report;
    const auto& cfg = options_.auto_recovery;
    const long long now = clock_->nowMs();

    const auto candidates = stuckOrders(now);
    if (candidates.empty()) {
        return report;
    }

    rebalex::execution::JobLock lock(rebalex::execution::SubmissionDispatcher::kJobLockName, options_.lock_dir);
    if (!lock.tryAcquire()) {
        report.reason = "trade_execution_lock_busy";
        LOG_WARN("auto recovery skipped: {}", report.reason);
        return report;
    }

    // the stuck commands themselves count as backlog
    const auto health = dispatcher_->checkLeaderHealth(false);
    const auto quotes = bridge_->readQuotes();
    const bool quotes_stale =
        !rebalex::execution::PriceResolver(quotes, {}, now, options_.quote_stale_ms).quotesUsable();
    std::set<long long> runs_to_submit;
    std::vector<Order> free_replacements;

    for (const auto& order : candidates) {
        report.scanned++;
        if (order.auto_recovery.attempts >= cfg.max_auto_retries) {
            noteRecovery(order, "stop", "max_retries", now);
            report.skipped++;
            continue;
        }
        if (order.run_id) {
            const auto run = store_->getRun(*order.run_id);
            if (run && risk_gate_->guardState(run->project_id, run->mode).halted()) {
                noteRecovery(order, "stop", "guard_halted", now);
                report.skipped++;
                continue;
            }
        }
        if (!health.healthy) {
            noteRecovery(order, "stop", "leader_unreachable", now);
            report.skipped++;
            continue;
        }

        dispatcher_->withdrawSubmitCommand(order, "auto_recovery_cancel");
        bool cancelled = false;
        store_->updateOrder(order.id, [&](Order& row) {
            if (row.status != OrderStatus::NEW || row.filled_quantity > 0.0) {
                return false;
            }
            row.status = OrderStatus::CANCELED;
            row.provenance["sync_reason"] = "auto_recovery_cancel";
            row.provenance["confirmed_at_ms"] = now;
            row.auto_recovery.last_action = "cancel";
            row.auto_recovery.last_reason = "new_timeout";
            row.auto_recovery.last_at_ms = now;
            cancelled = true;
            return true;
        });
        if (!cancelled) {
            report.failed++;
            continue;
        }
        report.cancelled++;
        journal(JournalEventType::ORDER_STATUS_CHANGED, order.symbol, order.client_order_id,
                {{"from", toString(OrderStatus::NEW)}, {"to", toString(OrderStatus::CANCELED)},
                 {"reason", "auto_recovery_cancel"}});

        if (quotes_stale && !cfg.allow_replace_outside_rth) {
            noteRecovery(order, "cancel", "outside_rth", now);
            report.skipped++;
            continue;
        }
        if (order.order_type == OrderType::LMT && order.limit_price && cfg.max_price_deviation_pct > 0.0) {
            const auto price = latestQuotePrice(quotes, order.symbol);
            if (!price) {
                noteRecovery(order, "cancel", "price_missing", now);
                report.skipped++;
                continue;
            }
            const double deviation_pct = std::fabs(*price - *order.limit_price) / *order.limit_price * 100.0;
            if (deviation_pct > cfg.max_price_deviation_pct) {
                noteRecovery(order, "cancel", "price_deviation", now);
                report.skipped++;
                continue;
            }
        }

        const int attempt = order.auto_recovery.attempts + 1;
        std::string client_id = order.client_order_id + "-r" + std::to_string(attempt);
        if (store_->findOrderByClientId(client_id)) {
            client_id += "-" + std::to_string(now / 1000);
        }

        Order replacement;
        replacement.run_id = order.run_id;
        replacement.client_order_id = client_id;
        replacement.symbol = order.symbol;
        replacement.side = order.side;
        replacement.quantity = order.quantity;
        replacement.order_type = order.order_type;
        replacement.limit_price = order.limit_price;
        replacement.prime_price = order.prime_price;
        replacement.auto_recovery.attempts = attempt;
        replacement.auto_recovery.origin_order_id = order.auto_recovery.origin_order_id > 0
            ? order.auto_recovery.origin_order_id : order.id;
        replacement.auto_recovery.origin_client_order_id = order.auto_recovery.origin_client_order_id.empty()
            ? order.client_order_id : order.auto_recovery.origin_client_order_id;
        replacement.auto_recovery.triggered_at_ms = now;

        OrderCreateResult created;
        try {
            created = store_->createOrder(replacement);
        } catch (const std::exception& e) {
            LOG_ERROR("auto recovery replacement for {} failed: {}", order.client_order_id, e.what());
            noteRecovery(order, "replace", "replace_failed", now);
            report.failed++;
            continue;
        }
        store_->updateOrder(order.id, [&](Order& row) {
            row.auto_recovery.last_action = "replace";
            row.auto_recovery.last_reason = "new_timeout";
            row.auto_recovery.last_at_ms = now;
            row.auto_recovery.replacement_order_id = created.order.client_order_id;
            return true;
        });
        journal(JournalEventType::ORDER_CREATED, created.order.symbol, created.order.client_order_id,
                {{"side", toString(created.order.side)}, {"quantity", created.order.quantity},
                 {"origin_client_order_id", replacement.auto_recovery.origin_client_order_id},
                 {"attempts", attempt}});
        report.replaced++;

        if (created.order.run_id) {
            runs_to_submit.insert(*created.order.run_id);
        } else {
            free_replacements.push_back(created.order);
        }
    }

    // submitted once every withdrawn command has left the queue
    for (const auto& replacement : free_replacements) {
        const auto dispatched = dispatcher_->submitDirectOrder(replacement);
        if (dispatched.ok) {
            continue;
        }
        LOG_WARN("replacement {} not submitted: {}", replacement.client_order_id, dispatched.reason);
        store_->updateOrder(replacement.id, [&](Order& row) {
            if (row.status != OrderStatus::NEW) {
                return false;
            }
            row.status = OrderStatus::REJECTED;
            row.rejected_reason = dispatched.reason;
            return true;
        });
    }

    if (!runs_to_submit.empty()) {
        const auto holdings = bridge_->readHoldings();
        for (const long long run_id : runs_to_submit) {
            const auto run = store_->getRun(run_id);
            if (!run) {
                continue;
            }
            const auto dispatched = dispatcher_->submitRun(*run, holdings);
            if (!dispatched.ok) {
                LOG_WARN("run {} replacement submission failed: {}", run_id, dispatched.reason);
            }
        }
    }

    LOG_INFO("auto recovery: scanned={} cancelled={} replaced={} skipped={} failed={}",
             report.scanned, report.cancelled, report.replaced, report.skipped, report.failed);
    return report;
}

std::vector<SymbolSummary> TradeRunCoordinator::symbolSummary(long long run_id) {
    const Run run = requireRun(run_id);
    const auto orders = store_->listOrdersForRun(run_id);
    const auto holdings = bridge_->readHoldings();

    std::map<std::string, SymbolSummary> by_symbol;
    for (const auto& [symbol, weight] : run.target_weights) {
        by_symbol[symbol].symbol = symbol;
        by_symbol[symbol].target_weight = weight;
    }

    std::map<std::string, long long> latest_order;
    std::map<std::string, double> gross_filled;
    std::map<std::string, double> fill_notional;
    for (const auto& order : orders) {
        auto& summary = by_symbol[order.symbol];
        summary.symbol = order.symbol;
        summary.requested_quantity += common::signedQuantity(order.side, order.quantity);
        summary.filled_quantity += common::signedQuantity(order.side, order.filled_quantity);
        gross_filled[order.symbol] += order.filled_quantity;
        fill_notional[order.symbol] += order.filled_quantity * order.avg_fill_price;
        if (order.id >= latest_order[order.symbol]) {
            latest_order[order.symbol] = order.id;
            summary.last_status = order.status;
        }
    }
    for (const auto& [symbol, filled] : gross_filled) {
        if (filled > 0.0) {
            by_symbol[symbol].avg_fill_price = fill_notional[symbol] / filled;
        }
    }

    std::vector<SymbolSummary> out;
    for (auto& [symbol, summary] : by_symbol) {
        if (holdings.present) {
            summary.current_holding = holdings.quantityOf(symbol);
        }
        out.push_back(summary);
    }
    return out;
}

int TradeRunCoordinator::reconcileActiveRuns() {
    const auto options = currentReconcileOptions();
    int changed = 0;
    for (const auto& run : store_->listRuns()) {
        const bool active = run.status == RunStatus::RUNNING || run.status == RunStatus::STALLED;
        if (!active && !reconciler_->needsFollowUp(run, options)) {
            continue;
        }
        try {
            if (reconciler_->reconcileRun(run.id, options).changed()) {
                changed++;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("reconcile run {} failed: {}", run.id, e.what());
        }
    }
    try {
        reconciler_->reconcileFreeOrders(options);
    } catch (const std::exception& e) {
        LOG_ERROR("reconcile free orders failed: {}", e.what());
    }
    return changed;
}

} // namespace core
} // namespace rebalex
