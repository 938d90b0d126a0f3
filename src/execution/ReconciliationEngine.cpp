#include "execution/ReconciliationEngine.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

#include "common/Digest.h"
#include "common/Logger.h"
#include "common/LotSizeHelper.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/execution/RunLifecycleStateMachine.h"

namespace rebalex {
namespace execution {

using core::execution::OrderLifecycleStateMachine;
using core::execution::RunLifecycleStateMachine;

namespace {
constexpr const char* kMissingFromOpenOrders = "missing_from_open_orders";
constexpr const char* kWarmupRejectReason = "OrderRequest.Submit blocked during warmup/initialize";

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return lowerCopy(haystack).find(lowerCopy(needle)) != std::string::npos;
}

std::string formatQuantity(double quantity) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << quantity;
    return oss.str();
}

double toleranceFor(const core::Order& order) {
    return kQuantityTolerance * std::max(1.0, order.quantity);
}

bool hasEvent(const core::Order& order, const std::string& event_id) {
    return std::find(order.applied_event_ids.begin(), order.applied_event_ids.end(), event_id) !=
           order.applied_event_ids.end();
}

// Moves the row to `to` when the lifecycle allows it. Returns true when the
// row changed.
bool applyStatus(core::Order& row, OrderStatus to, const std::string& sync_reason,
                 bool low_confidence, long long now_ms, long long window_ms) {
    if (row.status == to) {
        if (row.low_confidence && !low_confidence) {
            row.low_confidence = false;
            row.low_confidence_reason.clear();
            row.provenance["sync_reason"] = sync_reason;
            row.provenance["confirmed_at_ms"] = now_ms;
            return true;
        }
        return false;
    }
    if (!OrderLifecycleStateMachine::canApply(row, to, now_ms, window_ms)) {
        return false;
    }
    const OrderStatus from = row.status;
    row.status = to;
    row.low_confidence = low_confidence;
    row.low_confidence_reason = low_confidence ? sync_reason : std::string();
    row.low_confidence_at_ms = low_confidence ? now_ms : 0;
    row.provenance = {{"sync_reason", sync_reason}, {"from", toString(from)}, {"at_ms", now_ms}};
    if (!low_confidence) {
        row.last_progress_at_ms = now_ms;
    }
    return true;
}

// Diagnostic override: bypasses the forward-only table.
void forceStatus(core::Order& row, OrderStatus to, const std::string& reason, long long now_ms) {
    const OrderStatus from = row.status;
    row.status = to;
    row.low_confidence = false;
    row.low_confidence_reason.clear();
    row.last_progress_at_ms = now_ms;
    row.submit_command.pending = false;
    if (to == OrderStatus::REJECTED) {
        row.rejected_reason = reason;
    }
    row.provenance = {{"sync_reason", "forced:" + reason}, {"from", toString(from)}, {"at_ms", now_ms}};
}

OrderStatus normalizeFillTarget(OrderStatus target, double filled, double quantity) {
    if (OrderLifecycleStateMachine::isFullyFilled(filled, quantity)) {
        return OrderStatus::FILLED;
    }
    if (target == OrderStatus::FILLED || target == OrderStatus::SUBMITTED || target == OrderStatus::NEW) {
        return filled > 0.0 ? OrderStatus::PARTIAL : OrderStatus::SUBMITTED;
    }
    return target;
}

void clearPending(core::Order& row, const std::string& status, long long now_ms) {
    if (row.submit_command.pending) {
        row.submit_command.pending = false;
        row.submit_command.status = status;
        row.submit_command.processed_at_ms = now_ms;
    }
}

bool isAcceptedResult(const std::string& status) {
    return status == "submitted" || status == "ok" || status == "accepted" ||
           status == "placed" || status == "presubmitted";
}

bool isFailedResult(const std::string& status) {
    return status == "rejected" || status == "parse_error" || status == "connect_failed" ||
           status == "error" || status == "failed" || status == "expired";
}
} // namespace

ReconciliationEngine::ReconciliationEngine(
    std::shared_ptr<core::IExecutionStore> store,
    std::shared_ptr<core::IBrokerBridge> bridge,
    std::shared_ptr<SubmissionDispatcher> dispatcher,
    std::shared_ptr<ProcessLifecycleManager> processes,
    std::shared_ptr<core::IEventJournal> journal,
    std::shared_ptr<const IClock> clock
) : store_(std::move(store)),
    bridge_(std::move(bridge)),
    dispatcher_(std::move(dispatcher)),
    processes_(std::move(processes)),
    journal_(std::move(journal)),
    clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {}

std::string ReconciliationEngine::fillToken(long long order_id, const std::string& source, const std::string& watermark) {
    return utils::Digest::sha256Hex(std::to_string(order_id) + "|" + source + "|" + watermark);
}

std::string ReconciliationEngine::detectSessionFault(
    const std::vector<std::string>& lines,
    std::vector<std::string>& affected_symbols
) {
    std::string code;
    for (const auto& line : lines) {
        if (containsIgnoreCase(line, "not allowed in Initialize or during warm up") ||
            containsIgnoreCase(line, "during warm up")) {
            affected_symbols.clear();
            return "submit_during_warmup";
        }
        if (code.empty() && line.find("TARGETS_ALREADY_HELD") != std::string::npos) {
            code = "targets_already_held";
            const auto pos = line.find("symbols=");
            if (pos != std::string::npos) {
                std::string list = line.substr(pos + 8);
                const auto space = list.find_first_of(" \t");
                if (space != std::string::npos) {
                    list = list.substr(0, space);
                }
                std::stringstream ss(list);
                std::string symbol;
                while (std::getline(ss, symbol, ',')) {
                    symbol = common::normalizeSymbol(symbol);
                    if (!symbol.empty()) {
                        affected_symbols.push_back(symbol);
                    }
                }
            }
        }
    }
    return code;
}

void ReconciliationEngine::journal(
    core::JournalEventType type,
    const std::string& symbol,
    const std::string& entity_id,
    nlohmann::json payload,
    long long now_ms
) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = now_ms;
    event.type = type;
    event.symbol = symbol;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("journal append failed for {}", entity_id);
    }
}

double ReconciliationEngine::lastKnownPrice(const core::Order& order) {
    if (order.avg_fill_price > 0.0) return order.avg_fill_price;
    if (order.limit_price && *order.limit_price > 0.0) return *order.limit_price;
    if (order.prime_price && *order.prime_price > 0.0) return *order.prime_price;
    return 0.0;
}

bool ReconciliationEngine::isHighConfidenceTerminal(const core::Order& order, const PassContext& ctx) const {
    return OrderLifecycleStateMachine::isTerminal(order.status) &&
           !OrderLifecycleStateMachine::isRecoverableLowConfidence(
               order, ctx.now_ms, ctx.options.low_confidence_recovery_window_ms);
}

void ReconciliationEngine::refresh(std::vector<core::Order>& orders, const core::Order& updated) {
    for (auto& order : orders) {
        if (order.id == updated.id) {
            order = updated;
            return;
        }
    }
}

bool ReconciliationEngine::updateOrderTracked(
    const core::Order& before,
    const core::IExecutionStore::OrderMutator& mutator,
    std::vector<core::Order>& orders,
    PassContext& ctx
) {
    bool changed = false;
    const auto updated = store_->updateOrder(before.id, [&](core::Order& row) {
        changed = mutator(row);
        return changed;
    });
    if (!changed || !updated) {
        return false;
    }
    refresh(orders, *updated);
    if (updated->status != before.status) {
        LOG_INFO("order {} {} -> {} ({})", updated->client_order_id, toString(before.status),
                 toString(updated->status), updated->provenance.value("sync_reason", std::string()));
        journal(core::JournalEventType::ORDER_STATUS_CHANGED, updated->symbol, updated->client_order_id,
                {{"from", toString(before.status)}, {"to", toString(updated->status)},
                 {"low_confidence", updated->low_confidence}, {"provenance", updated->provenance}},
                ctx.now_ms);
    }
    return true;
}

bool ReconciliationEngine::recordFill(
    const core::Order& order,
    double new_filled_total,
    double price,
    double commission,
    const std::string& source,
    const std::string& watermark,
    OrderStatus target,
    const std::string& broker_order_id,
    const std::string& event_id,
    std::vector<core::Order>& orders,
    PassContext& ctx
) {
    const double previous = order.filled_quantity;
    const double increment = new_filled_total - previous;
    if (increment <= toleranceFor(order)) {
        return false;
    }

    core::Fill fill;
    fill.order_id = order.id;
    fill.quantity = increment;
    fill.price = price;
    fill.commission = commission;
    fill.fill_time_ms = ctx.now_ms;
    fill.source = source;
    fill.exec_token = fillToken(order.id, source, watermark);

    const long long now = ctx.now_ms;
    const long long window = ctx.options.low_confidence_recovery_window_ms;
    const auto result = store_->applyFill(fill, [&](core::Order& row) {
        // Another pass moved the row; its own evidence is already applied.
        if (std::fabs(row.filled_quantity - previous) > toleranceFor(row)) {
            return false;
        }
        if (!event_id.empty()) {
            if (hasEvent(row, event_id)) {
                return false;
            }
            row.applied_event_ids.push_back(event_id);
        }
        if (price > 0.0) {
            row.avg_fill_price = (row.avg_fill_price * previous + price * increment) / new_filled_total;
        }
        row.filled_quantity = new_filled_total;
        applyStatus(row, normalizeFillTarget(target, new_filled_total, row.quantity), source, false, now, window);
        row.last_progress_at_ms = now;
        if (!broker_order_id.empty() && row.broker_order_id.empty()) {
            row.broker_order_id = broker_order_id;
        }
        clearPending(row, "submitted", now);
        return true;
    });

    if (!result.applied || !result.order) {
        return false;
    }
    ctx.report.fills_recorded++;
    refresh(orders, *result.order);
    LOG_INFO("order {} fill +{} @ {} via {} (filled {}/{})", order.client_order_id, increment, price, source,
             new_filled_total, order.quantity);
    journal(core::JournalEventType::FILL_APPLIED, order.symbol, order.client_order_id,
            {{"quantity", increment}, {"price", price}, {"source", source},
             {"filled_quantity", new_filled_total}, {"status", toString(result.order->status)}},
            now);
    if (result.order->status != order.status) {
        journal(core::JournalEventType::ORDER_STATUS_CHANGED, order.symbol, order.client_order_id,
                {{"from", toString(order.status)}, {"to", toString(result.order->status)},
                 {"provenance", result.order->provenance}},
                now);
    }
    return true;
}

ReconciliationEngine::PassContext ReconciliationEngine::loadSnapshots(
    const ReconcileOptions& options,
    ReconcileReport& report
) {
    PassContext ctx{options, clock_->nowMs(), report, {}, false, {}, false, 0};
    ctx.open_orders = bridge_->readOpenOrders();
    ctx.open_orders_fresh = ctx.open_orders.present && !ctx.open_orders.stale &&
                            ctx.now_ms - ctx.open_orders.refreshed_at_ms <= options.open_orders_fresh_ms;
    ctx.holdings = bridge_->readHoldings();
    ctx.holdings_fresh = ctx.holdings.present && !ctx.holdings.stale &&
                         ctx.now_ms - ctx.holdings.refreshed_at_ms <= options.holdings_fresh_ms;
    const auto status = bridge_->readStatus();
    if (status.present) {
        ctx.leader_pid = status.leader_pid;
    }
    return ctx;
}

void ReconciliationEngine::ingestEvents(
    const std::vector<core::ExecutionEvent>& events,
    std::vector<core::Order>& orders,
    PassContext& ctx
) {
    if (events.empty() || orders.empty()) {
        return;
    }
    std::vector<core::ExecutionEvent> sorted = events;
    std::stable_sort(sorted.begin(), sorted.end(), [](const core::ExecutionEvent& a, const core::ExecutionEvent& b) {
        return a.time_ms < b.time_ms;
    });

    std::map<std::string, long long> id_by_tag;
    for (const auto& order : orders) {
        id_by_tag[order.client_order_id] = order.id;
    }

    const long long now = ctx.now_ms;
    const long long window = ctx.options.low_confidence_recovery_window_ms;
    std::set<std::string> seen;
    for (const auto& event : sorted) {
        if (!seen.insert(event.event_id).second) {
            continue;
        }
        const auto tag_it = id_by_tag.find(event.tag);
        if (tag_it == id_by_tag.end()) {
            continue;
        }
        const auto current = std::find_if(orders.begin(), orders.end(), [&](const core::Order& o) {
            return o.id == tag_it->second;
        });
        if (current == orders.end()) {
            continue;
        }
        const core::Order order = *current;
        if (hasEvent(order, event.event_id) || isHighConfidenceTerminal(order, ctx)) {
            continue;
        }

        const auto tr = OrderLifecycleStateMachine::transition(
            event.status, order.filled_quantity, order.quantity, event.filled);
        if (tr.recognized && tr.filled_quantity > order.filled_quantity + toleranceFor(order)) {
            const double price = event.price && *event.price > 0.0 ? *event.price : lastKnownPrice(order);
            if (recordFill(order, tr.filled_quantity, price, event.commission, "execution_event", event.event_id,
                           tr.status, event.broker_order_id, event.event_id, orders, ctx)) {
                ctx.report.events_applied++;
                continue;
            }
        }

        const OrderStatus target = tr.recognized
            ? normalizeFillTarget(tr.status, order.filled_quantity, order.quantity)
            : order.status;
        const bool changed = updateOrderTracked(order, [&](core::Order& row) {
            if (hasEvent(row, event.event_id)) {
                return false;
            }
            row.applied_event_ids.push_back(event.event_id);
            if (!event.broker_order_id.empty() && row.broker_order_id.empty()) {
                row.broker_order_id = event.broker_order_id;
            }
            if (!tr.recognized) {
                return true;
            }
            const bool was_recovery = row.low_confidence;
            if (applyStatus(row, target, "execution_event", false, now, window) && was_recovery &&
                !row.low_confidence) {
                ctx.report.recovered++;
            }
            if (row.status == OrderStatus::REJECTED && row.rejected_reason.empty()) {
                row.rejected_reason = "broker_rejected";
            }
            if (row.status != OrderStatus::NEW) {
                clearPending(row, "submitted", now);
            }
            return true;
        }, orders, ctx);
        if (changed) {
            ctx.report.events_applied++;
        }
    }
}

void ReconciliationEngine::applyCommandResults(std::vector<core::Order>& orders, PassContext& ctx) {
    const long long now = ctx.now_ms;
    const long long window = ctx.options.low_confidence_recovery_window_ms;
    const std::vector<core::Order> snapshot = orders;
    for (const auto& order : snapshot) {
        const auto& meta = order.submit_command;
        if (meta.command_id.empty()) {
            continue;
        }

        if (!meta.superseded_by.empty()) {
            // The fallback owns this order now; a late leader answer is only
            // recorded.
            if (order.provenance.value("late_leader_result", std::string()) == meta.command_id) {
                continue;
            }
            const auto late = bridge_->readCommandResult(meta.command_id);
            if (!late) {
                continue;
            }
            LOG_WARN("order {}: leader answered superseded command {} with '{}'", order.client_order_id,
                     meta.command_id, late->status);
            updateOrderTracked(order, [&](core::Order& row) {
                row.provenance["late_leader_result"] = meta.command_id;
                row.provenance["late_leader_status"] = late->status;
                return true;
            }, orders, ctx);
            continue;
        }
        if (!meta.pending) {
            continue;
        }

        const auto result = bridge_->readCommandResult(meta.command_id);
        if (!result) {
            continue;
        }
        const std::string status = lowerCopy(result->status);
        bool changed = false;
        if (isAcceptedResult(status)) {
            changed = updateOrderTracked(order, [&](core::Order& row) {
                if (!row.submit_command.pending) {
                    return false;
                }
                clearPending(row, "submitted", result->processed_at_ms > 0 ? result->processed_at_ms : now);
                if (!result->broker_order_id.empty() && row.broker_order_id.empty()) {
                    row.broker_order_id = result->broker_order_id;
                }
                if (row.status == OrderStatus::NEW) {
                    applyStatus(row, OrderStatus::SUBMITTED, "leader_command_result", false, now, window);
                }
                row.last_progress_at_ms = now;
                return true;
            }, orders, ctx);
        } else if (isFailedResult(status)) {
            changed = updateOrderTracked(order, [&](core::Order& row) {
                if (!row.submit_command.pending) {
                    return false;
                }
                clearPending(row, "rejected", result->processed_at_ms > 0 ? result->processed_at_ms : now);
                row.submit_command.reason = result->reason;
                if (row.status == OrderStatus::NEW &&
                    applyStatus(row, OrderStatus::REJECTED, "leader_command_result", false, now, window)) {
                    row.rejected_reason = "leader_command_" + status +
                                          (result->reason.empty() ? std::string() : ":" + result->reason);
                }
                return true;
            }, orders, ctx);
        } else {
            LOG_WARN("order {}: unknown command result status '{}'", order.client_order_id, result->status);
        }
        if (changed) {
            ctx.report.command_results_applied++;
        }
    }
}

// "ok" and "not_found" both close the order: the broker has nothing live
// under the tag any more.
void ReconciliationEngine::applyCancelResults(std::vector<core::Order>& orders, PassContext& ctx) {
    const long long now = ctx.now_ms;
    const long long window = ctx.options.low_confidence_recovery_window_ms;
    const std::vector<core::Order> snapshot = orders;
    for (const auto& order : snapshot) {
        const auto& meta = order.cancel_request;
        if (meta.status != "requested" || meta.command_id.empty() || isHighConfidenceTerminal(order, ctx)) {
            continue;
        }
        const auto result = bridge_->readCommandResult(meta.command_id);
        if (!result) {
            continue;
        }
        const std::string status = lowerCopy(result->status);
        const bool confirmed = status == "ok" || status == "not_found";
        const bool changed = updateOrderTracked(order, [&](core::Order& row) {
            if (row.cancel_request.status != "requested" || row.cancel_request.command_id != meta.command_id) {
                return false;
            }
            row.cancel_request.result_status = status;
            row.cancel_request.completed_at_ms = result->processed_at_ms > 0 ? result->processed_at_ms : now;
            if (!confirmed) {
                row.cancel_request.status = "failed";
                return true;
            }
            row.cancel_request.status = "completed";
            if (applyStatus(row, OrderStatus::CANCELED, "cancel_command_" + status, false, now, window)) {
                row.provenance["cancel_command_id"] = meta.command_id;
            }
            row.submit_command.pending = false;
            return true;
        }, orders, ctx);
        if (!changed) {
            continue;
        }
        if (confirmed) {
            ctx.report.cancels_confirmed++;
        } else {
            LOG_WARN("order {}: cancel command {} answered '{}'", order.client_order_id, meta.command_id,
                     result->status);
        }
    }
}

void ReconciliationEngine::applyOpenOrders(std::vector<core::Order>& orders, PassContext& ctx) {
    if (!ctx.open_orders_fresh) {
        return;
    }
    const long long now = ctx.now_ms;
    const long long window = ctx.options.low_confidence_recovery_window_ms;
    const std::vector<core::Order> snapshot = orders;
    for (const auto& order : snapshot) {
        const auto* item = ctx.open_orders.findTag(order.client_order_id);
        if (item) {
            // Present at the broker: live, whatever inference said before.
            if (isHighConfidenceTerminal(order, ctx)) {
                continue;
            }
            const OrderStatus target = order.filled_quantity > 0.0 ? OrderStatus::PARTIAL : OrderStatus::SUBMITTED;
            const bool was_low = order.low_confidence;
            const bool changed = updateOrderTracked(order, [&](core::Order& row) {
                bool touched = false;
                if (!item->broker_order_id.empty() && row.broker_order_id.empty()) {
                    row.broker_order_id = item->broker_order_id;
                    touched = true;
                }
                if (row.submit_command.pending) {
                    clearPending(row, "submitted", now);
                    touched = true;
                }
                if (row.status == target && !row.low_confidence) {
                    return touched;
                }
                if (row.status == OrderStatus::PARTIAL && target == OrderStatus::SUBMITTED) {
                    return touched;
                }
                return applyStatus(row, target, "open_orders", false, now, window) || touched;
            }, orders, ctx);
            if (changed && was_low) {
                ctx.report.recovered++;
            }
            continue;
        }

        // Absent from a fresh snapshot.
        if (OrderLifecycleStateMachine::isTerminal(order.status)) {
            continue;
        }
        const auto& meta = order.submit_command;
        if (meta.pending || meta.status == "superseded" || meta.requested_at_ms <= 0) {
            continue;
        }
        long long grace = ctx.options.active_order_missing_grace_ms;
        if (meta.source == "short_lived_fallback") {
            grace = ctx.options.fallback_missing_grace_ms;
        } else if (order.status == OrderStatus::NEW) {
            grace = ctx.options.new_order_missing_grace_ms;
        }
        if (ctx.open_orders.refreshed_at_ms < meta.requested_at_ms + grace) {
            continue;
        }
        const OrderStatus target = order.status == OrderStatus::NEW ? OrderStatus::SKIPPED : OrderStatus::CANCELED;
        const bool changed = updateOrderTracked(order, [&](core::Order& row) {
            if (OrderLifecycleStateMachine::isTerminal(row.status)) {
                return false;
            }
            return applyStatus(row, target, kMissingFromOpenOrders, true, now, window);
        }, orders, ctx);
        if (changed) {
            ctx.report.low_confidence_marked++;
        }
    }
}

void ReconciliationEngine::inferFillsFromHoldings(std::vector<core::Order>& orders, PassContext& ctx) {
    if (!ctx.holdings_fresh) {
        return;
    }
    std::map<std::pair<std::string, OrderSide>, std::vector<long long>> groups;
    for (const auto& order : orders) {
        if (!order.baseline.captured) {
            continue;
        }
        groups[{order.symbol, order.side}].push_back(order.id);
    }

    for (auto& group : groups) {
        const std::string& symbol = group.first.first;
        const OrderSide side = group.first.second;
        auto& ids = group.second;
        std::sort(ids.begin(), ids.end());

        // Still working at the broker: holdings may move further.
        bool visible = ctx.open_orders_fresh && ctx.open_orders.containsSymbol(symbol);
        for (long long id : ids) {
            for (const auto& order : orders) {
                if (order.id == id && ctx.open_orders_fresh && ctx.open_orders.findTag(order.client_order_id)) {
                    visible = true;
                }
            }
        }
        if (visible) {
            continue;
        }

        const core::Order* first = nullptr;
        for (const auto& order : orders) {
            if (order.id == ids.front()) {
                first = &order;
            }
        }
        if (!first) {
            continue;
        }
        const double current = ctx.holdings.quantityOf(symbol);
        double delta = side == OrderSide::BUY ? current - first->baseline.quantity
                                              : first->baseline.quantity - current;
        if (delta <= kQuantityTolerance) {
            continue;
        }

        const auto holding = ctx.holdings.items.find(symbol);
        const double avg_cost = holding == ctx.holdings.items.end() ? 0.0 : holding->second.avg_cost;

        for (long long id : ids) {
            const auto it = std::find_if(orders.begin(), orders.end(), [&](const core::Order& o) {
                return o.id == id;
            });
            if (it == orders.end()) {
                continue;
            }
            const core::Order order = *it;
            const double capacity = std::max(0.0, order.quantity - order.filled_quantity);
            const double share = std::min(delta, order.quantity);
            delta -= share;
            if (isHighConfidenceTerminal(order, ctx) || capacity <= toleranceFor(order)) {
                continue;
            }
            // share is this order's cumulative fill implied by the holdings move.
            const double inferred_total = std::min(order.quantity, share);
            if (inferred_total <= order.filled_quantity + toleranceFor(order)) {
                continue;
            }
            const double price = avg_cost > 0.0 ? avg_cost : lastKnownPrice(order);
            const OrderStatus target = OrderLifecycleStateMachine::isFullyFilled(inferred_total, order.quantity)
                ? OrderStatus::FILLED
                : (OrderLifecycleStateMachine::isTerminal(order.status) ? order.status : OrderStatus::PARTIAL);
            recordFill(order, inferred_total, price, 0.0, "holdings", formatQuantity(inferred_total), target,
                       std::string(), std::string(), orders, ctx);
            if (delta <= kQuantityTolerance) {
                break;
            }
        }
    }
}

void ReconciliationEngine::applySessionDiagnostics(
    const core::Run& run,
    std::vector<core::Order>& orders,
    PassContext& ctx
) {
    if (run.submission.channel != SubmissionChannel::SHORT_LIVED && !run.submission.fallback_triggered) {
        return;
    }

    std::vector<std::string> affected;
    std::string code = detectSessionFault(bridge_->readSessionLog(run.id), affected);

    if (code.empty() && !run.submission.intent_path.empty()) {
        const auto intent = bridge_->readOrderIntent(run.submission.intent_path);
        if (intent) {
            std::set<std::string> intent_symbols;
            for (const auto& record : *intent) {
                intent_symbols.insert(common::normalizeSymbol(record.symbol));
            }
            std::set<std::string> launched_symbols;
            for (const auto& order : orders) {
                const auto& source = order.submit_command.source;
                // Only the latest launch wrote the current intent file.
                if ((source == "short_lived" || source == "short_lived_fallback") &&
                    order.submit_command.requested_at_ms == run.submission.launched_at_ms) {
                    launched_symbols.insert(order.symbol);
                }
            }
            if (!launched_symbols.empty() && intent_symbols != launched_symbols) {
                code = "intent_symbol_mismatch";
            }
        }
    }
    if (code.empty()) {
        return;
    }
    LOG_ERROR("run {}: execution fault {}", run.id, code);
    ctx.report.diagnostic = code;
    forceTerminal(orders, code, affected, ctx);
}

void ReconciliationEngine::forceTerminal(
    std::vector<core::Order>& orders,
    const std::string& code,
    const std::vector<std::string>& affected_symbols,
    PassContext& ctx
) {
    const long long now = ctx.now_ms;
    const std::vector<core::Order> snapshot = orders;
    for (const auto& order : snapshot) {
        if (isHighConfidenceTerminal(order, ctx)) {
            continue;
        }

        if (code == "targets_already_held") {
            const bool affected = affected_symbols.empty() ||
                std::find(affected_symbols.begin(), affected_symbols.end(), order.symbol) != affected_symbols.end();
            if (affected) {
                const bool changed = updateOrderTracked(order, [&](core::Order& row) {
                    if (row.avg_fill_price <= 0.0) {
                        row.avg_fill_price = lastKnownPrice(row);
                    }
                    row.filled_quantity = row.quantity;
                    forceStatus(row, OrderStatus::FILLED, code, now);
                    row.provenance["already_held"] = true;
                    return true;
                }, orders, ctx);
                if (changed) {
                    ctx.report.forced_terminal++;
                }
                continue;
            }
        }

        const bool changed = updateOrderTracked(order, [&](core::Order& row) {
            if (code == "submit_during_warmup" && row.status == OrderStatus::CANCELED && row.low_confidence &&
                !row.broker_order_id.empty()) {
                // The broker knew the order; the cancel stands.
                row.low_confidence = false;
                row.low_confidence_reason.clear();
                row.provenance["sync_reason"] = "forced:" + code;
                row.provenance["confirmed_at_ms"] = now;
                return true;
            }
            if (row.filled_quantity > 0.0) {
                forceStatus(row, OrderStatus::CANCELED, code, now);
            } else {
                forceStatus(row, OrderStatus::REJECTED,
                            code == "submit_during_warmup" ? std::string(kWarmupRejectReason) : code, now);
            }
            return true;
        }, orders, ctx);
        if (changed) {
            ctx.report.forced_terminal++;
        }
    }
}

void ReconciliationEngine::changeRunStatus(core::Run& row, RunStatus to, const std::string& message, long long now_ms) {
    row.status = to;
    row.message = message;
    if (RunLifecycleStateMachine::isTerminal(to)) {
        row.ended_at_ms = now_ms;
    }
    if (to != RunStatus::STALLED) {
        row.stalled_at_ms = 0;
        row.stalled_reason.clear();
    }
}

void ReconciliationEngine::updateRunState(long long run_id, std::vector<core::Order>& orders, PassContext& ctx) {
    const long long now = ctx.now_ms;
    const auto before = store_->getRun(run_id);
    if (!before || RunLifecycleStateMachine::isTerminal(before->status)) {
        return;
    }

    orders = store_->listOrdersForRun(run_id);
    auto summary = RunLifecycleStateMachine::summarize(orders);

    bool deadline_failed = false;
    if (ctx.report.diagnostic.empty() && before->status == RunStatus::STALLED && before->deadline_ms &&
        now >= *before->deadline_ms && !summary.terminal) {
        deadline_failed = true;
        LOG_ERROR("run {}: stalled past deadline, forcing open orders terminal", run_id);
        std::vector<core::Order> live;
        for (const auto& order : orders) {
            if (!OrderLifecycleStateMachine::isTerminal(order.status)) {
                live.push_back(order);
            }
        }
        if (dispatcher_) {
            dispatcher_->cancelActiveOrders(live, "stall_deadline_exceeded");
        }
        for (const auto& order : live) {
            const bool changed = updateOrderTracked(order, [&](core::Order& row) {
                if (OrderLifecycleStateMachine::isTerminal(row.status)) {
                    return false;
                }
                forceStatus(row, row.status == OrderStatus::NEW ? OrderStatus::REJECTED : OrderStatus::CANCELED,
                            "stall_deadline_exceeded", now);
                return true;
            }, orders, ctx);
            if (changed) {
                ctx.report.forced_terminal++;
            }
        }
        summary = RunLifecycleStateMachine::summarize(orders);
    }

    long long latest_progress = 0;
    bool any_pending = false;
    for (const auto& order : orders) {
        latest_progress = std::max(latest_progress, order.last_progress_at_ms);
        any_pending = any_pending || order.submit_command.pending;
    }

    const auto after = store_->updateRun(run_id, [&](core::Run& row) {
        if (RunLifecycleStateMachine::isTerminal(row.status)) {
            return false;
        }
        bool changed = false;
        if (row.completion != summary) {
            row.completion = summary;
            changed = true;
        }
        if (latest_progress > row.last_progress_at_ms) {
            row.last_progress_at_ms = latest_progress;
            changed = true;
        }

        if (!ctx.report.diagnostic.empty()) {
            changeRunStatus(row, RunStatus::FAILED, "execution_error:" + ctx.report.diagnostic, now);
            row.failure_code = ctx.report.diagnostic;
            return true;
        }
        if (deadline_failed) {
            changeRunStatus(row, RunStatus::FAILED, "stall_deadline_exceeded", now);
            row.failure_code = "stall_deadline_exceeded";
            return true;
        }
        if (summary.terminal && summary.status) {
            const RunStatus to = *summary.status;
            if (to == RunStatus::DONE) {
                changeRunStatus(row, to, "completed_done", now);
            } else if (to == RunStatus::PARTIAL) {
                changeRunStatus(row, to, "completed_partial", now);
            } else {
                changeRunStatus(row, to, "completed_failed", now);
                row.failure_code = "no_fills";
            }
            return true;
        }
        if (row.status == RunStatus::STALLED && row.last_progress_at_ms > row.stalled_at_ms) {
            changeRunStatus(row, RunStatus::RUNNING, "progress_resumed", now);
            return true;
        }
        if (row.status == RunStatus::RUNNING && ctx.options.market_open &&
            now - std::max(row.last_progress_at_ms, row.started_at_ms) >= ctx.options.stall_window_ms) {
            const std::string reason = any_pending ? "leader_submit_pending" : "no_progress";
            changeRunStatus(row, RunStatus::STALLED, "stalled:" + reason, now);
            row.stalled_at_ms = now;
            row.stalled_reason = reason;
            return true;
        }
        return changed;
    });

    if (after && after->status != before->status) {
        Logger::getInstance().logRunTransition(run_id, toString(before->status), toString(after->status),
                                               after->message);
        journal(core::JournalEventType::RUN_STATUS_CHANGED, std::string(), "run_" + std::to_string(run_id),
                {{"from", toString(before->status)}, {"to", toString(after->status)},
                 {"message", after->message}, {"failure_code", after->failure_code}},
                now);
    }
}

void ReconciliationEngine::cleanupProcess(const core::Run& run, PassContext& ctx) {
    const int pid = run.submission.pid;
    if (pid <= 0 || !processes_) {
        return;
    }
    if (run.process && run.process->pid == pid && ProcessLifecycleManager::isSettled(*run.process)) {
        ctx.report.process = run.process;
        return;
    }
    const auto outcome = processes_->stepTermination(pid, ctx.leader_pid, run.process,
                                                     run.submission.pid_start_time);
    ctx.report.process = outcome;
    const bool differs = !run.process || run.process->outcome != outcome.outcome ||
                         run.process->pid != outcome.pid;
    if (!differs) {
        return;
    }
    store_->updateRun(run.id, [&](core::Run& row) {
        row.process = outcome;
        return true;
    });
    if (ProcessLifecycleManager::isSettled(outcome)) {
        LOG_INFO("run {}: submission process {} {}", run.id, pid, outcome.outcome);
        journal(core::JournalEventType::PROCESS_TERMINATED, std::string(), "run_" + std::to_string(run.id),
                {{"pid", pid}, {"outcome", outcome.outcome}}, ctx.now_ms);
    }
}

std::vector<core::ExecutionEvent> ReconciliationEngine::readEvents(long long run_id, const ReconcileOptions& options) {
    std::vector<core::ExecutionEvent> events;
    if (options.ingest_leader_events) {
        events = bridge_->readExecutionEvents(std::nullopt);
    }
    const auto run_events = bridge_->readExecutionEvents(run_id);
    events.insert(events.end(), run_events.begin(), run_events.end());
    return events;
}

bool ReconciliationEngine::needsFollowUp(const core::Run& run, const ReconcileOptions& options) {
    if (!RunLifecycleStateMachine::isTerminal(run.status)) {
        return false;
    }
    const int pid = run.submission.pid;
    if (pid > 0 && processes_ &&
        !(run.process && run.process->pid == pid && ProcessLifecycleManager::isSettled(*run.process))) {
        return true;
    }
    const long long now = clock_->nowMs();
    for (const auto& order : store_->listOrdersForRun(run.id)) {
        if (OrderLifecycleStateMachine::isRecoverableLowConfidence(order, now, options.low_confidence_recovery_window_ms)) {
            return true;
        }
    }
    return false;
}

// A run closed on low-confidence evidence keeps its status, but its orders
// still take events, open orders and holdings until the recovery window
// closes, and the completion summary follows them.
void ReconciliationEngine::reviseClosedRun(const core::Run& run, PassContext& ctx) {
    auto orders = store_->listOrdersForRun(run.id);
    const bool recoverable = std::any_of(orders.begin(), orders.end(), [&](const core::Order& order) {
        return OrderLifecycleStateMachine::isRecoverableLowConfidence(
            order, ctx.now_ms, ctx.options.low_confidence_recovery_window_ms);
    });
    if (!recoverable) {
        return;
    }

    ingestEvents(readEvents(run.id, ctx.options), orders, ctx);
    applyOpenOrders(orders, ctx);
    if (ctx.options.infer_fills_from_holdings) {
        inferFillsFromHoldings(orders, ctx);
    }

    const auto summary = RunLifecycleStateMachine::summarize(store_->listOrdersForRun(run.id));
    const auto revised = store_->updateRun(run.id, [&](core::Run& row) {
        if (row.completion == summary) {
            return false;
        }
        row.completion = summary;
        row.extras["completion_revised_at_ms"] = ctx.now_ms;
        return true;
    });
    if (revised && revised->completion == summary && run.completion != summary) {
        LOG_WARN("run {} ({}) revised after close: {} with fills, {} filled", run.id, toString(run.status),
                 summary.with_fills, summary.filled);
    }
}

ReconcileReport ReconciliationEngine::reconcileRun(long long run_id, const ReconcileOptions& options) {
    ReconcileReport report;
    report.run_id = run_id;
    const auto run = store_->getRun(run_id);
    if (!run) {
        throw std::invalid_argument("run_not_found");
    }
    report.status_before = run->status;
    report.status_after = run->status;

    PassContext ctx = loadSnapshots(options, report);
    if (RunLifecycleStateMachine::isTerminal(run->status)) {
        reviseClosedRun(*run, ctx);
        const auto latest = store_->getRun(run_id);
        cleanupProcess(latest ? *latest : *run, ctx);
        return report;
    }
    if (run->status == RunStatus::QUEUED || run->status == RunStatus::BLOCKED) {
        return report;
    }

    auto orders = store_->listOrdersForRun(run_id);
    ingestEvents(readEvents(run_id, options), orders, ctx);
    applyCommandResults(orders, ctx);
    applyCancelResults(orders, ctx);

    if (options.escalate_pending && dispatcher_) {
        const auto fallback = dispatcher_->escalatePendingTimeouts(run_id);
        if (fallback.launched) {
            report.fallback_triggered = true;
            const auto resumed = store_->updateRun(run_id, [&](core::Run& row) {
                if (row.status == RunStatus::STALLED) {
                    changeRunStatus(row, RunStatus::RUNNING, "submitted_short_lived_fallback", ctx.now_ms);
                    row.submission.auto_resumed_at_ms = ctx.now_ms;
                    row.last_progress_at_ms = ctx.now_ms;
                    return true;
                }
                row.message = "submitted_short_lived_fallback";
                // a fresh launch restarts the stall window
                row.last_progress_at_ms = ctx.now_ms;
                return true;
            });
            if (resumed && resumed->submission.auto_resumed_at_ms == ctx.now_ms && run->status == RunStatus::STALLED) {
                report.auto_resumed = true;
                Logger::getInstance().logRunTransition(run_id, toString(RunStatus::STALLED),
                                                       toString(RunStatus::RUNNING), resumed->message);
                journal(core::JournalEventType::RUN_STATUS_CHANGED, std::string(), "run_" + std::to_string(run_id),
                        {{"from", toString(RunStatus::STALLED)}, {"to", toString(RunStatus::RUNNING)},
                         {"message", resumed->message}},
                        ctx.now_ms);
            }
        } else if (fallback.triggered) {
            LOG_WARN("run {}: fallback not launched ({})", run_id, fallback.reason);
        }
        orders = store_->listOrdersForRun(run_id);
    }

    applyOpenOrders(orders, ctx);
    if (options.infer_fills_from_holdings) {
        inferFillsFromHoldings(orders, ctx);
    }
    const auto current = store_->getRun(run_id);
    applySessionDiagnostics(current ? *current : *run, orders, ctx);
    updateRunState(run_id, orders, ctx);

    const auto final_run = store_->getRun(run_id);
    if (final_run) {
        report.status_after = final_run->status;
        if (RunLifecycleStateMachine::isTerminal(final_run->status)) {
            cleanupProcess(*final_run, ctx);
        }
    }
    if (report.changed()) {
        LOG_INFO("reconcile run {}: {} -> {} (events {}, results {}, cancels {}, fills {}, low_confidence {}, "
                 "recovered {})",
                 run_id, toString(report.status_before), toString(report.status_after), report.events_applied,
                 report.command_results_applied, report.cancels_confirmed, report.fills_recorded,
                 report.low_confidence_marked, report.recovered);
    }
    return report;
}

int ReconciliationEngine::reconcileFreeOrders(const ReconcileOptions& options) {
    ReconcileReport report;
    PassContext ctx = loadSnapshots(options, report);

    std::vector<core::Order> orders;
    for (const auto& order : store_->listFreeOrders()) {
        if (!isHighConfidenceTerminal(order, ctx)) {
            orders.push_back(order);
        }
    }
    if (orders.empty()) {
        return 0;
    }

    if (options.ingest_leader_events) {
        ingestEvents(bridge_->readExecutionEvents(std::nullopt), orders, ctx);
    }
    applyCommandResults(orders, ctx);
    applyCancelResults(orders, ctx);
    applyOpenOrders(orders, ctx);

    const int changed = report.events_applied + report.command_results_applied + report.low_confidence_marked +
                        report.fills_recorded + report.cancels_confirmed;
    if (changed > 0) {
        LOG_INFO("reconcile free orders: {} updates", changed);
    }
    return changed;
}

} // namespace execution
} // namespace rebalex
