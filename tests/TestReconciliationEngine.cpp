#include "execution/ReconciliationEngine.h"

#include <filesystem>
#include <functional>
#include <iostream>

#include "bridge/FileBrokerBridge.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/ExecutionStoreJson.h"
#include "TestSupport.h"

using namespace rebalex;

namespace {
struct World {
    std::filesystem::path dir;
    std::filesystem::path root;
    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<core::ExecutionStoreJson> store;
    std::shared_ptr<bridge::FileBrokerBridge> bridge;
    std::shared_ptr<test::FakeProcessLauncher> launcher;
    std::shared_ptr<execution::SubmissionDispatcher> dispatcher;
    std::shared_ptr<execution::ReconciliationEngine> engine;
    execution::ReconcileOptions options;
};

World makeWorld() {
    World w;
    w.dir = test::makeTempDir("reconcile");
    w.root = w.dir / "bridge";
    w.clock = std::make_shared<ManualClock>(test::kMarketMorningMs);
    w.store = std::make_shared<core::ExecutionStoreJson>(w.dir / "state" / "execution_store.json", w.clock);
    w.bridge = std::make_shared<bridge::FileBrokerBridge>(bridge::BridgeOptions{w.root, 10000}, w.clock);
    w.launcher = std::make_shared<test::FakeProcessLauncher>();
    auto processes = std::make_shared<execution::ProcessLifecycleManager>(
        w.launcher, w.clock, execution::ProcessOptions{10000});
    auto limiter = std::make_shared<execution::RateLimiter>(w.clock);
    auto journal = std::make_shared<core::EventJournalJsonl>(w.dir / "state" / "execution_journal.jsonl");

    execution::DispatchOptions dispatch;
    dispatch.launcher_command = {"broker-session", "--run-id", "{run_id}"};
    dispatch.lock_dir = w.dir / "locks";
    w.dispatcher = std::make_shared<execution::SubmissionDispatcher>(
        w.store, w.bridge, processes, limiter, journal, w.clock, dispatch);
    w.engine = std::make_shared<execution::ReconciliationEngine>(
        w.store, w.bridge, w.dispatcher, processes, journal, w.clock);
    return w;
}

core::Run makeRunningRun(World& w, SubmissionChannel channel) {
    core::Run run;
    run.status = RunStatus::RUNNING;
    run.started_at_ms = w.clock->nowMs();
    run.submission.channel = channel;
    run.submission.launched_at_ms = w.clock->nowMs();
    return w.store->createRun(run);
}

core::Order place(World& w, long long run_id, const std::string& tag, const std::string& symbol, double quantity,
                  const std::function<void(core::Order&)>& setup) {
    core::Order order;
    order.run_id = run_id;
    order.client_order_id = tag;
    order.symbol = symbol;
    order.side = OrderSide::BUY;
    order.quantity = quantity;
    order.prime_price = 20.0;
    const auto created = w.store->createOrder(order).order;
    return *w.store->updateOrder(created.id, [&](core::Order& row) {
        setup(row);
        return true;
    });
}

std::function<void(core::Order&)> submittedVia(const std::string& source, long long requested_at_ms) {
    return [source, requested_at_ms](core::Order& row) {
        row.status = OrderStatus::SUBMITTED;
        row.submit_command.source = source;
        row.submit_command.status = "submitted";
        row.submit_command.requested_at_ms = requested_at_ms;
    };
}

std::function<void(core::Order&)> launchedVia(const std::string& source, long long requested_at_ms) {
    return [source, requested_at_ms](core::Order& row) {
        row.submit_command.source = source;
        row.submit_command.status = "launched";
        row.submit_command.requested_at_ms = requested_at_ms;
    };
}

nlohmann::json openItem(const std::string& tag, const std::string& symbol) {
    return {{"tag", tag}, {"symbol", symbol}, {"status", "Submitted"}};
}

std::filesystem::path sessionLog(const World& w, long long run_id) {
    return w.root / "runs" / ("run_" + std::to_string(run_id)) / "session.log";
}
}

int main() {
    World w = makeWorld();
    test::writeHealthyBridge(w.root, w.clock->nowMs());

    // 1. Holdings-inferred fill, idempotent passes, then execution events
    {
        const long long t0 = w.clock->nowMs();
        const auto run = makeRunningRun(w, SubmissionChannel::LEADER);
        const auto a = place(w, run.id, "oi_A", "AAPL", 100.0, [&](core::Order& row) {
            submittedVia("leader_command", t0)(row);
            row.baseline.captured = true;
            row.baseline.quantity = 0.0;
        });
        const auto b = place(w, run.id, "oi_B", "MSFT", 10.0, submittedVia("leader_command", t0));

        w.clock->advance(1000);
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_B", "MSFT")});
        test::writeHoldings(w.root, w.clock->nowMs(), {{"AAPL", 60.0}});

        const auto first = w.engine->reconcileRun(run.id, w.options);
        const auto after_first = *w.store->getOrder(a.id);
        REBALEX_EXPECT(first.fills_recorded == 1, "one inferred fill");
        REBALEX_EXPECT(after_first.filled_quantity == 60.0, "filled 60");
        REBALEX_EXPECT(after_first.status == OrderStatus::PARTIAL, "partial");
        const auto fills = w.store->listFills(a.id);
        REBALEX_EXPECT(fills.size() == 1 && fills[0].source == "holdings", "holdings fill");
        REBALEX_EXPECT(fills[0].exec_token == execution::ReconciliationEngine::fillToken(a.id, "holdings", "60.000000"),
                       "holdings fill token");
        const auto completion = w.store->getRun(run.id)->completion;
        REBALEX_EXPECT(completion.partial == 1 && completion.submitted == 1 && !completion.terminal, "completion");

        const auto second = w.engine->reconcileRun(run.id, w.options);
        REBALEX_EXPECT(!second.changed(), "unchanged inputs change nothing");
        REBALEX_EXPECT(w.store->listFills(a.id).size() == 1, "no duplicate fill");
        REBALEX_EXPECT(w.store->getRun(run.id)->completion == completion, "completion stable");

        // holdings shrinking never lowers the filled quantity
        test::writeHoldings(w.root, w.clock->nowMs(), {{"AAPL", 50.0}});
        w.engine->reconcileRun(run.id, w.options);
        REBALEX_EXPECT(w.store->getOrder(a.id)->filled_quantity == 60.0, "monotonic filled quantity");

        test::appendLine(w.root / "execution_events.jsonl",
                         R"({"event_id":"evA1","tag":"oi_A","status":"Filled","filled":100,"price":51.0,"broker_order_id":"B1"})");
        const auto third = w.engine->reconcileRun(run.id, w.options);
        const auto filled = *w.store->getOrder(a.id);
        REBALEX_EXPECT(third.events_applied == 1, "event applied");
        REBALEX_EXPECT(filled.status == OrderStatus::FILLED && filled.filled_quantity == 100.0, "filled by event");
        REBALEX_EXPECT(filled.broker_order_id == "B1", "broker id from event");
        REBALEX_EXPECT(w.store->listFills(a.id).size() == 2, "increment fill recorded");
        REBALEX_EXPECT(w.store->listFills(a.id)[1].quantity == 40.0, "increment only");

        // a later cancel cannot reopen a high-confidence fill
        test::appendLine(w.root / "execution_events.jsonl", R"({"event_id":"evA2","tag":"oi_A","status":"Cancelled"})");
        w.engine->reconcileRun(run.id, w.options);
        REBALEX_EXPECT(w.store->getOrder(a.id)->status == OrderStatus::FILLED, "filled is final");
        REBALEX_EXPECT(w.store->getRun(run.id)->status == RunStatus::RUNNING, "other order still open");

        test::appendLine(w.root / "execution_events.jsonl",
                         R"({"event_id":"evB1","tag":"oi_B","status":"Filled","filled":10,"price":300.0})");
        const auto done = w.engine->reconcileRun(run.id, w.options);
        const auto done_run = *w.store->getRun(run.id);
        REBALEX_EXPECT(done.status_after == RunStatus::DONE, "run done");
        REBALEX_EXPECT(done_run.message == "completed_done" && done_run.completion.terminal, "done message");
        REBALEX_EXPECT(w.store->getOrder(b.id)->filled_quantity == 10.0, "second order filled");

        test::appendLine(w.root / "execution_events.jsonl", R"({"event_id":"evB2","tag":"oi_B","status":"Rejected"})");
        const auto after_done = w.engine->reconcileRun(run.id, w.options);
        REBALEX_EXPECT(after_done.status_after == RunStatus::DONE, "terminal run stays terminal");
        REBALEX_EXPECT(w.store->getOrder(b.id)->status == OrderStatus::FILLED, "terminal run orders untouched");
    }

    // 2. Warm-up rejection in the session log force-closes the run
    {
        const long long t0 = w.clock->nowMs();
        core::Run row;
        row.status = RunStatus::RUNNING;
        row.started_at_ms = t0;
        row.submission.channel = SubmissionChannel::SHORT_LIVED;
        row.submission.launched_at_ms = t0;
        row.submission.pid = *w.launcher->launch(core::LaunchSpec{});
        const auto run = w.store->createRun(row);

        const auto fresh = place(w, run.id, "oi_W1", "AAPL", 10.0, launchedVia("short_lived", t0));
        const auto known = place(w, run.id, "oi_W2", "MSFT", 5.0, [&](core::Order& o) {
            launchedVia("short_lived", t0)(o);
            o.status = OrderStatus::CANCELED;
            o.low_confidence = true;
            o.low_confidence_reason = "missing_from_open_orders";
            o.low_confidence_at_ms = t0;
            o.broker_order_id = "B9";
        });
        const auto partly = place(w, run.id, "oi_W3", "IBM", 10.0, [&](core::Order& o) {
            launchedVia("short_lived", t0)(o);
            o.status = OrderStatus::PARTIAL;
            o.filled_quantity = 3.0;
        });
        test::appendLine(sessionLog(w, run.id), "2026-03-02 10:00:01 ERROR Orders are not allowed in Initialize or during warm up");
        test::writeOpenOrders(w.root, w.clock->nowMs());

        const auto report = w.engine->reconcileRun(run.id, w.options);
        const auto failed = *w.store->getRun(run.id);
        REBALEX_EXPECT(report.diagnostic == "submit_during_warmup", "warm-up diagnostic");
        REBALEX_EXPECT(failed.status == RunStatus::FAILED, "run failed");
        REBALEX_EXPECT(failed.failure_code == "submit_during_warmup", "failure code");
        REBALEX_EXPECT(failed.message == "execution_error:submit_during_warmup", "failure message");

        const auto rejected = *w.store->getOrder(fresh.id);
        REBALEX_EXPECT(rejected.status == OrderStatus::REJECTED, "unfilled order rejected");
        REBALEX_EXPECT(rejected.rejected_reason == "OrderRequest.Submit blocked during warmup/initialize", "warm-up reason");
        const auto confirmed = *w.store->getOrder(known.id);
        REBALEX_EXPECT(confirmed.status == OrderStatus::CANCELED && !confirmed.low_confidence, "known cancel confirmed");
        REBALEX_EXPECT(w.store->getOrder(partly.id)->status == OrderStatus::CANCELED, "filled order canceled");

        // terminal run: the submission process is wound down one step per pass
        REBALEX_EXPECT(failed.process && failed.process->outcome == "term_requested", "SIGTERM on terminal run");
        w.clock->advance(5000);
        w.engine->reconcileRun(run.id, w.options);
        REBALEX_EXPECT(w.store->getRun(run.id)->process->outcome == "term_requested", "waiting for grace");
        w.clock->advance(5000);
        w.engine->reconcileRun(run.id, w.options);
        REBALEX_EXPECT(w.store->getRun(run.id)->process->outcome == "killed", "SIGKILL after grace");
        REBALEX_EXPECT(w.store->getRun(run.id)->status == RunStatus::FAILED, "still failed");
    }

    // 3. Intent file that disagrees with the launched orders
    {
        const long long t0 = w.clock->nowMs();
        auto run = makeRunningRun(w, SubmissionChannel::SHORT_LIVED);
        const auto x = place(w, run.id, "oi_I1", "AAPL", 10.0, launchedVia("short_lived", t0));
        const auto y = place(w, run.id, "oi_I2", "IBM", 10.0, launchedVia("short_lived", t0));

        core::IntentRecord only_aapl;
        only_aapl.id = "oi_I1";
        only_aapl.symbol = "AAPL";
        only_aapl.quantity = 10.0;
        const auto path = w.bridge->writeOrderIntent(run.id, {only_aapl});
        w.store->updateRun(run.id, [&](core::Run& r) {
            r.submission.intent_path = *path;
            return true;
        });
        test::writeOpenOrders(w.root, w.clock->nowMs());

        const auto report = w.engine->reconcileRun(run.id, w.options);
        REBALEX_EXPECT(report.diagnostic == "intent_symbol_mismatch", "mismatch detected");
        REBALEX_EXPECT(w.store->getRun(run.id)->failure_code == "intent_symbol_mismatch", "mismatch failure");
        REBALEX_EXPECT(w.store->getOrder(x.id)->status == OrderStatus::REJECTED, "order rejected");
        REBALEX_EXPECT(w.store->getOrder(y.id)->rejected_reason == "intent_symbol_mismatch", "mismatch reason");

        // a matching intent is not a fault
        const auto ok_run = makeRunningRun(w, SubmissionChannel::SHORT_LIVED);
        place(w, ok_run.id, "oi_J1", "AAPL", 10.0, launchedVia("short_lived", t0));
        core::IntentRecord match = only_aapl;
        match.id = "oi_J1";
        const auto ok_path = w.bridge->writeOrderIntent(ok_run.id, {match});
        w.store->updateRun(ok_run.id, [&](core::Run& r) {
            r.submission.intent_path = *ok_path;
            return true;
        });
        const auto ok_report = w.engine->reconcileRun(ok_run.id, w.options);
        REBALEX_EXPECT(ok_report.diagnostic.empty(), "matching intent");
        REBALEX_EXPECT(w.store->getRun(ok_run.id)->status == RunStatus::RUNNING, "matching run keeps running");
    }

    // 4. Targets already held: nothing was submitted for those symbols
    {
        const long long t0 = w.clock->nowMs();
        const auto run = makeRunningRun(w, SubmissionChannel::SHORT_LIVED);
        const auto held_a = place(w, run.id, "oi_H1", "AAPL", 10.0, launchedVia("short_lived", t0));
        const auto held_m = place(w, run.id, "oi_H2", "MSFT", 4.0, launchedVia("short_lived", t0));
        const auto other = place(w, run.id, "oi_H3", "IBM", 2.0, launchedVia("short_lived", t0));
        test::appendLine(sessionLog(w, run.id), "INFO TARGETS_ALREADY_HELD symbols=AAPL,msft nothing to submit");

        w.engine->reconcileRun(run.id, w.options);
        const auto a = *w.store->getOrder(held_a.id);
        REBALEX_EXPECT(a.status == OrderStatus::FILLED && a.filled_quantity == 10.0, "held symbol filled");
        REBALEX_EXPECT(a.provenance.value("already_held", false), "already held provenance");
        REBALEX_EXPECT(w.store->listFills(a.id).empty(), "no fill record for held target");
        REBALEX_EXPECT(w.store->getOrder(held_m.id)->status == OrderStatus::FILLED, "case-insensitive symbol list");
        REBALEX_EXPECT(w.store->getOrder(other.id)->status == OrderStatus::REJECTED, "unaffected order rejected");
        REBALEX_EXPECT(w.store->getRun(run.id)->failure_code == "targets_already_held", "already held failure");
    }

    // 5. Stalled on pending leader commands, resumed by the automatic fallback
    {
        execution::ReconcileOptions options = w.options;
        options.stall_window_ms = 30000;

        test::writeHealthyBridge(w.root, w.clock->nowMs());
        test::writeHoldings(w.root, w.clock->nowMs(), {});
        core::Run queued;
        queued.status = RunStatus::QUEUED;
        const auto created = w.store->createRun(queued);
        const auto order = place(w, created.id, "oi_S1", "NVDA", 10.0, [](core::Order&) {});
        const auto dispatched = w.dispatcher->submitRun(*w.store->getRun(created.id), w.bridge->readHoldings());
        REBALEX_EXPECT(dispatched.ok && dispatched.channel == SubmissionChannel::LEADER, "leader dispatch");
        const long long started = w.clock->nowMs();
        w.store->updateRun(created.id, [&](core::Run& r) {
            r.status = RunStatus::RUNNING;
            r.started_at_ms = started;
            return true;
        });

        w.clock->advance(30000);
        test::writeOpenOrders(w.root, w.clock->nowMs());
        test::writeHoldings(w.root, w.clock->nowMs(), {});
        const auto stalled = w.engine->reconcileRun(created.id, options);
        const auto stalled_run = *w.store->getRun(created.id);
        REBALEX_EXPECT(stalled.status_after == RunStatus::STALLED, "stalled");
        REBALEX_EXPECT(stalled_run.stalled_reason == "leader_submit_pending", "stall reason");
        REBALEX_EXPECT(stalled_run.message == "stalled:leader_submit_pending", "stall message");

        w.clock->advance(15000);
        test::writeOpenOrders(w.root, w.clock->nowMs());
        test::writeHoldings(w.root, w.clock->nowMs(), {});
        const auto resumed = w.engine->reconcileRun(created.id, options);
        const auto resumed_run = *w.store->getRun(created.id);
        REBALEX_EXPECT(resumed.fallback_triggered && resumed.auto_resumed, "fallback resumed the run");
        REBALEX_EXPECT(resumed_run.status == RunStatus::RUNNING, "running again");
        REBALEX_EXPECT(resumed_run.message == "submitted_short_lived_fallback", "fallback message");
        REBALEX_EXPECT(resumed_run.submission.auto_resumed_at_ms == w.clock->nowMs(), "auto resume time");
        REBALEX_EXPECT(resumed_run.stalled_at_ms == 0 && resumed_run.stalled_reason.empty(), "stall cleared");

        // a late leader answer for the superseded command is provenance only
        const auto superseded = *w.store->getOrder(order.id);
        test::writeJson(w.root / "command_results" / (superseded.submit_command.command_id + ".json"),
                        {{"status", "submitted"}, {"broker_order_id", "L1"}});
        w.engine->reconcileRun(created.id, options);
        const auto late = *w.store->getOrder(order.id);
        REBALEX_EXPECT(late.status == OrderStatus::NEW, "late result does not advance");
        REBALEX_EXPECT(late.provenance.value("late_leader_status", std::string()) == "submitted", "late result recorded");
        REBALEX_EXPECT(late.broker_order_id.empty(), "late broker id ignored");
    }

    // 6. Stalled past the caller's deadline
    {
        execution::ReconcileOptions options = w.options;
        options.stall_window_ms = 30000;
        const long long t0 = w.clock->nowMs();

        core::Run row;
        row.status = RunStatus::RUNNING;
        row.started_at_ms = t0;
        row.submission.channel = SubmissionChannel::LEADER;
        row.deadline_ms = t0 + 60000;
        const auto run = w.store->createRun(row);
        const auto live = place(w, run.id, "oi_D1", "AMD", 10.0, [&](core::Order& o) {
            submittedVia("leader_command", t0)(o);
            o.broker_order_id = "B6";
        });
        const auto never = place(w, run.id, "oi_D2", "INTC", 10.0, [](core::Order&) {});

        w.clock->advance(30000);
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_D1", "AMD")});
        const auto stalled = w.engine->reconcileRun(run.id, options);
        REBALEX_EXPECT(stalled.status_after == RunStatus::STALLED, "stalled without progress");
        REBALEX_EXPECT(w.store->getRun(run.id)->stalled_reason == "no_progress", "no progress reason");

        w.clock->advance(29999);
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_D1", "AMD")});
        REBALEX_EXPECT(w.engine->reconcileRun(run.id, options).status_after == RunStatus::STALLED, "before deadline");

        w.clock->advance(1);
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_D1", "AMD")});
        const int cancels_before = test::countFiles(w.root / "commands");
        const auto expired = w.engine->reconcileRun(run.id, options);
        const auto failed = *w.store->getRun(run.id);
        REBALEX_EXPECT(expired.status_after == RunStatus::FAILED, "deadline fails the run");
        REBALEX_EXPECT(failed.failure_code == "stall_deadline_exceeded", "deadline failure code");
        REBALEX_EXPECT(w.store->getOrder(live.id)->status == OrderStatus::CANCELED, "live order canceled");
        REBALEX_EXPECT(w.store->getOrder(never.id)->status == OrderStatus::REJECTED, "new order rejected");
        REBALEX_EXPECT(test::countFiles(w.root / "commands") == cancels_before + 1, "cancel command written");
    }

    // 7. Missing from open orders: low-confidence, recoverable inside the window
    {
        execution::ReconcileOptions options = w.options;
        options.low_confidence_recovery_window_ms = 5 * 60 * 1000;
        const long long t0 = w.clock->nowMs();
        const auto run = makeRunningRun(w, SubmissionChannel::LEADER);
        const auto gone = place(w, run.id, "oi_L1", "ORCL", 10.0, submittedVia("leader_command", t0));
        place(w, run.id, "oi_L2", "CSCO", 10.0, submittedVia("leader_command", t0));

        w.clock->advance(options.active_order_missing_grace_ms - 1);
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_L2", "CSCO")});
        w.engine->reconcileRun(run.id, options);
        REBALEX_EXPECT(w.store->getOrder(gone.id)->status == OrderStatus::SUBMITTED, "inside missing grace");

        w.clock->advance(1);
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_L2", "CSCO")});
        const auto marked = w.engine->reconcileRun(run.id, options);
        const auto canceled = *w.store->getOrder(gone.id);
        REBALEX_EXPECT(marked.low_confidence_marked == 1, "marked low confidence");
        REBALEX_EXPECT(canceled.status == OrderStatus::CANCELED && canceled.low_confidence, "low-confidence cancel");
        REBALEX_EXPECT(canceled.low_confidence_reason == "missing_from_open_orders", "low-confidence reason");

        w.clock->advance(60000);
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_L1", "ORCL"), openItem("oi_L2", "CSCO")});
        const auto recovered = w.engine->reconcileRun(run.id, options);
        const auto back = *w.store->getOrder(gone.id);
        REBALEX_EXPECT(recovered.recovered == 1, "recovered");
        REBALEX_EXPECT(back.status == OrderStatus::SUBMITTED && !back.low_confidence, "back to submitted");

        // missing again, then seen only after the recovery window closed
        w.clock->advance(1000);
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_L2", "CSCO")});
        w.engine->reconcileRun(run.id, options);
        REBALEX_EXPECT(w.store->getOrder(gone.id)->status == OrderStatus::CANCELED, "canceled again");
        w.clock->advance(options.low_confidence_recovery_window_ms + 1);
        test::writeOpenOrders(w.root, w.clock->nowMs(), {openItem("oi_L1", "ORCL"), openItem("oi_L2", "CSCO")});
        w.engine->reconcileRun(run.id, options);
        REBALEX_EXPECT(w.store->getOrder(gone.id)->status == OrderStatus::CANCELED, "window closed");
    }

    // 8. Free-standing orders and command results
    {
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        core::Order direct;
        direct.client_order_id = "mo_free_1";
        direct.symbol = "QQQ";
        direct.quantity = 3.0;
        const auto row = w.store->createOrder(direct).order;
        const auto sent = w.dispatcher->submitDirectOrder(row);
        REBALEX_EXPECT(sent.ok, "direct order via leader");
        const auto pending = *w.store->getOrder(row.id);
        REBALEX_EXPECT(pending.submit_command.pending && pending.submit_command.source == "direct", "direct pending");

        test::writeJson(w.root / "command_results" / (pending.submit_command.command_id + ".json"),
                        {{"status", "Rejected"}, {"reason", "bad_symbol"}});
        test::writeOpenOrders(w.root, w.clock->nowMs());
        REBALEX_EXPECT(w.engine->reconcileFreeOrders(w.options) > 0, "free order updated");
        const auto rejected = *w.store->getOrder(row.id);
        REBALEX_EXPECT(rejected.status == OrderStatus::REJECTED, "command rejection");
        REBALEX_EXPECT(rejected.rejected_reason == "leader_command_rejected:bad_symbol", "rejection reason");
        REBALEX_EXPECT(w.engine->reconcileFreeOrders(w.options) == 0, "second pass idle");
    }

    // 10. A run closed by a low-confidence cancel takes a late fill inside the recovery window
    {
        execution::ReconcileOptions options = w.options;
        options.low_confidence_recovery_window_ms = 5 * 60 * 1000;
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        const long long t0 = w.clock->nowMs();
        const auto run = makeRunningRun(w, SubmissionChannel::LEADER);
        const auto only = place(w, run.id, "oi_F1", "NVDA", 10.0, submittedVia("leader_command", t0));

        w.clock->advance(options.active_order_missing_grace_ms);
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        test::writeOpenOrders(w.root, w.clock->nowMs());
        const auto closed = w.engine->reconcileRun(run.id, options);
        const auto canceled = *w.store->getOrder(only.id);
        REBALEX_EXPECT(canceled.status == OrderStatus::CANCELED && canceled.low_confidence, "low-confidence cancel");
        REBALEX_EXPECT(closed.status_after == RunStatus::FAILED, "run fails without fills");
        REBALEX_EXPECT(w.engine->needsFollowUp(*w.store->getRun(run.id), options), "closed run needs follow-up");

        w.clock->advance(30000);
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        test::writeOpenOrders(w.root, w.clock->nowMs());
        test::appendLine(w.root / "execution_events.jsonl",
                         R"({"event_id":"evF1","tag":"oi_F1","status":"Filled","filled":10,"price":120.0})");
        const auto revised = w.engine->reconcileRun(run.id, options);
        const auto filled = *w.store->getOrder(only.id);
        const auto after = *w.store->getRun(run.id);
        REBALEX_EXPECT(revised.events_applied == 1, "late event applied");
        REBALEX_EXPECT(filled.status == OrderStatus::FILLED && filled.filled_quantity == 10.0, "order recovered");
        REBALEX_EXPECT(!filled.low_confidence, "confidence restored");
        REBALEX_EXPECT(w.store->listFills(only.id).size() == 1, "one fill");
        REBALEX_EXPECT(after.status == RunStatus::FAILED, "closed status kept");
        REBALEX_EXPECT(after.completion.with_fills == 1 && after.completion.filled == 1, "completion revised");
        REBALEX_EXPECT(after.extras.contains("completion_revised_at_ms"), "revision stamped");

        const auto repeat = w.engine->reconcileRun(run.id, options);
        REBALEX_EXPECT(!repeat.changed(), "second pass idle");
        REBALEX_EXPECT(!w.engine->needsFollowUp(*w.store->getRun(run.id), options), "nothing left to recover");
    }

    // 11. Once the window closes the closed run is left alone
    {
        execution::ReconcileOptions options = w.options;
        options.low_confidence_recovery_window_ms = 60000;
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        const long long t0 = w.clock->nowMs();
        const auto run = makeRunningRun(w, SubmissionChannel::LEADER);
        const auto only = place(w, run.id, "oi_F2", "AMZN", 5.0, submittedVia("leader_command", t0));

        w.clock->advance(options.active_order_missing_grace_ms);
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        test::writeOpenOrders(w.root, w.clock->nowMs());
        w.engine->reconcileRun(run.id, options);
        REBALEX_EXPECT(w.store->getRun(run.id)->status == RunStatus::FAILED, "failed");

        w.clock->advance(options.low_confidence_recovery_window_ms + 1);
        REBALEX_EXPECT(!w.engine->needsFollowUp(*w.store->getRun(run.id), options), "window closed");
        test::writeHealthyBridge(w.root, w.clock->nowMs());
        test::appendLine(w.root / "execution_events.jsonl",
                         R"({"event_id":"evF2","tag":"oi_F2","status":"Filled","filled":5,"price":180.0})");
        w.engine->reconcileRun(run.id, options);
        REBALEX_EXPECT(w.store->getOrder(only.id)->status == OrderStatus::CANCELED, "late fill ignored");
        REBALEX_EXPECT(w.store->getRun(run.id)->completion.with_fills == 0, "completion unchanged");
    }

    // 9. Session log parsing
    {
        std::vector<std::string> affected;
        REBALEX_EXPECT(execution::ReconciliationEngine::detectSessionFault({"all good"}, affected).empty(), "clean log");
        const auto code = execution::ReconciliationEngine::detectSessionFault(
            {"TARGETS_ALREADY_HELD symbols=aapl, MSFT", "ok"}, affected);
        REBALEX_EXPECT(code == "targets_already_held" && affected.size() == 1 && affected[0] == "AAPL",
                       "symbol list ends at whitespace");
        REBALEX_EXPECT(execution::ReconciliationEngine::fillToken(1, "holdings", "1.000000") ==
                       execution::ReconciliationEngine::fillToken(1, "holdings", "1.000000"), "fill token stable");
        REBALEX_EXPECT(execution::ReconciliationEngine::fillToken(1, "holdings", "1.000000").size() == 64, "sha256 hex");
    }

    std::error_code ec;
    std::filesystem::remove_all(w.dir, ec);
    std::cout << "[TEST] ReconciliationEngine PASSED\n";
    return 0;
}
