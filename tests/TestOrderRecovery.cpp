#include "core/orchestration/TradeRunCoordinator.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "bridge/FileBrokerBridge.h"
#include "core/adapters/FileRiskHaltGuard.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/ExecutionStoreJson.h"
#include "TestSupport.h"

using namespace rebalex;

namespace {
template <typename Fn>
std::string errorOf(Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        return e.what();
    }
    return std::string();
}

struct Harness {
    explicit Harness(const std::string& name, core::AutoRecoveryOptions recovery = core::AutoRecoveryOptions{})
        : dir(test::makeTempDir(name)),
          root(dir / "bridge"),
          clock(std::make_shared<ManualClock>(test::kMarketMorningMs)) {
        store = std::make_shared<core::ExecutionStoreJson>(dir / "state" / "execution_store.json", clock);
        bridge = std::make_shared<bridge::FileBrokerBridge>(bridge::BridgeOptions{root, 10000}, clock);
        auto launcher = std::make_shared<test::FakeProcessLauncher>();
        auto processes = std::make_shared<execution::ProcessLifecycleManager>(
            launcher, clock, execution::ProcessOptions{});
        auto limiter = std::make_shared<execution::RateLimiter>(clock);
        journal = std::make_shared<core::EventJournalJsonl>(dir / "state" / "execution_journal.jsonl");

        execution::DispatchOptions dispatch;
        dispatch.launcher_command = {"broker-session", "--run-id", "{run_id}"};
        dispatch.lock_dir = dir / "locks";
        auto dispatcher = std::make_shared<execution::SubmissionDispatcher>(
            store, bridge, processes, limiter, journal, clock, dispatch);
        auto reconciler = std::make_shared<execution::ReconciliationEngine>(
            store, bridge, dispatcher, processes, journal, clock);
        auto gate = std::make_shared<risk::RiskGate>(
            risk::RiskLimits{}, std::make_shared<core::FileRiskHaltGuard>(dir / "guard.json"));

        core::CoordinatorOptions options;
        options.lock_dir = dir / "locks";
        options.auto_recovery = recovery;
        coordinator = std::make_unique<core::TradeRunCoordinator>(
            store, bridge, gate, dispatcher, reconciler, journal, clock, options);
        refresh();
    }

    ~Harness() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void refresh() {
        test::writeHealthyBridge(root, clock->nowMs());
        test::writeHoldings(root, clock->nowMs(), {});
        test::writeQuotes(root, clock->nowMs(), {{"AAPL", 50.0}, {"MSFT", 40.0}});
    }

    // moves past the NEW timeout with fresh bridge snapshots
    void age(long long ms = 46000) {
        clock->advance(ms);
        refresh();
    }

    core::Order direct(const std::string& client_id, const std::string& symbol,
                       std::optional<double> limit = std::nullopt) {
        core::OrderRequest request;
        request.client_order_id = client_id;
        request.symbol = symbol;
        request.quantity = 5.0;
        if (limit) {
            request.order_type = "LMT";
            request.limit_price = limit;
        }
        return coordinator->createDirectOrder(request).order;
    }

    void writeCommandResult(const std::string& command_id, const std::string& status) {
        test::writeJson(root / "command_results" / (command_id + ".json"),
                        {{"command_id", command_id}, {"status", status}, {"processed_at", clock->nowMs()}});
    }

    std::filesystem::path dir;
    std::filesystem::path root;
    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<core::ExecutionStoreJson> store;
    std::shared_ptr<bridge::FileBrokerBridge> bridge;
    std::shared_ptr<core::EventJournalJsonl> journal;
    std::unique_ptr<core::TradeRunCoordinator> coordinator;
};

core::AutoRecoveryOptions recoveryOn() {
    core::AutoRecoveryOptions recovery;
    recovery.enabled = true;
    return recovery;
}

int cancelRequests() {
    Harness h("cancel_requests");

    // Confirmed by the leader
    {
        const auto order = h.direct("dir-c1", "AAPL");
        REBALEX_EXPECT(order.submit_command.pending, "submitted through leader");

        const auto first = h.coordinator->cancelOrder("dir-c1", "ops");
        REBALEX_EXPECT(!first.noop && first.command_id.rfind("cxl_", 0) == 0, "cancel command written");
        REBALEX_EXPECT(first.order.cancel_request.status == "requested", "request recorded");
        REBALEX_EXPECT(first.order.cancel_request.actor == "ops", "actor recorded");
        REBALEX_EXPECT(first.order.submit_command.status == "withdrawn" && !first.order.submit_command.pending,
                       "submit command withdrawn");
        REBALEX_EXPECT(std::filesystem::exists(h.root / "commands" / (first.command_id + ".json")),
                       "cancel command on disk");

        const auto again = h.coordinator->cancelOrder("dir-c1", "ops");
        REBALEX_EXPECT(again.command_id == first.command_id && again.reason == "cancel_already_requested",
                       "repeat returns the open request");

        h.writeCommandResult(first.command_id, "ok");
        h.coordinator->reconcileActiveRuns();
        const auto row = *h.store->getOrder(order.id);
        REBALEX_EXPECT(row.status == OrderStatus::CANCELED && !row.low_confidence, "canceled");
        REBALEX_EXPECT(row.provenance.value("sync_reason", std::string()) == "cancel_command_ok", "sync reason");
        REBALEX_EXPECT(row.cancel_request.status == "completed" && row.cancel_request.result_status == "ok",
                       "request completed");

        const auto terminal = h.coordinator->cancelOrder("dir-c1", "ops");
        REBALEX_EXPECT(terminal.noop && terminal.reason == "order_terminal", "terminal order is a no-op");
        REBALEX_EXPECT(terminal.order.status == OrderStatus::CANCELED, "still canceled");
    }

    // Addressed by numeric id, answered not_found
    {
        const auto order = h.direct("dir-c2", "MSFT");
        const auto requested = h.coordinator->cancelOrder(std::to_string(order.id), "");
        REBALEX_EXPECT(requested.order.cancel_request.actor == "system", "default actor");
        h.writeCommandResult(requested.command_id, "not_found");
        h.coordinator->reconcileActiveRuns();
        const auto row = *h.store->getOrder(order.id);
        REBALEX_EXPECT(row.status == OrderStatus::CANCELED, "not_found cancels");
        REBALEX_EXPECT(row.provenance.value("sync_reason", std::string()) == "cancel_command_not_found",
                       "not_found reason");
    }

    // A refused cancel leaves the order alone
    {
        const auto order = h.direct("dir-c3", "AAPL");
        const auto requested = h.coordinator->cancelOrder("dir-c3", "ops");
        h.writeCommandResult(requested.command_id, "error");
        h.coordinator->reconcileActiveRuns();
        const auto row = *h.store->getOrder(order.id);
        REBALEX_EXPECT(row.status == OrderStatus::NEW, "order not canceled");
        REBALEX_EXPECT(row.cancel_request.status == "failed" && row.cancel_request.result_status == "error",
                       "request failed");
    }

    // Unknown references and orders without a broker tag
    {
        REBALEX_EXPECT(errorOf([&] { h.coordinator->cancelOrder("nope", "ops"); }) == "order_not_found",
                       "unknown order");

        core::Order untagged;
        untagged.client_order_id = "  ";
        untagged.symbol = "AAPL";
        untagged.quantity = 1.0;
        const auto created = h.store->createOrder(untagged);
        const std::string error = errorOf([&] { h.coordinator->cancelOrder(std::to_string(created.order.id), "ops"); });
        REBALEX_EXPECT(error == "order_tag_missing", "tag required");
        REBALEX_EXPECT(h.store->getOrder(created.order.id)->cancel_request.command_id.empty(), "nothing recorded");
    }

    std::cout << "[TEST] Cancel requests PASSED\n";
    return 0;
}

int replacement() {
    Harness h("recovery_replace", recoveryOn());

    const auto order = h.direct("dir-r1", "AAPL", 50.2);
    REBALEX_EXPECT(order.submit_command.pending, "pending at leader");

    // Too young to touch
    {
        h.age(30000);
        const auto report = h.coordinator->recoverStuckOrders();
        REBALEX_EXPECT(report.scanned == 0, "inside the timeout");
    }

    h.age(16000);
    const long long triggered = h.clock->nowMs();
    const auto report = h.coordinator->recoverStuckOrders();
    REBALEX_EXPECT(report.scanned == 1 && report.cancelled == 1 && report.replaced == 1, "replaced");

    const auto original = *h.store->getOrder(order.id);
    REBALEX_EXPECT(original.status == OrderStatus::CANCELED, "original canceled");
    REBALEX_EXPECT(original.provenance.value("sync_reason", std::string()) == "auto_recovery_cancel",
                   "cancel reason");
    REBALEX_EXPECT(original.submit_command.status == "withdrawn", "original command withdrawn");
    REBALEX_EXPECT(original.auto_recovery.last_action == "replace", "last action");
    REBALEX_EXPECT(original.auto_recovery.replacement_order_id == "dir-r1-r1", "replacement linked");

    const auto fresh = h.store->findOrderByClientId("dir-r1-r1");
    REBALEX_EXPECT(fresh.has_value(), "replacement stored");
    REBALEX_EXPECT(fresh->status == OrderStatus::NEW && fresh->submit_command.pending, "replacement submitted");
    REBALEX_EXPECT(fresh->order_type == OrderType::LMT && fresh->limit_price == 50.2, "same terms");
    REBALEX_EXPECT(fresh->quantity == 5.0 && fresh->symbol == "AAPL", "same size");
    REBALEX_EXPECT(fresh->auto_recovery.attempts == 1, "attempt counted");
    REBALEX_EXPECT(fresh->auto_recovery.origin_order_id == order.id, "origin id");
    REBALEX_EXPECT(fresh->auto_recovery.origin_client_order_id == "dir-r1", "origin client id");
    REBALEX_EXPECT(fresh->auto_recovery.triggered_at_ms == triggered, "trigger time");

    // The replacement has used the only retry
    {
        h.age();
        const auto again = h.coordinator->recoverStuckOrders();
        REBALEX_EXPECT(again.scanned == 1 && again.skipped == 1 && again.replaced == 0, "no second retry");
        const auto row = *h.store->getOrder(fresh->id);
        REBALEX_EXPECT(row.status == OrderStatus::NEW, "replacement left working");
        REBALEX_EXPECT(row.auto_recovery.last_reason == "max_retries", "max retries recorded");
        REBALEX_EXPECT(!h.store->findOrderByClientId("dir-r1-r1-r2"), "no further replacement");
    }

    std::cout << "[TEST] Replacement of a stuck order PASSED\n";
    return 0;
}

int clientIdCollision() {
    Harness h("recovery_collision", recoveryOn());

    core::Order taken;
    taken.client_order_id = "dir-k1-r1";
    taken.symbol = "MSFT";
    taken.quantity = 2.0;
    const auto blocker = h.store->createOrder(taken).order;
    h.store->updateOrder(blocker.id, [](core::Order& row) {
        row.status = OrderStatus::CANCELED;
        return true;
    });

    const auto order = h.direct("dir-k1", "AAPL");
    h.age();
    const auto report = h.coordinator->recoverStuckOrders();
    REBALEX_EXPECT(report.replaced == 1, "replaced");

    const std::string expected = "dir-k1-r1-" + std::to_string(h.clock->nowMs() / 1000);
    REBALEX_EXPECT(h.store->getOrder(order.id)->auto_recovery.replacement_order_id == expected, "suffixed id");
    const auto fresh = h.store->findOrderByClientId(expected);
    REBALEX_EXPECT(fresh && fresh->symbol == "AAPL", "suffixed replacement stored");
    REBALEX_EXPECT(h.store->getOrder(blocker.id)->symbol == "MSFT", "existing order untouched");

    std::cout << "[TEST] Replacement id collision PASSED\n";
    return 0;
}

int stopConditions() {
    // Leader unreachable: nothing is canceled
    {
        Harness h("recovery_leader", recoveryOn());
        const auto order = h.direct("dir-l1", "AAPL");
        h.age();
        test::writeJson(h.root / "bridge_status.json", {
            {"status", "stopped"}, {"connected", false}, {"last_heartbeat", h.clock->nowMs()}
        });
        const auto report = h.coordinator->recoverStuckOrders();
        REBALEX_EXPECT(report.skipped == 1 && report.cancelled == 0, "stopped");
        const auto row = *h.store->getOrder(order.id);
        REBALEX_EXPECT(row.status == OrderStatus::NEW && row.submit_command.pending, "order untouched");
        REBALEX_EXPECT(row.auto_recovery.last_action == "stop", "stop recorded");
        REBALEX_EXPECT(row.auto_recovery.last_reason == "leader_unreachable", "leader reason");
    }

    // Quotes missing and outside-hours replacement not allowed
    {
        Harness h("recovery_rth", recoveryOn());
        const auto order = h.direct("dir-o1", "AAPL");
        h.age();
        std::filesystem::remove(h.root / "quotes.json");
        const auto report = h.coordinator->recoverStuckOrders();
        REBALEX_EXPECT(report.cancelled == 1 && report.replaced == 0, "canceled only");
        const auto row = *h.store->getOrder(order.id);
        REBALEX_EXPECT(row.status == OrderStatus::CANCELED, "original canceled");
        REBALEX_EXPECT(row.auto_recovery.last_reason == "outside_rth", "outside hours reason");
        REBALEX_EXPECT(!h.store->findOrderByClientId("dir-o1-r1"), "no replacement");
    }

    // Outside-hours replacement allowed
    {
        auto recovery = recoveryOn();
        recovery.allow_replace_outside_rth = true;
        Harness h("recovery_rth_allowed", recovery);
        h.direct("dir-o2", "AAPL");
        h.age();
        std::filesystem::remove(h.root / "quotes.json");
        REBALEX_EXPECT(h.coordinator->recoverStuckOrders().replaced == 1, "replaced without quotes");
        REBALEX_EXPECT(h.store->findOrderByClientId("dir-o2-r1").has_value(), "replacement stored");
    }

    // Limit orders: no price to compare, then a price that moved too far
    {
        Harness h("recovery_price", recoveryOn());
        const auto missing = h.direct("dir-p1", "ZZZ", 12.0);
        const auto moved = h.direct("dir-p2", "AAPL", 60.0);
        h.age();
        const auto report = h.coordinator->recoverStuckOrders();
        REBALEX_EXPECT(report.scanned == 2 && report.cancelled == 2 && report.replaced == 0, "both canceled");
        REBALEX_EXPECT(h.store->getOrder(missing.id)->auto_recovery.last_reason == "price_missing", "no price");
        REBALEX_EXPECT(h.store->getOrder(moved.id)->auto_recovery.last_reason == "price_deviation", "deviation");
        REBALEX_EXPECT(!h.store->findOrderByClientId("dir-p2-r1"), "no replacement");
    }

    std::cout << "[TEST] Recovery stop conditions PASSED\n";
    return 0;
}

int runOrders() {
    Harness h("recovery_run", recoveryOn());

    core::Run run;
    run.project_id = 7;
    run.status = RunStatus::RUNNING;
    const auto stored = h.store->createRun(run);

    core::Order order;
    order.run_id = stored.id;
    order.client_order_id = "oi_g1";
    order.symbol = "MSFT";
    order.quantity = 3.0;
    const auto created = h.store->createOrder(order).order;

    h.age();
    test::writeJson(h.dir / "guard.json", {{"7:paper", {{"status", "halted"}, {"reason", "drawdown"}}}});
    {
        const auto report = h.coordinator->recoverStuckOrders();
        REBALEX_EXPECT(report.skipped == 1 && report.cancelled == 0, "halted project skipped");
        const auto row = *h.store->getOrder(created.id);
        REBALEX_EXPECT(row.status == OrderStatus::NEW, "order untouched");
        REBALEX_EXPECT(row.auto_recovery.last_reason == "guard_halted", "guard reason");
    }

    test::writeJson(h.dir / "guard.json", nlohmann::json::object());
    {
        const auto report = h.coordinator->recoverStuckOrders();
        REBALEX_EXPECT(report.replaced == 1, "replaced once the guard clears");
        const auto fresh = h.store->findOrderByClientId("oi_g1-r1");
        REBALEX_EXPECT(fresh && fresh->run_id == stored.id, "replacement stays in the run");
        REBALEX_EXPECT(fresh->submit_command.pending, "submitted with the run");
        REBALEX_EXPECT(h.store->getOrder(created.id)->status == OrderStatus::CANCELED, "original canceled");
    }

    // Orders of a run that has not started are not stuck
    {
        core::Run queued;
        queued.project_id = 8;
        const auto waiting = h.store->createRun(queued);
        core::Order planned;
        planned.run_id = waiting.id;
        planned.client_order_id = "oi_q1";
        planned.symbol = "AAPL";
        planned.quantity = 1.0;
        h.store->createOrder(planned);
        h.age();
        h.coordinator->recoverStuckOrders();
        REBALEX_EXPECT(h.store->findOrderByClientId("oi_q1")->status == OrderStatus::NEW, "queued order kept");
        REBALEX_EXPECT(!h.store->findOrderByClientId("oi_q1-r1"), "queued order not replaced");
    }

    std::cout << "[TEST] Recovery of run orders PASSED\n";
    return 0;
}
}

int main() {
    if (cancelRequests() != 0 || replacement() != 0 || clientIdCollision() != 0 || stopConditions() != 0 ||
        runOrders() != 0) {
        return 1;
    }
    std::cout << "[TEST] OrderRecovery PASSED\n";
    return 0;
}
