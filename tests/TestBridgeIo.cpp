#include "bridge/BridgeCodec.h"
#include "bridge/FileBrokerBridge.h"
#include "common/TimeUtils.h"

#include <filesystem>
#include <iostream>

#include "TestSupport.h"

using namespace rebalex;

int main() {
    const auto root = test::makeTempDir("bridge");
    auto clock = std::make_shared<ManualClock>(test::kMarketMorningMs);
    bridge::FileBrokerBridge io(bridge::BridgeOptions{root, 10000}, clock);

    // Status and heartbeat freshness
    {
        REBALEX_EXPECT(!io.reachable(), "empty directory unreachable");
        REBALEX_EXPECT(!io.readStatus().present, "missing status");

        test::writeJson(root / "bridge_status.json", {
            {"status", "running"}, {"connected", true},
            {"last_heartbeat", utils::TimeUtils::formatIsoUtc(test::kMarketMorningMs - 2000)}, {"leader_pid", 321}
        });
        REBALEX_EXPECT(io.reachable(), "reachable with status file");
        auto status = io.readStatus();
        REBALEX_EXPECT(status.present && status.connected && !status.stale, "fresh heartbeat");
        REBALEX_EXPECT(status.leader_pid == 321, "leader pid");

        clock->advance(20000);
        REBALEX_EXPECT(io.readStatus().stale, "old heartbeat stale");
        clock->set(test::kMarketMorningMs);
    }

    // Snapshots
    {
        test::writeOpenOrders(root, test::kMarketMorningMs, {
            {{"tag", "oi_1_1"}, {"broker_order_id", 991}, {"status", "Submitted"}, {"symbol", " aapl "}},
            {{"status", "Submitted"}}
        });
        const auto open = io.readOpenOrders();
        REBALEX_EXPECT(open.present && !open.stale, "open orders fresh");
        REBALEX_EXPECT(open.items.size() == 1, "untagged symbol-less row dropped");
        REBALEX_EXPECT(open.findTag("oi_1_1") && open.findTag("oi_1_1")->broker_order_id == "991", "numeric broker id");
        REBALEX_EXPECT(open.containsSymbol("AAPL"), "symbol normalized");

        test::writeJson(root / "positions.json", {
            {"refreshed_at", test::kMarketMorningMs},
            {"items", {{{"symbol", "AAPL"}, {"quantity", 10}}, {{"symbol", "aapl"}, {"quantity", 5}, {"avg_cost", 20.0}}}}
        });
        const auto holdings = io.readHoldings();
        REBALEX_EXPECT(holdings.quantityOf("AAPL") == 15.0, "holdings aggregated by symbol");

        test::writeJson(root / "quotes.json", {{"refreshed_at", 0}, {"items", {{{"symbol", "AAPL"}, {"last", 10.0}}}}});
        REBALEX_EXPECT(io.readQuotes().stale, "quotes without refresh time are stale");
    }

    // Execution events tolerate malformed lines
    {
        test::appendLine(root / "execution_events.jsonl",
                         R"({"event_id":"e1","tag":"oi_1_1","status":"PartiallyFilled","filled":60,"price":50.5})");
        test::appendLine(root / "execution_events.jsonl", "{ garbage");
        test::appendLine(root / "execution_events.jsonl", R"({"event_id":"e2","status":"Filled"})");
        test::appendLine(root / "runs" / "run_4" / "execution_events.jsonl",
                         R"({"event_id":"r1","tag":"oi_4_1","status":"Filled","filled":10})");

        const auto leader = io.readExecutionEvents(std::nullopt);
        REBALEX_EXPECT(leader.size() == 1, "only complete events kept");
        REBALEX_EXPECT(leader[0].filled == 60.0 && leader[0].price && *leader[0].price == 50.5, "event fields");

        const auto scoped = io.readExecutionEvents(4);
        REBALEX_EXPECT(scoped.size() == 1 && scoped[0].tag == "oi_4_1", "run scoped events");
    }

    // Command queue
    {
        core::SubmitCommand submit;
        submit.command_id = "cmd_1_1";
        submit.symbol = "AAPL";
        submit.signed_quantity = -25.0;
        submit.tag = "oi_1_1";
        submit.created_at_ms = test::kMarketMorningMs;
        submit.expires_at_ms = test::kMarketMorningMs + 120000;
        REBALEX_EXPECT(io.writeSubmitCommand(submit), "submit written");

        core::SubmitCommand unsafe = submit;
        unsafe.command_id = "../escape";
        REBALEX_EXPECT(!io.writeSubmitCommand(unsafe), "unsafe command id refused");

        const auto body = test::readJson(root / "commands" / "cmd_1_1.json");
        REBALEX_EXPECT(body["type"] == "submit_order" && body["quantity"] == -25.0, "submit body");

        auto pending = io.listPendingCommands();
        REBALEX_EXPECT(pending.size() == 1 && pending[0].command_id == "cmd_1_1", "pending command listed");
        REBALEX_EXPECT(pending[0].created_at_ms == test::kMarketMorningMs, "created_at parsed");

        REBALEX_EXPECT(io.expireCommand("cmd_1_1", test::kMarketMorningMs), "expire pending command");
        const auto expired = test::readJson(root / "commands" / "cmd_1_1.json");
        REBALEX_EXPECT(expired.value("superseded", false), "superseded marker");

        test::writeJson(root / "command_results" / "cmd_1_1.json", {{"status", "submitted"}, {"broker_order_id", 77}});
        const auto result = io.readCommandResult("cmd_1_1");
        REBALEX_EXPECT(result && result->command_id == "cmd_1_1" && result->broker_order_id == "77", "command result");
        REBALEX_EXPECT(io.listPendingCommands().empty(), "answered command no longer pending");
        REBALEX_EXPECT(!io.expireCommand("cmd_1_1", test::kMarketMorningMs), "answered command not expired");
    }

    // Run artifacts
    {
        core::IntentRecord record;
        record.id = "oi_5_1";
        record.symbol = "MSFT";
        record.quantity = -3.0;
        record.order_type = OrderType::LMT;
        record.limit_price = 301.0;
        const auto path = io.writeOrderIntent(5, {record});
        REBALEX_EXPECT(path.has_value(), "intent written");
        const auto back = io.readOrderIntent(*path);
        REBALEX_EXPECT(back && back->size() == 1 && (*back)[0].symbol == "MSFT", "intent read back");
        REBALEX_EXPECT((*back)[0].order_type == OrderType::LMT && (*back)[0].quantity == -3.0, "intent fields");

        test::writeJson(root / "bad_intent.json", {{"not", "an array"}});
        REBALEX_EXPECT(!io.readOrderIntent((root / "bad_intent.json").string()), "non-array intent unusable");

        core::ExecutionParams params;
        params.unfilled_timeout_ms = 90000;
        const auto params_path = io.writeExecutionParams(5, params);
        REBALEX_EXPECT(params_path && test::readJson(*params_path)["unfilled_timeout_sec"] == 90, "params seconds");

        test::appendLine(root / "history" / "MSFT.csv", "date,close");
        test::appendLine(root / "history" / "MSFT.csv", "2026-02-26,290.5");
        test::appendLine(root / "history" / "MSFT.csv", "2026-02-27,295.25\r");
        const auto closes = io.readHistoricalCloses({"msft", "NONE"});
        REBALEX_EXPECT(closes.size() == 1 && closes.at("MSFT") == 295.25, "latest close");
    }

    // Time helpers
    {
        REBALEX_EXPECT(utils::TimeUtils::parseIsoUtcMs("2026-03-02T15:00:00Z") == test::kMarketMorningMs, "iso utc");
        REBALEX_EXPECT(utils::TimeUtils::parseIsoUtcMs("2026-03-02T10:00:00-05:00") == test::kMarketMorningMs, "iso offset");
        REBALEX_EXPECT(!utils::TimeUtils::parseIsoUtcMs("yesterday"), "garbage time");

        utils::MarketSession session;
        REBALEX_EXPECT(utils::TimeUtils::isMarketOpen(test::kMarketMorningMs, session), "monday 10:00 open");
        REBALEX_EXPECT(!utils::TimeUtils::isMarketOpen(test::kMarketMorningMs - 2 * 3600 * 1000LL, session), "08:00 closed");
        REBALEX_EXPECT(!utils::TimeUtils::isMarketOpen(test::kMarketMorningMs - 2 * 86400 * 1000LL, session), "saturday closed");
    }

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::cout << "[TEST] BridgeIo PASSED\n";
    return 0;
}
