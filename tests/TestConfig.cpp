#include "common/Config.h"
#include "common/Logger.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "TestSupport.h"

int main() {
    using namespace rebalex;

    spdlog::set_level(spdlog::level::debug);

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();

    // 1. Explicit document
    {
        nlohmann::json j = {
            {"log_level", "debug"},
            {"paths", {{"bridge_root", "/srv/bridge"}, {"state_dir", "/srv/state"}, {"data_root", "/srv/data"}}},
            {"sizing", {{"lot_size", 10}, {"order_type", "adaptive"}, {"cash_buffer_ratio", 0.02}}},
            {"risk", {{"max_order_notional", 50000}, {"max_symbols", 5}}},
            {"dispatch", {{"keep_resident", true}, {"leader_pending_timeout_ms", 30000},
                          {"launcher_command", {"session", "{run_id}"}}}},
            {"reconcile", {{"stall_window_ms", 600000},
                           {"market_session", {{"open", "10:00"}, {"close", "15:30"}, {"utc_offset_minutes", -240}}}}},
            {"scheduler", {{"interval_ms", 5000}}},
            {"auto_recovery", {{"enabled", true}, {"new_timeout_seconds", 90}, {"max_auto_retries", 2},
                               {"allow_replace_outside_rth", true}}}
        };
        config.loadFromJson(j);
        const auto cfg = config.getEngineConfig();

        REBALEX_EXPECT(config.getLogLevel() == "debug", "log level");
        REBALEX_EXPECT(cfg.paths.bridge_root == "/srv/bridge", "bridge root");
        REBALEX_EXPECT(cfg.bridge.root == std::filesystem::path("/srv/bridge"), "bridge options follow paths");
        REBALEX_EXPECT(cfg.dispatch.lock_dir == std::filesystem::path("/srv/data/locks"), "lock dir under data root");
        REBALEX_EXPECT(cfg.sizing.lot_size == 10, "lot size");
        REBALEX_EXPECT(cfg.sizing.order_type == OrderType::ADAPTIVE_LMT, "order type alias");
        REBALEX_EXPECT(cfg.risk.max_order_notional && *cfg.risk.max_order_notional == 50000.0, "max order notional");
        REBALEX_EXPECT(cfg.risk.max_symbols && *cfg.risk.max_symbols == 5, "max symbols");
        REBALEX_EXPECT(!cfg.risk.max_total_notional, "unset limit stays empty");
        REBALEX_EXPECT(!cfg.dispatch.exit_on_submit && cfg.dispatch.manage_unfilled, "keep resident");
        REBALEX_EXPECT(cfg.dispatch.leader_pending_timeout_ms == 30000, "pending timeout");
        REBALEX_EXPECT(cfg.dispatch.launcher_command.size() == 2, "launcher command");
        REBALEX_EXPECT(cfg.reconcile.stall_window_ms == 600000, "stall window");
        REBALEX_EXPECT(cfg.market_session.open_minute == 600, "session open");
        REBALEX_EXPECT(cfg.market_session.close_minute == 930, "session close");
        REBALEX_EXPECT(cfg.market_session.utc_offset_minutes == -240, "session offset");
        REBALEX_EXPECT(cfg.scheduler.interval_ms == 5000, "scheduler interval");
        REBALEX_EXPECT(cfg.auto_recovery.enabled && cfg.auto_recovery.new_timeout_ms == 90000, "recovery timeout");
        REBALEX_EXPECT(cfg.auto_recovery.max_auto_retries == 2, "recovery retries");
        REBALEX_EXPECT(cfg.auto_recovery.max_price_deviation_pct == 1.5, "deviation default kept");
        REBALEX_EXPECT(cfg.auto_recovery.allow_replace_outside_rth, "outside hours flag");
    }

    // 2. Invalid values are rejected and keep the previous configuration
    {
        bool threw = false;
        try {
            config.loadFromJson({{"sizing", {{"order_type", "STOP"}}}});
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).rfind("config_invalid", 0) == 0;
        }
        REBALEX_EXPECT(threw, "unknown order type rejected");
        REBALEX_EXPECT(config.getEngineConfig().sizing.lot_size == 10, "previous config kept");

        threw = false;
        try {
            config.loadFromJson({{"scheduler", {{"interval_ms", 0}}}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        REBALEX_EXPECT(threw, "zero scheduler interval rejected");

        threw = false;
        try {
            config.loadFromJson({{"auto_recovery", {{"new_timeout_seconds", 0}}}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        REBALEX_EXPECT(threw, "zero recovery timeout rejected");

        threw = false;
        try {
            config.loadFromJson({{"sizing", {{"lot_size", "ten"}}}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        REBALEX_EXPECT(threw, "wrong value type rejected");
    }

    // 3. Files and environment overrides
    {
        const auto dir = test::makeTempDir("config");
        const auto good = dir / "config.json";
        test::writeJson(good, {{"paths", {{"bridge_root", "/from/file"}}}});

        ::setenv("REBALEX_STATE_DIR", " /from/env ", 1);
        config.load(good.string());
        ::unsetenv("REBALEX_STATE_DIR");

        const auto cfg = config.getEngineConfig();
        REBALEX_EXPECT(cfg.paths.bridge_root == "/from/file", "file value");
        REBALEX_EXPECT(cfg.paths.state_dir == "/from/env", "env override trimmed");
        REBALEX_EXPECT(config.getLoadedPath() == good.string(), "loaded path");

        const auto bad = dir / "broken.json";
        {
            std::ofstream out(bad);
            out << "{ not json";
        }
        bool threw = false;
        try {
            config.load(bad.string());
        } catch (const std::runtime_error&) {
            threw = true;
        }
        REBALEX_EXPECT(threw, "malformed file rejected");

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
