#include "common/Config.h"
#include "common/LotSizeHelper.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace rebalex {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

template <typename T>
void readOptional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

// "09:30" -> 570
int parseClockMinute(const std::string& text, int fallback) {
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        return fallback;
    }
    try {
        const int hours = std::stoi(text.substr(0, colon));
        const int minutes = std::stoi(text.substr(colon + 1));
        if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
            return fallback;
        }
        return hours * 60 + minutes;
    } catch (const std::exception&) {
        return fallback;
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    if (!std::filesystem::exists(config_path)) {
        std::cout << "config not found: " << config_path.string() << ", using defaults" << std::endl;
        applyEnvironmentOverrides();
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("config_invalid: cannot open " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("config_invalid: ") + e.what());
    }

    loadFromJson(j);
    applyEnvironmentOverrides();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loaded_path_ = config_path.string();
    }
    std::cout << "config loaded: " << config_path.string() << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::EngineConfig cfg;
    std::string log_level = "info";

    try {
        if (j.contains("paths")) {
            const auto& p = j["paths"];
            cfg.paths.bridge_root = p.value("bridge_root", cfg.paths.bridge_root);
            cfg.paths.state_dir = p.value("state_dir", cfg.paths.state_dir);
            cfg.paths.log_dir = p.value("log_dir", cfg.paths.log_dir);
            cfg.paths.data_root = p.value("data_root", cfg.paths.data_root);
        }
        log_level = j.value("log_level", log_level);

        if (j.contains("sizing")) {
            const auto& s = j["sizing"];
            cfg.sizing.lot_size = s.value("lot_size", cfg.sizing.lot_size);
            cfg.sizing.min_qty = s.value("min_qty", cfg.sizing.min_qty);
            cfg.sizing.cash_buffer_ratio = s.value("cash_buffer_ratio", cfg.sizing.cash_buffer_ratio);
            const auto type = common::parseOrderType(s.value("order_type", std::string("MKT")));
            if (!type) {
                throw std::invalid_argument("order_type_invalid");
            }
            cfg.sizing.order_type = *type;
            cfg.sizing.outside_rth = s.value("outside_rth", cfg.sizing.outside_rth);
            cfg.sizing.execution_session = s.value("execution_session", cfg.sizing.execution_session);
        }

        if (j.contains("risk")) {
            const auto& r = j["risk"];
            readOptional(r, "max_order_notional", cfg.risk.max_order_notional);
            readOptional(r, "max_position_ratio", cfg.risk.max_position_ratio);
            readOptional(r, "max_total_notional", cfg.risk.max_total_notional);
            readOptional(r, "max_symbols", cfg.risk.max_symbols);
            readOptional(r, "min_cash_buffer_ratio", cfg.risk.min_cash_buffer_ratio);
            cfg.guard_state_file = r.value("guard_state_file", cfg.guard_state_file);
        }

        if (j.contains("bridge")) {
            const auto& b = j["bridge"];
            cfg.bridge.heartbeat_stale_ms = b.value("heartbeat_stale_ms", cfg.bridge.heartbeat_stale_ms);
            cfg.quote_stale_ms = b.value("quote_stale_ms", cfg.quote_stale_ms);
        }

        if (j.contains("dispatch")) {
            const auto& d = j["dispatch"];
            auto& o = cfg.dispatch;
            o.leader_command_stale_ms = d.value("leader_command_stale_ms", o.leader_command_stale_ms);
            o.leader_pending_timeout_ms = d.value("leader_pending_timeout_ms", o.leader_pending_timeout_ms);
            o.command_expiry_ms = d.value("command_expiry_ms", o.command_expiry_ms);
            o.prefer_leader = d.value("prefer_leader", o.prefer_leader);
            if (d.contains("launcher_command")) {
                o.launcher_command = d["launcher_command"].get<std::vector<std::string>>();
            }
            o.working_dir = d.value("working_dir", o.working_dir);
            o.exit_on_submit = d.value("exit_on_submit", o.exit_on_submit);
            if (d.value("keep_resident", false)) {
                o.exit_on_submit = false;
                o.manage_unfilled = true;
            }
            o.manage_unfilled = d.value("manage_unfilled", o.manage_unfilled);
            o.unfilled_timeout_ms = d.value("unfilled_timeout_ms", o.unfilled_timeout_ms);
            o.reprice_policy = d.value("reprice_policy", o.reprice_policy);
            o.commission_per_share = d.value("commission_per_share", o.commission_per_share);
            o.slippage_bps = d.value("slippage_bps", o.slippage_bps);
            o.launch_limit_per_window = d.value("launch_limit_per_window", o.launch_limit_per_window);
            o.launch_window_ms = d.value("launch_window_ms", o.launch_window_ms);
            cfg.process.terminate_grace_ms = d.value("terminate_grace_ms", cfg.process.terminate_grace_ms);
        }

        if (j.contains("reconcile")) {
            const auto& r = j["reconcile"];
            auto& o = cfg.reconcile;
            o.open_orders_fresh_ms = r.value("open_orders_fresh_ms", o.open_orders_fresh_ms);
            o.holdings_fresh_ms = r.value("holdings_fresh_ms", o.holdings_fresh_ms);
            o.new_order_missing_grace_ms = r.value("new_order_missing_grace_ms", o.new_order_missing_grace_ms);
            o.active_order_missing_grace_ms = r.value("active_order_missing_grace_ms", o.active_order_missing_grace_ms);
            o.fallback_missing_grace_ms = r.value("fallback_missing_grace_ms", o.fallback_missing_grace_ms);
            o.low_confidence_recovery_window_ms =
                r.value("low_confidence_recovery_window_ms", o.low_confidence_recovery_window_ms);
            o.stall_window_ms = r.value("stall_window_ms", o.stall_window_ms);
            o.ingest_leader_events = r.value("ingest_leader_events", o.ingest_leader_events);
            o.infer_fills_from_holdings = r.value("infer_fills_from_holdings", o.infer_fills_from_holdings);
            o.escalate_pending = r.value("escalate_pending", o.escalate_pending);

            if (r.contains("market_session")) {
                const auto& m = r["market_session"];
                auto& session = cfg.market_session;
                session.open_minute = parseClockMinute(m.value("open", std::string("09:30")), session.open_minute);
                session.close_minute = parseClockMinute(m.value("close", std::string("16:00")), session.close_minute);
                session.utc_offset_minutes = m.value("utc_offset_minutes", session.utc_offset_minutes);
                session.weekdays_only = m.value("weekdays_only", session.weekdays_only);
            }
        }

        if (j.contains("auto_recovery")) {
            const auto& a = j["auto_recovery"];
            auto& o = cfg.auto_recovery;
            o.enabled = a.value("enabled", o.enabled);
            o.new_timeout_ms = static_cast<long long>(
                a.value("new_timeout_seconds", static_cast<double>(o.new_timeout_ms) / 1000.0) * 1000.0);
            o.max_auto_retries = a.value("max_auto_retries", o.max_auto_retries);
            o.max_price_deviation_pct = a.value("max_price_deviation_pct", o.max_price_deviation_pct);
            o.allow_replace_outside_rth = a.value("allow_replace_outside_rth", o.allow_replace_outside_rth);
            if (o.new_timeout_ms <= 0) {
                throw std::invalid_argument("auto_recovery.new_timeout_seconds must be positive");
            }
            if (o.max_auto_retries < 0) {
                throw std::invalid_argument("auto_recovery.max_auto_retries must not be negative");
            }
        }

        if (j.contains("scheduler")) {
            const auto& s = j["scheduler"];
            cfg.scheduler.enabled = s.value("enabled", cfg.scheduler.enabled);
            cfg.scheduler.interval_ms = s.value("interval_ms", cfg.scheduler.interval_ms);
            if (cfg.scheduler.interval_ms <= 0) {
                throw std::invalid_argument("scheduler.interval_ms must be positive");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("config_invalid: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("config_invalid: ") + e.what());
    }

    cfg.bridge.root = cfg.paths.bridge_root;
    cfg.dispatch.lock_dir = std::filesystem::path(cfg.paths.data_root) / "locks";

    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_ = cfg;
    log_level_ = log_level;
}

void Config::applyEnvironmentOverrides() {
    const std::string bridge_root = readEnvVar("REBALEX_BRIDGE_ROOT");
    const std::string state_dir = readEnvVar("REBALEX_STATE_DIR");

    std::lock_guard<std::mutex> lock(mutex_);
    if (!bridge_root.empty()) {
        engine_config_.paths.bridge_root = bridge_root;
        engine_config_.bridge.root = bridge_root;
    }
    if (!state_dir.empty()) {
        engine_config_.paths.state_dir = state_dir;
    }
}

engine::EngineConfig Config::getEngineConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_config_;
}

void Config::setEngineConfig(const engine::EngineConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    engine_config_ = config;
}

std::string Config::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_level_;
}

std::string Config::getLoadedPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_path_;
}

} // namespace rebalex
