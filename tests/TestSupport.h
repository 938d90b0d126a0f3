#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Clock.h"
#include "core/contracts/IProcessLauncher.h"

#define REBALEX_EXPECT(cond, msg)                                        \
    do {                                                                 \
        if (!(cond)) {                                                   \
            std::cerr << "[TEST] " << msg << " failed (" << #cond << ")" \
                      << " at line " << __LINE__ << "\n";                \
            return 1;                                                    \
        }                                                                \
    } while (0)

namespace rebalex {
namespace test {

// 2026-03-02 15:00:00 UTC, a Monday at 10:00 New York (fixed -05:00).
constexpr long long kMarketMorningMs = 1772463600000LL;

// Fresh scratch directory under the system temp dir.
inline std::filesystem::path makeTempDir(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() / ("rebalex_" + name + "_" + std::to_string(stamp));
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void writeJson(const std::filesystem::path& path, const nlohmann::json& body) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << body.dump(2);
}

inline void appendLine(const std::filesystem::path& path, const std::string& line) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::app);
    out << line << "\n";
}

inline nlohmann::json readJson(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    nlohmann::json j;
    in >> j;
    return j;
}

inline int countFiles(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return 0;
    }
    int count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

// Records launches instead of spawning processes.
class FakeProcessLauncher : public core::IProcessLauncher {
public:
    std::optional<int> launch(const core::LaunchSpec& spec) override {
        if (fail_launch) {
            return std::nullopt;
        }
        launches.push_back(spec);
        const int pid = next_pid++;
        alive.insert(pid);
        start_times[pid] = next_start_time++;
        return pid;
    }

    bool isAlive(int pid) override { return alive.count(pid) > 0; }

    bool signal(int pid, bool force) override {
        signals.push_back({pid, force});
        if (force || exit_on_term) {
            alive.erase(pid);
        }
        return true;
    }

    std::optional<long long> startTime(int pid) override {
        const auto it = start_times.find(pid);
        if (it == start_times.end() || alive.count(pid) == 0) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<core::LaunchSpec> launches;
    std::vector<std::pair<int, bool>> signals;
    std::set<int> alive;
    std::map<int, long long> start_times;
    int next_pid = 4100;
    long long next_start_time = 9000;
    bool fail_launch = false;
    bool exit_on_term = false;
};

// Bridge directory fixture with a fresh heartbeat and empty snapshots.
inline void writeHealthyBridge(const std::filesystem::path& root, long long now_ms, int leader_pid = 777) {
    writeJson(root / "bridge_status.json", {
        {"status", "running"}, {"connected", true}, {"last_heartbeat", now_ms}, {"leader_pid", leader_pid}
    });
}

inline void writeHoldings(const std::filesystem::path& root, long long refreshed_at_ms,
                          const std::map<std::string, double>& quantities) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [symbol, qty] : quantities) {
        items.push_back({{"symbol", symbol}, {"quantity", qty}, {"avg_cost", 10.0}});
    }
    writeJson(root / "positions.json", {{"refreshed_at", refreshed_at_ms}, {"items", items}});
}

inline void writeQuotes(const std::filesystem::path& root, long long refreshed_at_ms,
                        const std::map<std::string, double>& last_prices) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [symbol, price] : last_prices) {
        items.push_back({{"symbol", symbol}, {"last", price}, {"bid", price - 0.01}, {"ask", price + 0.01}});
    }
    writeJson(root / "quotes.json", {{"refreshed_at", refreshed_at_ms}, {"items", items}});
}

inline void writeOpenOrders(const std::filesystem::path& root, long long refreshed_at_ms,
                            const nlohmann::json& items = nlohmann::json::array()) {
    writeJson(root / "open_orders.json", {{"refreshed_at", refreshed_at_ms}, {"items", items}});
}

} // namespace test
} // namespace rebalex
