#pragma once

#include <string>

#include "bridge/FileBrokerBridge.h"
#include "common/TimeUtils.h"
#include "core/orchestration/TradeRunCoordinator.h"
#include "core/model/ExecutionTypes.h"
#include "execution/ProcessLifecycleManager.h"
#include "execution/ReconciliationEngine.h"
#include "execution/SubmissionDispatcher.h"
#include "risk/RiskGate.h"

namespace rebalex {
namespace engine {

struct PathsConfig {
    std::string bridge_root = "bridge";
    std::string state_dir = "state";
    std::string log_dir = "logs";
    std::string data_root = "data";
};

struct SchedulerConfig {
    bool enabled = true;
    long long interval_ms = 30000;
};

// Everything the coordinator and the scheduler need, resolved from
// config/config.json plus environment overrides.
struct EngineConfig {
    PathsConfig paths;
    core::SizingConfig sizing;
    risk::RiskLimits risk;
    bridge::BridgeOptions bridge;
    execution::DispatchOptions dispatch;
    execution::ProcessOptions process;
    execution::ReconcileOptions reconcile;
    utils::MarketSession market_session;
    SchedulerConfig scheduler;
    core::AutoRecoveryOptions auto_recovery;

    long long quote_stale_ms = 60000;
    std::string guard_state_file = "guard_state.json";   // under state_dir
    std::string store_file = "execution_store.json";     // under state_dir
    std::string journal_file = "execution_journal.jsonl"; // under state_dir
};

} // namespace engine
} // namespace rebalex
