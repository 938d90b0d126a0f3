#include "engine/ExecutionEngine.h"

#include <filesystem>

#include "bridge/FileBrokerBridge.h"
#include "common/Logger.h"
#include "core/adapters/FileRiskHaltGuard.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/ExecutionStoreJson.h"
#include "execution/PosixProcessLauncher.h"
#include "execution/ProcessLifecycleManager.h"
#include "execution/RateLimiter.h"
#include "execution/ReconciliationEngine.h"
#include "execution/SubmissionDispatcher.h"
#include "risk/RiskGate.h"

namespace rebalex {
namespace engine {

ExecutionEngine::ExecutionEngine(const EngineConfig& config, std::shared_ptr<const IClock> clock)
    : config_(config),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    const std::filesystem::path state_dir(config_.paths.state_dir);
    std::filesystem::create_directories(state_dir);
    std::filesystem::create_directories(config_.dispatch.lock_dir);

    store_ = std::make_shared<core::ExecutionStoreJson>(state_dir / config_.store_file, clock_);
    journal_ = std::make_shared<core::EventJournalJsonl>(state_dir / config_.journal_file);

    auto bridge_options = config_.bridge;
    bridge_options.root = config_.paths.bridge_root;
    bridge_ = std::make_shared<bridge::FileBrokerBridge>(bridge_options, clock_);

    auto guard = std::make_shared<core::FileRiskHaltGuard>(state_dir / config_.guard_state_file);
    auto risk_gate = std::make_shared<risk::RiskGate>(config_.risk, guard);

    auto processes = std::make_shared<execution::ProcessLifecycleManager>(
        std::make_shared<execution::PosixProcessLauncher>(), clock_, config_.process);
    auto limiter = std::make_shared<execution::RateLimiter>(clock_);
    auto dispatcher = std::make_shared<execution::SubmissionDispatcher>(
        store_, bridge_, processes, limiter, journal_, clock_, config_.dispatch);
    auto reconciler = std::make_shared<execution::ReconciliationEngine>(
        store_, bridge_, dispatcher, processes, journal_, clock_);

    core::CoordinatorOptions options;
    options.default_sizing = config_.sizing;
    options.reconcile = config_.reconcile;
    options.market_session = config_.market_session;
    options.auto_recovery = config_.auto_recovery;
    options.quote_stale_ms = config_.quote_stale_ms;
    options.lock_dir = config_.dispatch.lock_dir;

    coordinator_ = std::make_shared<core::TradeRunCoordinator>(
        store_, bridge_, risk_gate, dispatcher, reconciler, journal_, clock_, options);

    LOG_INFO("execution engine ready (bridge {}, state {})", config_.paths.bridge_root, config_.paths.state_dir);
}

ExecutionEngine::~ExecutionEngine() {
    stopScheduler();
}

bool ExecutionEngine::startScheduler() {
    if (!config_.scheduler.enabled) {
        LOG_WARN("scheduler disabled in config");
        return false;
    }
    if (!scheduler_) {
        scheduler_ = std::make_unique<core::ReconcileScheduler>(coordinator_, config_.scheduler.interval_ms);
    }
    return scheduler_->start();
}

void ExecutionEngine::stopScheduler() {
    if (scheduler_) {
        scheduler_->stop();
    }
}

} // namespace engine
} // namespace rebalex
