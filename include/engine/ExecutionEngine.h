#pragma once

#include <memory>

#include "common/Clock.h"
#include "core/contracts/IBrokerBridge.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExecutionStore.h"
#include "core/orchestration/ReconcileScheduler.h"
#include "core/orchestration/TradeRunCoordinator.h"
#include "engine/EngineConfig.h"

namespace rebalex {
namespace engine {

// Owns the object graph built from an EngineConfig: store, journal, bridge,
// halt guard, risk gate, dispatcher, reconciler, coordinator and scheduler.
class ExecutionEngine {
public:
    explicit ExecutionEngine(const EngineConfig& config, std::shared_ptr<const IClock> clock = nullptr);
    ~ExecutionEngine();

    core::TradeRunCoordinator& coordinator() { return *coordinator_; }
    core::IExecutionStore& store() { return *store_; }
    core::IBrokerBridge& bridge() { return *bridge_; }

    bool startScheduler();
    void stopScheduler();

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<const IClock> clock_;
    std::shared_ptr<core::IExecutionStore> store_;
    std::shared_ptr<core::IEventJournal> journal_;
    std::shared_ptr<core::IBrokerBridge> bridge_;
    std::shared_ptr<core::TradeRunCoordinator> coordinator_;
    std::unique_ptr<core::ReconcileScheduler> scheduler_;
};

} // namespace engine
} // namespace rebalex
