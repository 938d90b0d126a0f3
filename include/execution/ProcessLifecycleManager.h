#pragma once

#include <memory>
#include <optional>

#include "common/Clock.h"
#include "core/contracts/IProcessLauncher.h"
#include "core/model/ExecutionTypes.h"

namespace rebalex {
namespace execution {

struct ProcessOptions {
    long long terminate_grace_ms = 10000;
};

// Tracks short-lived submission processes by pid. Termination is advanced one
// step per reconciliation pass: SIGTERM first, SIGKILL once the grace period
// has elapsed. The leader session pid is never signalled, and neither is a
// pid whose start time no longer matches the one recorded at launch.
class ProcessLifecycleManager {
public:
    ProcessLifecycleManager(
        std::shared_ptr<core::IProcessLauncher> launcher,
        std::shared_ptr<const IClock> clock,
        ProcessOptions options
    );

    std::optional<int> launch(const core::LaunchSpec& spec);
    bool isAlive(int pid);
    std::optional<long long> startTime(int pid);

    // expected_start_time 0 skips the pid reuse check.
    core::ProcessOutcome stepTermination(
        int pid,
        int leader_pid,
        const std::optional<core::ProcessOutcome>& previous,
        long long expected_start_time = 0
    );

    static bool isSettled(const core::ProcessOutcome& outcome);

private:
    std::shared_ptr<core::IProcessLauncher> launcher_;
    std::shared_ptr<const IClock> clock_;
    ProcessOptions options_;
};

} // namespace execution
} // namespace rebalex
