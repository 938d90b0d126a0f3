#include "execution/ProcessLifecycleManager.h"

#include "common/Logger.h"

namespace rebalex {
namespace execution {

ProcessLifecycleManager::ProcessLifecycleManager(
    std::shared_ptr<core::IProcessLauncher> launcher,
    std::shared_ptr<const IClock> clock,
    ProcessOptions options
) : launcher_(std::move(launcher)),
    clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
    options_(options) {}

std::optional<int> ProcessLifecycleManager::launch(const core::LaunchSpec& spec) {
    return launcher_->launch(spec);
}

bool ProcessLifecycleManager::isAlive(int pid) {
    return pid > 0 && launcher_->isAlive(pid);
}

std::optional<long long> ProcessLifecycleManager::startTime(int pid) {
    if (pid <= 0) {
        return std::nullopt;
    }
    return launcher_->startTime(pid);
}

bool ProcessLifecycleManager::isSettled(const core::ProcessOutcome& outcome) {
    return outcome.outcome == "not_running" ||
           outcome.outcome == "terminated" ||
           outcome.outcome == "killed" ||
           outcome.outcome == "leader_skipped";
}

core::ProcessOutcome ProcessLifecycleManager::stepTermination(
    int pid,
    int leader_pid,
    const std::optional<core::ProcessOutcome>& previous,
    long long expected_start_time
) {
    const long long now = clock_->nowMs();
    core::ProcessOutcome outcome;
    outcome.pid = pid;
    outcome.start_time = expected_start_time;

    if (previous && previous->pid == pid && isSettled(*previous)) {
        return *previous;
    }
    if (pid <= 0) {
        outcome.outcome = "not_running";
        outcome.finished_at_ms = now;
        return outcome;
    }
    if (leader_pid > 0 && pid == leader_pid) {
        LOG_WARN("process cleanup: pid {} is the leader session, not terminating", pid);
        outcome.outcome = "leader_skipped";
        outcome.finished_at_ms = now;
        return outcome;
    }

    const bool requested_before = previous && previous->pid == pid && previous->term_requested_at_ms > 0;
    if (!launcher_->isAlive(pid)) {
        outcome.outcome = requested_before ? "terminated" : "not_running";
        outcome.term_requested_at_ms = requested_before ? previous->term_requested_at_ms : 0;
        outcome.finished_at_ms = now;
        return outcome;
    }

    if (expected_start_time > 0) {
        const auto current = launcher_->startTime(pid);
        if (current && *current != expected_start_time) {
            LOG_WARN("process cleanup: pid {} now belongs to another process (start {} != {}), not signalling",
                     pid, *current, expected_start_time);
            outcome.outcome = requested_before ? "terminated" : "not_running";
            outcome.term_requested_at_ms = requested_before ? previous->term_requested_at_ms : 0;
            outcome.finished_at_ms = now;
            return outcome;
        }
    }

    if (requested_before) {
        outcome = *previous;
        if (now - previous->term_requested_at_ms < options_.terminate_grace_ms) {
            return outcome;
        }
        if (launcher_->signal(pid, true)) {
            LOG_WARN("process cleanup: pid {} ignored SIGTERM, sent SIGKILL", pid);
            outcome.outcome = "killed";
            outcome.finished_at_ms = now;
        } else {
            outcome.outcome = "signal_failed";
        }
        return outcome;
    }

    if (launcher_->signal(pid, false)) {
        LOG_INFO("process cleanup: SIGTERM sent to pid {}", pid);
        outcome.outcome = "term_requested";
        outcome.term_requested_at_ms = now;
    } else {
        outcome.outcome = "signal_failed";
    }
    return outcome;
}

} // namespace execution
} // namespace rebalex
