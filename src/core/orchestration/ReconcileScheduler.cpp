#include "core/orchestration/ReconcileScheduler.h"

#include <chrono>

#include <boost/asio/post.hpp>

#include "common/Logger.h"

namespace rebalex {
namespace core {

PeriodicTask::PeriodicTask(std::string name, long long interval_ms, Tick tick)
    : name_(std::move(name)),
      interval_ms_(interval_ms > 0 ? interval_ms : 1000),
      tick_(std::move(tick)),
      timer_(io_context_),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start() {
    if (running_.exchange(true)) {
        return false;
    }
    cancelled_->store(false);
    io_context_.restart();
    arm();
    worker_thread_ = std::thread([this]() {
        io_context_.run();
        running_ = false;
    });
    LOG_INFO("{} started (every {} ms)", name_, interval_ms_);
    return true;
}

void PeriodicTask::arm() {
    timer_.expires_after(std::chrono::milliseconds(interval_ms_));
    auto cancelled = cancelled_;
    timer_.async_wait([this, cancelled](const boost::system::error_code& ec) {
        if (ec || cancelled->load()) {
            return;
        }
        try {
            tick_();
        } catch (const std::exception& e) {
            LOG_ERROR("{} tick failed: {}", name_, e.what());
        }
        ticks_++;
        if (!cancelled->load()) {
            arm();
        }
    });
}

void PeriodicTask::stop() {
    cancelled_->store(true);
    if (worker_thread_.joinable()) {
        boost::asio::post(io_context_, [this]() { timer_.cancel(); });
        worker_thread_.join();
        LOG_INFO("{} stopped after {} ticks", name_, ticks_.load());
    }
    running_ = false;
}

ReconcileScheduler::ReconcileScheduler(std::shared_ptr<TradeRunCoordinator> coordinator, long long interval_ms)
    : coordinator_(std::move(coordinator)),
      task_("reconcile_scheduler", interval_ms, [this]() { runOnce(); }) {}

bool ReconcileScheduler::start() {
    return task_.start();
}

void ReconcileScheduler::stop() {
    task_.stop();
}

int ReconcileScheduler::runOnce() {
    const int changed = coordinator_->reconcileActiveRuns();
    if (coordinator_->autoRecoveryEnabled()) {
        try {
            coordinator_->recoverStuckOrders();
        } catch (const std::exception& e) {
            LOG_ERROR("auto recovery pass failed: {}", e.what());
        }
    }
    passes_++;
    if (changed > 0) {
        LOG_INFO("scheduler pass {}: {} runs changed", passes_.load(), changed);
    }
    return changed;
}

} // namespace core
} // namespace rebalex
