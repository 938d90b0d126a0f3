#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/orchestration/TradeRunCoordinator.h"

namespace rebalex {
namespace core {

// Runs a callback on a steady_timer from its own io_context thread.
// stop() raises the shared cancel flag and cancels the pending wait; a tick
// already in progress finishes first.
class PeriodicTask {
public:
    using Tick = std::function<void()>;

    PeriodicTask(std::string name, long long interval_ms, Tick tick);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    bool start();
    void stop();

    bool isRunning() const { return running_.load(); }
    long long tickCount() const { return ticks_.load(); }
    std::shared_ptr<std::atomic<bool>> cancelFlag() const { return cancelled_; }

private:
    void arm();

    std::string name_;
    long long interval_ms_;
    Tick tick_;

    boost::asio::io_context io_context_;
    boost::asio::steady_timer timer_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::atomic<bool> running_{false};
    std::atomic<long long> ticks_{0};
    std::thread worker_thread_;
};

class ReconcileScheduler {
public:
    ReconcileScheduler(std::shared_ptr<TradeRunCoordinator> coordinator, long long interval_ms);

    bool start();
    void stop();
    bool isRunning() const { return task_.isRunning(); }

    // One synchronous pass; returns the number of runs that changed.
    int runOnce();
    long long passes() const { return passes_.load(); }

private:
    std::shared_ptr<TradeRunCoordinator> coordinator_;
    std::atomic<long long> passes_{0};
    PeriodicTask task_;
};

} // namespace core
} // namespace rebalex
