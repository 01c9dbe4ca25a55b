#pragma once

#include "service/warmpath_service.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace warmpath {

/// Runs WarmPathService::rebuildGraph() on a background thread at a fixed
/// interval until stopped. A failed rebuild is logged and retried on the
/// next tick.
class RebuildScheduler {
public:
    RebuildScheduler(WarmPathService& service, std::chrono::milliseconds interval);
    ~RebuildScheduler();

    RebuildScheduler(const RebuildScheduler&) = delete;
    RebuildScheduler& operator=(const RebuildScheduler&) = delete;

    /// Start the worker. With `rebuild_now` the first rebuild runs
    /// immediately instead of after one interval. No-op if running.
    void start(bool rebuild_now = true);

    /// Stop and join the worker. Safe to call more than once.
    void stop();

    bool running() const;
    size_t completedRuns() const;
    size_t failedRuns() const;

private:
    void loop(bool rebuild_now);
    void tick();

    WarmPathService& service_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool running_ = false;
    size_t completed_ = 0;
    size_t failed_ = 0;
    std::thread worker_;
};

} // namespace warmpath
