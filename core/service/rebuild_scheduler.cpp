#include "service/rebuild_scheduler.hpp"

#include <spdlog/spdlog.h>

namespace warmpath {

RebuildScheduler::RebuildScheduler(WarmPathService& service, std::chrono::milliseconds interval)
    : service_(service), interval_(interval) {}

RebuildScheduler::~RebuildScheduler() {
    stop();
}

void RebuildScheduler::start(bool rebuild_now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    stop_requested_ = false;
    running_ = true;
    worker_ = std::thread(&RebuildScheduler::loop, this, rebuild_now);
    spdlog::info("[Scheduler] Started, interval {} ms", interval_.count());
}

void RebuildScheduler::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || !worker_.joinable()) return;
        stop_requested_ = true;
        // Only the caller that takes the thread joins it.
        worker = std::move(worker_);
    }
    cv_.notify_all();
    worker.join();

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    spdlog::info("[Scheduler] Stopped after {} rebuilds ({} failed)", completed_, failed_);
}

bool RebuildScheduler::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

size_t RebuildScheduler::completedRuns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

size_t RebuildScheduler::failedRuns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void RebuildScheduler::tick() {
    bool ok = false;
    try {
        GraphStats s = service_.rebuildGraph();
        spdlog::debug("[Scheduler] Rebuild done: {} nodes, {} edges", s.nodes, s.edges);
        ok = true;
    } catch (const std::exception& e) {
        spdlog::error("[Scheduler] Scheduled rebuild failed, will retry: {}", e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (ok) {
        completed_++;
    } else {
        failed_++;
    }
}

void RebuildScheduler::loop(bool rebuild_now) {
    if (rebuild_now) tick();

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) break;
        lock.unlock();
        tick();
        lock.lock();
    }
}

} // namespace warmpath
