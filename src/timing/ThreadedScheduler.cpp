#include "timing/ThreadedScheduler.h"
#include "core/ErrorHandler.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <tuple>

namespace opcuasub {

ThreadedScheduler::ThreadedScheduler()
    : startTime_(std::chrono::steady_clock::now()) {
    spdlog::debug("ThreadedScheduler created");
}

ThreadedScheduler::~ThreadedScheduler() {
    stop();
    spdlog::debug("ThreadedScheduler destroyed");
}

void ThreadedScheduler::start() {
    if (running_.load()) {
        spdlog::warn("ThreadedScheduler is already running");
        return;
    }

    stopRequested_.store(false);
    running_.store(true);
    workerThread_ = std::thread(&ThreadedScheduler::workerLoop, this);

    spdlog::info("ThreadedScheduler started");
}

void ThreadedScheduler::stop() {
    if (!running_.load()) {
        return;
    }

    spdlog::info("Stopping ThreadedScheduler...");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_.store(true);
        running_.store(false);
    }
    condition_.notify_all();

    if (workerThread_.joinable()) {
        if (workerThread_.get_id() == std::this_thread::get_id()) {
            workerThread_.detach();
        } else {
            workerThread_.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.clear();
    }

    spdlog::info("ThreadedScheduler stopped");
}

bool ThreadedScheduler::isRunning() const {
    return running_.load();
}

Scheduler::Duration ThreadedScheduler::now() const {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - startTime_);
}

UA_DateTime ThreadedScheduler::currentDateTime() const {
    return UA_DateTime_now();
}

TimerId ThreadedScheduler::schedulePeriodic(Duration interval, TimerPhase phase, Callback callback) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("Periodic timer interval must be positive");
    }
    return addTimer(interval, interval, phase, true, std::move(callback));
}

TimerId ThreadedScheduler::scheduleOnce(Duration delay, TimerPhase phase, Callback callback) {
    if (delay.count() < 0) {
        delay = Duration(0);
    }
    return addTimer(delay, Duration(0), phase, false, std::move(callback));
}

TimerId ThreadedScheduler::addTimer(Duration delay, Duration interval, TimerPhase phase,
                                    bool periodic, Callback callback) {
    if (!callback) {
        throw std::invalid_argument("Timer callback cannot be null");
    }

    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextTimerId_++;
        timers_.emplace(id, Timer{id, now() + delay, interval, phase, nextOrder_++, periodic,
                                  std::move(callback)});
    }
    condition_.notify_all();

    spdlog::trace("Scheduled timer {} (delay {}ms, periodic: {})", id, delay.count(), periodic);
    return id;
}

void ThreadedScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timers_.erase(id) > 0) {
        spdlog::trace("Cancelled timer {}", id);
    }
}

ThreadedScheduler::SchedulerStats ThreadedScheduler::getStats() const {
    SchedulerStats stats;
    stats.executedCallbacks = executedCallbacks_.load();
    stats.failedCallbacks = failedCallbacks_.load();

    std::lock_guard<std::mutex> lock(mutex_);
    stats.activeTimers = timers_.size();
    return stats;
}

std::map<TimerId, ThreadedScheduler::Timer>::iterator ThreadedScheduler::nextTimer() {
    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (next == timers_.end() ||
            std::make_tuple(it->second.deadline, it->second.phase, it->second.order) <
            std::make_tuple(next->second.deadline, next->second.phase, next->second.order)) {
            next = it;
        }
    }
    return next;
}

void ThreadedScheduler::workerLoop() {
    spdlog::debug("Scheduler worker thread started");

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_.load()) {
        auto next = nextTimer();
        if (next == timers_.end()) {
            condition_.wait(lock);
            continue;
        }

        auto deadline = startTime_ + next->second.deadline;
        if (std::chrono::steady_clock::now() < deadline) {
            condition_.wait_until(lock, deadline);
            continue;
        }

        Callback callback = next->second.callback;
        if (next->second.periodic) {
            next->second.deadline += next->second.interval;
            // Skip cycles missed while the worker was busy
            if (next->second.deadline < now()) {
                next->second.deadline = now() + next->second.interval;
            }
        } else {
            timers_.erase(next);
        }

        lock.unlock();
        bool success = ErrorHandler::executeWithErrorHandling(callback, "Scheduler timer callback");
        if (success) {
            executedCallbacks_.fetch_add(1, std::memory_order_relaxed);
        } else {
            failedCallbacks_.fetch_add(1, std::memory_order_relaxed);
        }
        lock.lock();
    }

    spdlog::debug("Scheduler worker thread stopped");
}

} // namespace opcuasub
