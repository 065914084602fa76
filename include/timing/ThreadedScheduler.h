#pragma once

#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>

#include "timing/Scheduler.h"

namespace opcuasub {

/**
 * @brief Steady-clock scheduler executing timers on a dedicated worker thread
 *
 * All callbacks run sequentially on the worker thread. Exceptions escaping a
 * callback are reported through ErrorHandler and do not stop the worker.
 */
class ThreadedScheduler : public Scheduler {
public:
    /**
     * @brief Statistics structure for monitoring timer execution
     */
    struct SchedulerStats {
        uint64_t executedCallbacks{0};      // Callbacks run to completion
        uint64_t failedCallbacks{0};        // Callbacks that threw
        size_t activeTimers{0};             // Currently scheduled timers
    };

    ThreadedScheduler();

    /**
     * @brief Destructor - stops the worker thread
     */
    ~ThreadedScheduler();

    // Disable copy constructor and assignment operator
    ThreadedScheduler(const ThreadedScheduler&) = delete;
    ThreadedScheduler& operator=(const ThreadedScheduler&) = delete;

    /**
     * @brief Start the worker thread
     */
    void start();

    /**
     * @brief Stop the worker thread and drop every timer
     */
    void stop();

    bool isRunning() const;

    Duration now() const override;
    UA_DateTime currentDateTime() const override;
    TimerId schedulePeriodic(Duration interval, TimerPhase phase, Callback callback) override;
    TimerId scheduleOnce(Duration delay, TimerPhase phase, Callback callback) override;
    void cancel(TimerId id) override;

    SchedulerStats getStats() const;

private:
    struct Timer {
        TimerId id;
        Duration deadline;
        Duration interval;
        TimerPhase phase;
        uint64_t order;
        bool periodic;
        Callback callback;
    };

    TimerId addTimer(Duration delay, Duration interval, TimerPhase phase,
                     bool periodic, Callback callback);

    /**
     * @brief Worker thread main loop
     */
    void workerLoop();

    /**
     * @brief Find the timer to run next (caller holds mutex_)
     */
    std::map<TimerId, Timer>::iterator nextTimer();

    const std::chrono::steady_clock::time_point startTime_;

    std::thread workerThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};

    std::map<TimerId, Timer> timers_;
    TimerId nextTimerId_{1};
    uint64_t nextOrder_{0};
    mutable std::mutex mutex_;
    std::condition_variable condition_;

    std::atomic<uint64_t> executedCallbacks_{0};
    std::atomic<uint64_t> failedCallbacks_{0};
};

} // namespace opcuasub
