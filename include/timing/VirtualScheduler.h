#pragma once

#include <map>
#include <mutex>

#include "timing/Scheduler.h"

namespace opcuasub {

/**
 * @brief Deterministic scheduler whose clock only moves through advance()
 *
 * Callbacks run on the thread calling advance(). Used by the tests to drive
 * sampling and publish cycles without real delays.
 */
class VirtualScheduler : public Scheduler {
public:
    /**
     * @brief Constructor
     * @param epoch DateTime reported at virtual time zero (0 uses UA_DateTime_now())
     */
    explicit VirtualScheduler(UA_DateTime epoch = 0);

    // Disable copy constructor and assignment operator
    VirtualScheduler(const VirtualScheduler&) = delete;
    VirtualScheduler& operator=(const VirtualScheduler&) = delete;

    Duration now() const override;
    UA_DateTime currentDateTime() const override;
    TimerId schedulePeriodic(Duration interval, TimerPhase phase, Callback callback) override;
    TimerId scheduleOnce(Duration delay, TimerPhase phase, Callback callback) override;
    void cancel(TimerId id) override;

    /**
     * @brief Move the clock forward, running every timer that falls due
     * @param duration Amount of virtual time to advance
     * @return Number of callbacks executed
     */
    size_t advance(Duration duration);

    /**
     * @brief Run timers already due at the current time
     * @return Number of callbacks executed
     */
    size_t runPending();

    size_t activeTimerCount() const;

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

    UA_DateTime epoch_;
    Duration now_{0};
    TimerId nextTimerId_{1};
    uint64_t nextOrder_{0};
    std::map<TimerId, Timer> timers_;
    mutable std::mutex mutex_;
};

} // namespace opcuasub
