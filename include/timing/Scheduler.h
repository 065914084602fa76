#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include <open62541/types.h>

namespace opcuasub {

/**
 * @brief Ordering class of a timer; at equal deadlines lower phases run first
 */
enum class TimerPhase {
    SAMPLING = 0,
    PUBLISHING = 1,
    HOUSEKEEPING = 2
};

using TimerId = uint64_t;

/**
 * @brief Schedulable queue of deadlines driving sampling and publishing
 *
 * Implementations run callbacks in deadline order; callbacks due at the same
 * instant run by phase, then in the order they were scheduled. cancel() does
 * not wait for a callback that is already running, so callbacks must not
 * capture state that can be destroyed while they run (subscriptions hand out
 * weak references).
 */
class Scheduler {
public:
    using Callback = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    virtual ~Scheduler() = default;

    /**
     * @brief Time elapsed since the scheduler was created
     */
    virtual Duration now() const = 0;

    /**
     * @brief Wall-clock time used to stamp notifications
     */
    virtual UA_DateTime currentDateTime() const = 0;

    /**
     * @brief Run a callback every interval, first at now() + interval
     * @param interval Period (must be positive)
     * @param phase Ordering class at equal deadlines
     * @param callback Function to run
     * @return Timer identifier, never 0
     */
    virtual TimerId schedulePeriodic(Duration interval, TimerPhase phase, Callback callback) = 0;

    /**
     * @brief Run a callback once at now() + delay
     */
    virtual TimerId scheduleOnce(Duration delay, TimerPhase phase, Callback callback) = 0;

    /**
     * @brief Cancel a timer; unknown or already expired ids are ignored
     */
    virtual void cancel(TimerId id) = 0;

    /**
     * @brief Convert a millisecond interval given as double to a Duration
     */
    static Duration toDuration(double milliseconds) {
        auto ms = static_cast<Duration::rep>(milliseconds + 0.5);
        return Duration(ms > 0 ? ms : 1);
    }
};

} // namespace opcuasub
