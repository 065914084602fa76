#include "timing/VirtualScheduler.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <tuple>

namespace opcuasub {

VirtualScheduler::VirtualScheduler(UA_DateTime epoch)
    : epoch_(epoch != 0 ? epoch : UA_DateTime_now()) {
}

Scheduler::Duration VirtualScheduler::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

UA_DateTime VirtualScheduler::currentDateTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_ + static_cast<UA_DateTime>(now_.count()) * UA_DATETIME_MSEC;
}

TimerId VirtualScheduler::schedulePeriodic(Duration interval, TimerPhase phase, Callback callback) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("Periodic timer interval must be positive");
    }
    return addTimer(interval, interval, phase, true, std::move(callback));
}

TimerId VirtualScheduler::scheduleOnce(Duration delay, TimerPhase phase, Callback callback) {
    if (delay.count() < 0) {
        delay = Duration(0);
    }
    return addTimer(delay, Duration(0), phase, false, std::move(callback));
}

TimerId VirtualScheduler::addTimer(Duration delay, Duration interval, TimerPhase phase,
                                   bool periodic, Callback callback) {
    if (!callback) {
        throw std::invalid_argument("Timer callback cannot be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = nextTimerId_++;
    timers_.emplace(id, Timer{id, now_ + delay, interval, phase, nextOrder_++, periodic,
                              std::move(callback)});
    return id;
}

void VirtualScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

size_t VirtualScheduler::advance(Duration duration) {
    Duration target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = now_ + duration;
    }

    size_t executed = 0;
    while (true) {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto next = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                const Timer& timer = it->second;
                if (timer.deadline > target) {
                    continue;
                }
                if (next == timers_.end() ||
                    std::make_tuple(timer.deadline, timer.phase, timer.order) <
                    std::make_tuple(next->second.deadline, next->second.phase, next->second.order)) {
                    next = it;
                }
            }

            if (next == timers_.end()) {
                now_ = target;
                break;
            }

            now_ = next->second.deadline;
            callback = next->second.callback;
            if (next->second.periodic) {
                next->second.deadline += next->second.interval;
            } else {
                timers_.erase(next);
            }
        }

        callback();
        ++executed;
    }

    spdlog::trace("VirtualScheduler advanced to {}ms, {} callbacks executed", target.count(), executed);
    return executed;
}

size_t VirtualScheduler::runPending() {
    return advance(Duration(0));
}

size_t VirtualScheduler::activeTimerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

} // namespace opcuasub
