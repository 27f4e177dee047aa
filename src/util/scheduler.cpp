#include "localstore/util/scheduler.hpp"

#include <algorithm>
#include <utility>

namespace localstore::util {

ManualScheduler::ManualScheduler(std::shared_ptr<MockClock> clock) : clock_(std::move(clock)) {}

void ManualScheduler::post(Task task) {
    std::lock_guard lock(mutex_);
    posted_.push_back(std::move(task));
}

TimerId ManualScheduler::schedule_after(Duration delay, Task task) {
    std::lock_guard lock(mutex_);
    TimerId id = ++next_id_;
    timers_.emplace(id, Timer{clock_->now() + delay, std::move(task)});
    return id;
}

bool ManualScheduler::cancel(TimerId id) {
    std::lock_guard lock(mutex_);
    return timers_.erase(id) > 0;
}

std::size_t ManualScheduler::run_pending() {
    std::size_t count = 0;
    while (true) {
        Task task;
        {
            std::lock_guard lock(mutex_);
            if (posted_.empty()) {
                break;
            }
            task = std::move(posted_.front());
            posted_.pop_front();
        }
        // run outside the lock, tasks are free to post or schedule more work
        task();
        ++count;
    }
    return count;
}

std::size_t ManualScheduler::advance(Duration duration) {
    const TimePoint target = clock_->now() + duration;
    std::size_t fired = 0;

    while (true) {
        run_pending();

        Task task;
        {
            std::lock_guard lock(mutex_);
            // earliest deadline wins, ties go to the timer scheduled first (lower id)
            auto next = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.deadline > target) {
                    continue;
                }
                if (next == timers_.end() || it->second.deadline < next->second.deadline) {
                    next = it;
                }
            }
            if (next == timers_.end()) {
                break;
            }
            clock_->set(std::max(clock_->now(), next->second.deadline));
            task = std::move(next->second.task);
            timers_.erase(next);
        }
        task();
        ++fired;
    }

    clock_->set(target);
    run_pending();
    return fired;
}

std::size_t ManualScheduler::pending_tasks() const {
    std::lock_guard lock(mutex_);
    return posted_.size();
}

std::size_t ManualScheduler::pending_timers() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
}

std::shared_ptr<MockClock> ManualScheduler::clock() const {
    return clock_;
}

}  // namespace localstore::util
