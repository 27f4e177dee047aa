#include <condition_variable>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "localstore/util/logger.hpp"
#include "localstore/util/scheduler.hpp"

namespace localstore::util {

// the worker thread holds its own reference, so a loop destroyed from one of its tasks stays
// alive until run() returns
class EventLoop::Impl : public std::enable_shared_from_this<Impl> {
public:
    void start() {
        auto self = shared_from_this();
        worker_ = std::thread([self] { self->run(); });
    }

    void post(Task task) {
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return;
            }
            posted_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    TimerId schedule_after(Duration delay, Task task) {
        TimerId id;
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return kInvalidTimer;
            }
            id = ++next_id_;
            TimerKey key{clock_.now() + delay, id};
            timers_.emplace(key, std::move(task));
            deadlines_.emplace(id, key.first);
        }
        cv_.notify_one();
        return id;
    }

    bool cancel(TimerId id) {
        std::lock_guard lock(mutex_);
        auto it = deadlines_.find(id);
        if (it == deadlines_.end()) {
            return false;
        }
        timers_.erase(TimerKey{it->second, id});
        deadlines_.erase(it);
        return true;
    }

    void stop() {
        // dropped tasks are destroyed outside the lock, their captures may call back into the loop
        std::deque<Task> dropped_tasks;
        std::map<TimerKey, Task> dropped_timers;
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
            dropped_tasks.swap(posted_);
            dropped_timers.swap(timers_);
            deadlines_.clear();
        }
        cv_.notify_all();

        // a task that stops its own loop cannot join itself
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                worker_.detach();
            } else {
                worker_.join();
            }
        }
    }

    bool running() const {
        std::lock_guard lock(mutex_);
        return !stopping_;
    }

private:
    using TimerKey = std::pair<TimePoint, TimerId>;

    void run() {
        std::unique_lock lock(mutex_);
        while (!stopping_) {
            if (!posted_.empty()) {
                Task task = std::move(posted_.front());
                posted_.pop_front();
                lock.unlock();
                execute(task);
                lock.lock();
                continue;
            }

            if (!timers_.empty()) {
                auto next = timers_.begin();
                TimePoint deadline = next->first.first;
                if (deadline <= clock_.now()) {
                    Task task = std::move(next->second);
                    deadlines_.erase(next->first.second);
                    timers_.erase(next);
                    lock.unlock();
                    execute(task);
                    lock.lock();
                    continue;
                }
                // woken early by post/schedule/cancel/stop, loop re-evaluates
                cv_.wait_until(lock, deadline);
                continue;
            }

            cv_.wait(lock);
        }
    }

    // an exception escaping a task is logged, the loop keeps serving the rest
    static void execute(Task& task) {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("event loop task failed: ") + e.what());
        }
    }

    SystemClock clock_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> posted_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, TimePoint> deadlines_;
    TimerId next_id_ = kInvalidTimer;
    bool stopping_ = false;
    std::thread worker_;
};

// PIMPL INTERFACE ---------------------------------------------------------------------------

EventLoop::EventLoop() : impl_(std::make_shared<Impl>()) {
    impl_->start();
}
EventLoop::~EventLoop() {
    impl_->stop();
}
void EventLoop::post(Task task) {
    impl_->post(std::move(task));
}
TimerId EventLoop::schedule_after(Duration delay, Task task) {
    return impl_->schedule_after(delay, std::move(task));
}
bool EventLoop::cancel(TimerId id) {
    return impl_->cancel(id);
}
void EventLoop::stop() {
    impl_->stop();
}
bool EventLoop::running() const {
    return impl_->running();
}

}  // namespace localstore::util
