#ifndef LOCALSTORE_UTIL_SCHEDULER_HPP
#define LOCALSTORE_UTIL_SCHEDULER_HPP

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "localstore/util/clock.hpp"
#include "localstore/util/types.hpp"

namespace localstore::util {

using Task = std::function<void()>;

/*
    the one logical thread every asynchronous store task runs on (initial load, debounced flush).
    tasks never run in parallel with each other. timers fire once.
*/
class Scheduler {
public:
    static constexpr TimerId kInvalidTimer = 0;

    virtual ~Scheduler() = default;

    virtual void post(Task task) = 0;
    [[nodiscard]] virtual TimerId schedule_after(Duration delay, Task task) = 0;
    // false if the timer already fired, was already cancelled or never existed
    virtual bool cancel(TimerId id) = 0;
};

// background worker thread, timers ordered by deadline then by scheduling order
class EventLoop : public Scheduler {
public:
    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task) override;
    [[nodiscard]] TimerId schedule_after(Duration delay, Task task) override;
    bool cancel(TimerId id) override;

    // queued tasks and timers that have not run yet are dropped
    void stop();
    [[nodiscard]] bool running() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

/*
    deterministic scheduler for tests. nothing runs until the test drives it:
    run_pending() drains posted tasks, advance() moves the mock clock and fires due timers.
*/
class ManualScheduler : public Scheduler {
public:
    explicit ManualScheduler(std::shared_ptr<MockClock> clock = std::make_shared<MockClock>());

    void post(Task task) override;
    [[nodiscard]] TimerId schedule_after(Duration delay, Task task) override;
    bool cancel(TimerId id) override;

    // runs posted tasks (including ones posted while draining), returns how many ran
    std::size_t run_pending();
    // returns the number of timers fired
    std::size_t advance(Duration duration);

    [[nodiscard]] std::size_t pending_tasks() const;
    [[nodiscard]] std::size_t pending_timers() const;
    [[nodiscard]] std::shared_ptr<MockClock> clock() const;

private:
    struct Timer {
        TimePoint deadline;
        Task task;
    };

    std::shared_ptr<MockClock> clock_;
    mutable std::mutex mutex_;
    std::deque<Task> posted_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = kInvalidTimer;
};

}  // namespace localstore::util

#endif
