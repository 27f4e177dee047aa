#ifndef LOCALSTORE_UTIL_CLOCK_HPP
#define LOCALSTORE_UTIL_CLOCK_HPP

#include <chrono>
#include <memory>
#include <mutex>

#include "localstore/util/types.hpp"

namespace localstore::util {

class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }
};

// time only moves when a test says so. locked because the scheduler that reads it may run
// on another thread than the test advancing it
class MockClock : public Clock {
public:
    [[nodiscard]] TimePoint now() const override {
        std::lock_guard lock(mutex_);
        return current_;
    }

    void set(TimePoint time) {
        std::lock_guard lock(mutex_);
        current_ = time;
    }

    void advance(Duration duration) {
        std::lock_guard lock(mutex_);
        current_ += duration;
    }

private:
    mutable std::mutex mutex_;
    TimePoint current_ = std::chrono::steady_clock::now();
};

}  // namespace localstore::util

#endif
