#ifndef LOCALSTORE_UTIL_SIGNAL_HPP
#define LOCALSTORE_UTIL_SIGNAL_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "localstore/util/types.hpp"

namespace localstore::util {

/*
    hot publish point: subscribers only see values emitted after they subscribed, nothing is
    replayed. callbacks are copied out before invoking so a callback may unsubscribe itself
    (or anyone else) without invalidating the iteration.
*/
template <typename T>
class Signal {
public:
    using Callback = std::function<void(const T&)>;

    static constexpr SubscriptionId kInvalidSubscription = 0;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    SubscriptionId subscribe(Callback callback) {
        std::lock_guard lock(mutex_);
        if (closed_ || !callback) {
            return kInvalidSubscription;
        }
        SubscriptionId id = ++next_id_;
        subscribers_.emplace_back(id, std::move(callback));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (it->first == id) {
                subscribers_.erase(it);
                return true;
            }
        }
        return false;
    }

    void emit(const T& value) {
        std::vector<std::pair<SubscriptionId, Callback>> targets;
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return;
            }
            targets = subscribers_;
        }
        for (auto& [id, callback] : targets) {
            callback(value);
        }
    }

    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        subscribers_.clear();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard lock(mutex_);
        return subscribers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SubscriptionId, Callback>> subscribers_;
    SubscriptionId next_id_ = kInvalidSubscription;
    bool closed_ = false;
};

}  // namespace localstore::util

#endif
