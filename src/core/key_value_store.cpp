#include "localstore/core/key_value_store.hpp"

#include <cstdint>
#include <exception>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "localstore/util/logger.hpp"
#include "localstore/util/signal.hpp"

namespace localstore::core {

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

using Waiters = std::vector<std::promise<Result<void>>>;

FlushFuture resolved(Result<void> result) {
    std::promise<Result<void>> promise;
    promise.set_value(std::move(result));
    return promise.get_future().share();
}

void resolve_all(Waiters& waiters, const Result<void>& result) {
    for (auto& waiter : waiters) {
        waiter.set_value(result);
    }
    waiters.clear();
}

// the bytes a write will put on disk, and what they cover
struct PendingWrite {
    std::string bytes;
    std::uint64_t generation = 0;
    Waiters waiters;
};

}  // namespace

class KeyValueStore::Impl : public std::enable_shared_from_this<Impl> {
   public:
    Impl(std::string name, const StoreOptions& options)
        : name_(std::move(name)), options_(options) {
        if (!options_.file) {
            throw std::invalid_argument("store '" + name_ + "' has no file store");
        }
        if (!options_.scheduler) {
            throw std::invalid_argument("store '" + name_ + "' has no scheduler");
        }
        init_future_ = init_promise_.get_future().share();
    }

    Result<bool> init(const Json& initial_data) {
        // held across load and publication so a concurrent mutation cannot be published in between
        std::lock_guard publish(publish_mutex_);

        Result<bool> result = load(initial_data);

        Json published;
        bool publish_now = false;
        {
            std::lock_guard lock(mutex_);
            initialized_ = true;
            if (result.ok() && !disposed_) {
                published = data_;
                publish_now = true;
            }
        }

        if (result.ok()) {
            LOG_DEBUG("store '" + name_ + "' ready with " + std::to_string(published.size()) +
                      " keys");
            if (publish_now) {
                changes_.emit(published);
            }
        } else {
            record_error(result.error());
        }

        signal_ready(result);
        return result;
    }

    std::optional<Json> get_item(std::string_view key) {
        {
            std::lock_guard lock(mutex_);
            if (data_.is_object()) {
                auto it = data_.find(std::string(key));
                if (it == data_.end()) {
                    return std::nullopt;
                }
                return *it;
            }
        }
        record_error(Error{ErrorCode::Internal, "mapping of store '" + name_ + "' is not an object"});
        return std::nullopt;
    }

    FlushFuture set_item(std::string_view key, Json value) {
        // the mapping only ever holds values that can be written out
        try {
            (void)value.dump();
        } catch (const Json::type_error& e) {
            Error error{ErrorCode::SerializationError,
                        "value for key '" + std::string(key) + "' is not serializable: " + e.what()};
            record_error(error);
            return resolved(std::move(error));
        }
        return mutate([&](Json& data) { data[std::string(key)] = std::move(value); });
    }

    FlushFuture remove(std::string_view key) {
        return mutate([&](Json& data) { data.erase(std::string(key)); });
    }

    FlushFuture clear() {
        return mutate([](Json& data) { data = Json::object(); });
    }

    Result<void> flush() {
        PendingWrite write;
        Result<void> result;
        {
            std::lock_guard serial(write_mutex_);
            {
                std::lock_guard lock(mutex_);
                result = prepare_write_locked(write);
            }
            if (result.ok()) {
                result = commit_write(write);
            }
        }

        if (!result.ok()) {
            // the armed timer retries on behalf of these
            restore_waiters(std::move(write.waiters));
            record_error(result.error());
            return result;
        }
        // a successful manual flush also covers mutations waiting on the timer
        resolve_all(write.waiters, result);
        return result;
    }

    void dispose() {
        Waiters waiters;
        {
            std::lock_guard lock(mutex_);
            if (disposed_) {
                return;
            }
            disposed_ = true;
            cancel_timer_locked();
            waiters = take_waiters_locked();
        }

        changes_.close();
        resolve_all(waiters,
                    Error{ErrorCode::Disposed, "store '" + name_ + "' disposed before flushing"});
        LOG_DEBUG("store '" + name_ + "' disposed");
    }

    SubscriptionId subscribe(ChangeCallback callback) {
        return changes_.subscribe(std::move(callback));
    }

    bool unsubscribe(SubscriptionId id) {
        return changes_.unsubscribe(id);
    }

    std::optional<Error> last_error() const {
        std::lock_guard lock(mutex_);
        return last_error_;
    }

    SubscriptionId watch_errors(ErrorCallback callback) {
        return errors_.subscribe(std::move(callback));
    }

    bool unwatch_errors(SubscriptionId id) {
        return errors_.unsubscribe(id);
    }

    void record_error(const Error& error) {
        {
            std::lock_guard lock(mutex_);
            last_error_ = error;
        }
        LOG_WARN("store '" + name_ + "': " + error.describe());
        errors_.emit(error);
    }

    InitFuture ready() const {
        return init_future_;
    }

    const std::string& name() const {
        return name_;
    }

    std::filesystem::path path() const {
        return options_.file->path();
    }

    bool initialized() const {
        std::lock_guard lock(mutex_);
        return initialized_;
    }

    bool pending_flush() const {
        std::lock_guard lock(mutex_);
        return pending_flush_;
    }

    bool disposed() const {
        std::lock_guard lock(mutex_);
        return disposed_;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return data_.size();
    }

    bool contains(std::string_view key) const {
        std::lock_guard lock(mutex_);
        return data_.contains(std::string(key));
    }

    std::vector<std::string> keys() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        result.reserve(data_.size());
        for (const auto& item : data_.items()) {
            result.push_back(item.key());
        }
        return result;
    }

    Json snapshot() const {
        std::lock_guard lock(mutex_);
        return data_;
    }

   private:
    Result<bool> load(const Json& initial_data) {
        std::optional<std::string> contents;
        try {
            contents = options_.file->read_all();
        } catch (const std::exception& e) {
            return Error{ErrorCode::IoError, e.what()};
        }

        if (contents.has_value() && !is_blank(*contents)) {
            Json parsed;
            try {
                parsed = Json::parse(*contents);
            } catch (const Json::parse_error& e) {
                return Error{ErrorCode::LoadError,
                             "invalid JSON in " + path().string() + ": " + e.what()};
            }
            if (!parsed.is_object()) {
                return Error{ErrorCode::LoadError,
                             "root of " + path().string() + " is not a JSON object"};
            }

            std::lock_guard lock(mutex_);
            data_ = std::move(parsed);
            ++generation_;
            LOG_DEBUG("store '" + name_ + "' loaded from " + path().string());
            return true;
        }

        // nothing on disk yet, the initial data becomes the starting content
        if (!initial_data.is_object()) {
            return Error{ErrorCode::SerializationError,
                         "initial data for store '" + name_ + "' is not a JSON object"};
        }
        try {
            (void)initial_data.dump();
        } catch (const Json::type_error& e) {
            return Error{ErrorCode::SerializationError,
                         "initial data for store '" + name_ + "' is not serializable: " + e.what()};
        }

        PendingWrite write;
        Result<void> written;
        {
            std::lock_guard serial(write_mutex_);
            {
                std::lock_guard lock(mutex_);
                data_ = initial_data;
                ++generation_;
                // stays set on failure, the next flush retries writing the seed
                pending_flush_ = true;
                written = prepare_write_locked(write);
            }
            if (written.ok()) {
                written = commit_write(write);
            }
        }

        if (!written.ok()) {
            restore_waiters(std::move(write.waiters));
            return written.error();
        }
        resolve_all(write.waiters, written);
        LOG_DEBUG("store '" + name_ + "' seeded at " + path().string());
        return true;
    }

    template <typename Mutation>
    FlushFuture mutate(Mutation&& apply) {
        std::lock_guard publish(publish_mutex_);

        Json published;
        FlushFuture future;
        {
            std::lock_guard lock(mutex_);
            if (disposed_) {
                return resolved(Error{ErrorCode::Disposed, "store '" + name_ + "' is disposed"});
            }
            apply(data_);
            ++generation_;
            published = data_;
            future = schedule_flush_locked();
        }

        changes_.emit(published);
        return future;
    }

    FlushFuture schedule_flush_locked() {
        pending_flush_ = true;
        if (!flush_future_.valid()) {
            flush_waiters_.emplace_back();
            flush_future_ = flush_waiters_.back().get_future().share();
        }
        arm_timer_locked();
        return flush_future_;
    }

    void arm_timer_locked() {
        cancel_timer_locked();
        // a timer the scheduler already dequeued cannot be cancelled, the token tells it apart
        std::uint64_t token = ++timer_token_;
        std::weak_ptr<Impl> weak = weak_from_this();
        flush_timer_ = options_.scheduler->schedule_after(options_.flush_delay, [weak, token] {
            if (auto self = weak.lock()) {
                self->on_flush_timer(token);
            }
        });
    }

    void on_flush_timer(std::uint64_t token) {
        PendingWrite write;
        Result<void> result;
        {
            std::lock_guard serial(write_mutex_);
            {
                std::lock_guard lock(mutex_);
                if (token != timer_token_) {
                    return;  // superseded by a newer timer
                }
                flush_timer_ = util::Scheduler::kInvalidTimer;
                if (disposed_ || !pending_flush_) {
                    return;
                }
                result = prepare_write_locked(write);
            }
            if (result.ok()) {
                result = commit_write(write);
            }
        }

        // failure keeps pending_flush_ set, the next mutation re-arms and retries
        if (!result.ok()) {
            record_error(result.error());
        }
        resolve_all(write.waiters, result);
    }

    // serializes the mapping. caller holds write_mutex_ and mutex_
    Result<void> prepare_write_locked(PendingWrite& write) {
        write.waiters = take_waiters_locked();
        write.generation = generation_;
        try {
            write.bytes = data_.dump();
        } catch (const Json::type_error& e) {
            return Error{ErrorCode::SerializationError, e.what()};
        }
        return {};
    }

    // writes with mutex_ released so readers never wait on the disk. caller holds write_mutex_
    Result<void> commit_write(const PendingWrite& write) {
        try {
            options_.file->write_all(write.bytes);
        } catch (const std::exception& e) {
            return Error{ErrorCode::IoError, e.what()};
        }

        std::lock_guard lock(mutex_);
        if (generation_ == write.generation) {
            pending_flush_ = false;
        }
        return {};
    }

    // puts waiters of a failed write back in line for the next flush
    void restore_waiters(Waiters waiters) {
        if (waiters.empty()) {
            return;
        }
        {
            std::lock_guard lock(mutex_);
            if (!disposed_) {
                flush_waiters_.insert(flush_waiters_.begin(),
                                      std::make_move_iterator(waiters.begin()),
                                      std::make_move_iterator(waiters.end()));
                if (flush_timer_ == util::Scheduler::kInvalidTimer) {
                    arm_timer_locked();
                }
                return;
            }
        }
        resolve_all(waiters,
                    Error{ErrorCode::Disposed, "store '" + name_ + "' disposed before flushing"});
    }

    void cancel_timer_locked() {
        if (flush_timer_ != util::Scheduler::kInvalidTimer) {
            options_.scheduler->cancel(flush_timer_);
            flush_timer_ = util::Scheduler::kInvalidTimer;
        }
    }

    Waiters take_waiters_locked() {
        Waiters waiters = std::move(flush_waiters_);
        flush_waiters_.clear();
        flush_future_ = FlushFuture();
        return waiters;
    }

    void signal_ready(const Result<bool>& result) {
        std::lock_guard lock(mutex_);
        if (!ready_signalled_) {
            ready_signalled_ = true;
            init_promise_.set_value(result);
        }
    }

    const std::string name_;
    const StoreOptions options_;

    // lock order: publish_mutex_, then write_mutex_, then mutex_. publish_mutex_ is recursive so
    // a subscriber may mutate the store. write_mutex_ keeps file writes in snapshot order.
    std::recursive_mutex publish_mutex_;
    std::mutex write_mutex_;
    mutable std::mutex mutex_;

    Json data_ = Json::object();
    // bumped by every change to data_, a write only settles pending_flush_ if it saw the latest
    std::uint64_t generation_ = 0;
    bool initialized_ = false;
    bool pending_flush_ = false;
    bool disposed_ = false;
    std::optional<Error> last_error_;

    util::TimerId flush_timer_ = util::Scheduler::kInvalidTimer;
    std::uint64_t timer_token_ = 0;
    // while a window is open flush_future_ belongs to the last entry. earlier entries were put
    // back by a failed write
    Waiters flush_waiters_;
    FlushFuture flush_future_;

    std::promise<Result<bool>> init_promise_;
    InitFuture init_future_;
    bool ready_signalled_ = false;

    util::Signal<Json> changes_;
    util::Signal<Error> errors_;
};

// PIMPL INTERFACE ---------------------------------------------------------------------------

KeyValueStore::KeyValueStore(std::string name, const StoreOptions& options)
    : impl_(std::make_shared<Impl>(std::move(name), options)) {}

// timers only hold a weak reference, disposing is enough to make them no-ops
KeyValueStore::~KeyValueStore() {
    impl_->dispose();
}

OpenedStore KeyValueStore::open(std::string name, const StoreOptions& options, Json initial_data) {
    auto store = std::make_shared<KeyValueStore>(std::move(name), options);
    std::weak_ptr<Impl> weak = store->impl_;
    options.scheduler->post([weak, initial = std::move(initial_data)] {
        if (auto impl = weak.lock()) {
            impl->init(initial);
        }
    });
    return OpenedStore{store, store->ready()};
}

Result<bool> KeyValueStore::init(const Json& initial_data) {
    return impl_->init(initial_data);
}
std::optional<Json> KeyValueStore::get_item(std::string_view key) {
    return impl_->get_item(key);
}
FlushFuture KeyValueStore::set_item(std::string_view key, Json value) {
    return impl_->set_item(key, std::move(value));
}
FlushFuture KeyValueStore::remove(std::string_view key) {
    return impl_->remove(key);
}
FlushFuture KeyValueStore::clear() {
    return impl_->clear();
}
Result<void> KeyValueStore::flush() {
    return impl_->flush();
}
void KeyValueStore::dispose() {
    impl_->dispose();
}
SubscriptionId KeyValueStore::subscribe(ChangeCallback callback) {
    return impl_->subscribe(std::move(callback));
}
bool KeyValueStore::unsubscribe(SubscriptionId id) {
    return impl_->unsubscribe(id);
}
std::optional<Error> KeyValueStore::last_error() const {
    return impl_->last_error();
}
SubscriptionId KeyValueStore::watch_errors(ErrorCallback callback) {
    return impl_->watch_errors(std::move(callback));
}
bool KeyValueStore::unwatch_errors(SubscriptionId id) {
    return impl_->unwatch_errors(id);
}
void KeyValueStore::report_error(const Error& error) {
    impl_->record_error(error);
}
InitFuture KeyValueStore::ready() const {
    return impl_->ready();
}
const std::string& KeyValueStore::name() const {
    return impl_->name();
}
std::filesystem::path KeyValueStore::path() const {
    return impl_->path();
}
bool KeyValueStore::initialized() const {
    return impl_->initialized();
}
bool KeyValueStore::pending_flush() const {
    return impl_->pending_flush();
}
bool KeyValueStore::disposed() const {
    return impl_->disposed();
}
std::size_t KeyValueStore::size() const {
    return impl_->size();
}
bool KeyValueStore::contains(std::string_view key) const {
    return impl_->contains(key);
}
std::vector<std::string> KeyValueStore::keys() const {
    return impl_->keys();
}
Json KeyValueStore::snapshot() const {
    return impl_->snapshot();
}

}  // namespace localstore::core
