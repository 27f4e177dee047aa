#ifndef LOCALSTORE_CORE_KEY_VALUE_STORE_HPP
#define LOCALSTORE_CORE_KEY_VALUE_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "localstore/core/file_store.hpp"
#include "localstore/core/result.hpp"
#include "localstore/util/scheduler.hpp"
#include "localstore/util/types.hpp"

namespace localstore::core {

using util::Json;
using util::SubscriptionId;

// resolved once the flush that covers a mutation has run (or was cancelled by dispose)
using FlushFuture = std::shared_future<Result<void>>;
// resolved once the initial load or seed has completed, successfully or not
using InitFuture = std::shared_future<Result<bool>>;

using ChangeCallback = std::function<void(const Json&)>;
using ErrorCallback = std::function<void(const Error&)>;

struct StoreOptions {
    std::shared_ptr<IFileStore> file;
    std::shared_ptr<util::Scheduler> scheduler;
    util::Duration flush_delay = util::Duration(50);
};

struct OpenedStore;

/*
    one named, file backed mapping of string keys to JSON values.

    the in-memory mapping is the source of truth for reads, the file is a mirror that catches up
    within one debounce window. every mutation re-arms a single flush timer on the scheduler, so a
    burst of writes turns into one file write carrying the latest state.

    failures of the initial load and of flushes never throw: they come back as a Result and are
    stored in a sticky "last error" slot that observers can watch.
*/
class KeyValueStore {
   public:
    KeyValueStore(std::string name, const StoreOptions& options);
    ~KeyValueStore();

    KeyValueStore(const KeyValueStore&) = delete;
    KeyValueStore& operator=(const KeyValueStore&) = delete;

    /*
        constructs the store and posts its init() to the scheduler. the store is usable right away
        but anything done before `ready` resolves works on the pre-load state, which the load then
        replaces. callers should wait on `ready` before first use.
    */
    [[nodiscard]] static OpenedStore open(std::string name, const StoreOptions& options,
                                          Json initial_data = Json::object());

    /*
        loads the backing file. an absent or blank file is seeded with `initial_data`, which is
        also written out. returns true on success, LoadError for bad content, IoError when the
        file cannot be read or created. the store counts as initialized either way.
    */
    [[nodiscard]] Result<bool> init(const Json& initial_data = Json::object());

    // nullopt when the key is absent
    [[nodiscard]] std::optional<Json> get_item(std::string_view key);

    FlushFuture set_item(std::string_view key, Json value);
    // removing an absent key is not an error
    FlushFuture remove(std::string_view key);
    FlushFuture clear();

    // writes the current mapping now, even when nothing changed since the last write
    [[nodiscard]] Result<void> flush();

    // closes the change stream and cancels the pending flush without writing it
    void dispose();

    SubscriptionId subscribe(ChangeCallback callback);
    bool unsubscribe(SubscriptionId id);

    [[nodiscard]] std::optional<Error> last_error() const;
    SubscriptionId watch_errors(ErrorCallback callback);
    bool unwatch_errors(SubscriptionId id);
    // records a failure that happened on the caller's side of the store (e.g. serialization)
    void report_error(const Error& error);

    [[nodiscard]] InitFuture ready() const;

    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] std::filesystem::path path() const;
    [[nodiscard]] bool initialized() const;
    [[nodiscard]] bool pending_flush() const;
    [[nodiscard]] bool disposed() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::vector<std::string> keys() const;
    // copy of the whole mapping
    [[nodiscard]] Json snapshot() const;

   private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

struct OpenedStore {
    std::shared_ptr<KeyValueStore> store;
    InitFuture ready;
};

}  // namespace localstore::core

#endif
