#include "localstore/core/key_value_store.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/fake_file_store.hpp"
#include "localstore/core/file_store.hpp"
#include "localstore/util/scheduler.hpp"

namespace localstore::core::test {

using util::Duration;
using util::ManualScheduler;

namespace {

constexpr Duration kDelay{50};

template <typename Future>
bool is_ready(const Future& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// timers cannot be cancelled once armed, as with a loop that already dequeued them
class UncancellableScheduler : public util::Scheduler {
   public:
    void post(util::Task task) override {
        inner.post(std::move(task));
    }

    util::TimerId schedule_after(Duration delay, util::Task task) override {
        last_scheduled = inner.schedule_after(delay, std::move(task));
        return last_scheduled;
    }

    bool cancel(util::TimerId id) override {
        cancel_requests.push_back(id);
        return false;
    }

    ManualScheduler inner;
    util::TimerId last_scheduled = kInvalidTimer;
    std::vector<util::TimerId> cancel_requests;
};

}  // namespace

class KeyValueStoreTest : public ::testing::Test {
   protected:
    void SetUp() override {
        scheduler_ = std::make_shared<ManualScheduler>();
        file_ = std::make_shared<FakeFileStore>();
    }

    StoreOptions options() {
        StoreOptions opts;
        opts.file = file_;
        opts.scheduler = scheduler_;
        opts.flush_delay = kDelay;
        return opts;
    }

    // opens the store and runs its initial load
    std::shared_ptr<KeyValueStore> open_ready(Json initial_data = Json::object()) {
        auto opened = KeyValueStore::open("settings", options(), std::move(initial_data));
        scheduler_->run_pending();
        EXPECT_TRUE(is_ready(opened.ready));
        return opened.store;
    }

    std::shared_ptr<ManualScheduler> scheduler_;
    std::shared_ptr<FakeFileStore> file_;
};

// LIFECYCLE -------------------------------------------------------------------------------

TEST_F(KeyValueStoreTest, ReadyResolvesOnlyAfterSchedulerRunsInit) {
    auto opened = KeyValueStore::open("settings", options());

    EXPECT_FALSE(is_ready(opened.ready));
    EXPECT_FALSE(opened.store->initialized());

    scheduler_->run_pending();

    ASSERT_TRUE(is_ready(opened.ready));
    const auto& result = opened.ready.get();
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value());
    EXPECT_TRUE(opened.store->initialized());
    EXPECT_FALSE(opened.store->last_error().has_value());
}

TEST_F(KeyValueStoreTest, AbsentFileIsSeededWithInitialData) {
    auto store = open_ready(Json{{"theme", "dark"}, {"volume", 7}});

    EXPECT_EQ(store->get_item("theme"), Json("dark"));
    EXPECT_EQ(store->get_item("volume"), Json(7));
    ASSERT_EQ(file_->write_count(), 1);
    EXPECT_EQ(file_->contents(), R"({"theme":"dark","volume":7})");
    EXPECT_FALSE(store->pending_flush());
}

TEST_F(KeyValueStoreTest, AbsentFileWithoutInitialDataWritesEmptyObject) {
    auto store = open_ready();

    EXPECT_EQ(store->size(), 0);
    EXPECT_EQ(file_->contents(), "{}");
}

TEST_F(KeyValueStoreTest, BlankFileIsTreatedAsNoPriorState) {
    file_ = std::make_shared<FakeFileStore>("fake/store.json", std::string(" \n\t"));
    auto store = open_ready(Json{{"seeded", true}});

    EXPECT_EQ(store->get_item("seeded"), Json(true));
    EXPECT_EQ(file_->contents(), R"({"seeded":true})");
}

TEST_F(KeyValueStoreTest, ExistingFileReplacesMappingAndIgnoresInitialData) {
    file_ = std::make_shared<FakeFileStore>("fake/store.json",
                                            std::string(R"({"b":2,"a":{"nested":[1,2]}})"));
    auto store = open_ready(Json{{"ignored", 1}});

    EXPECT_EQ(store->keys(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(store->get_item("a"), Json::parse(R"({"nested":[1,2]})"));
    EXPECT_FALSE(store->get_item("ignored").has_value());
    EXPECT_EQ(file_->write_count(), 0);
}

TEST_F(KeyValueStoreTest, InitPublishesLoadedMapping) {
    file_ = std::make_shared<FakeFileStore>("fake/store.json", std::string(R"({"a":1})"));
    auto opened = KeyValueStore::open("settings", options());

    std::vector<Json> published;
    auto id = opened.store->subscribe([&](const Json& mapping) { published.push_back(mapping); });
    ASSERT_NE(id, 0u);

    scheduler_->run_pending();

    ASSERT_EQ(published.size(), 1);
    EXPECT_EQ(published[0], (Json{{"a", 1}}));
}

TEST_F(KeyValueStoreTest, MutationsBeforeLoadAreOverwritten) {
    file_ = std::make_shared<FakeFileStore>("fake/store.json", std::string(R"({"a":1})"));
    auto opened = KeyValueStore::open("settings", options());

    opened.store->set_item("early", "value");
    EXPECT_EQ(opened.store->get_item("early"), Json("value"));

    scheduler_->run_pending();

    EXPECT_FALSE(opened.store->get_item("early").has_value());
    EXPECT_EQ(opened.store->get_item("a"), Json(1));
}

// LOAD FAILURES ---------------------------------------------------------------------------

TEST_F(KeyValueStoreTest, CorruptFileSetsLoadErrorAndStoreStaysUsable) {
    file_ = std::make_shared<FakeFileStore>("fake/store.json", std::string("{not json"));
    auto opened = KeyValueStore::open("settings", options());
    scheduler_->run_pending();
    auto store = opened.store;

    ASSERT_TRUE(is_ready(opened.ready));
    ASSERT_FALSE(opened.ready.get().ok());
    EXPECT_EQ(opened.ready.get().error().code, ErrorCode::LoadError);
    ASSERT_TRUE(store->last_error().has_value());
    EXPECT_EQ(store->last_error()->code, ErrorCode::LoadError);
    EXPECT_TRUE(store->initialized());
    EXPECT_EQ(store->size(), 0);

    store->set_item("k", "v");
    ASSERT_TRUE(store->flush().ok());

    auto written = Json::parse(file_->contents().value());
    EXPECT_EQ(written, (Json{{"k", "v"}}));
}

TEST_F(KeyValueStoreTest, NonObjectRootIsLoadError) {
    file_ = std::make_shared<FakeFileStore>("fake/store.json", std::string("[1,2,3]"));
    auto store = open_ready();

    ASSERT_TRUE(store->last_error().has_value());
    EXPECT_EQ(store->last_error()->code, ErrorCode::LoadError);
    EXPECT_EQ(store->size(), 0);
}

TEST_F(KeyValueStoreTest, ReadFailureIsIoError) {
    file_ = std::make_shared<FakeFileStore>("fake/store.json", std::string(R"({"a":1})"));
    file_->set_fail_reads(true);
    auto store = open_ready();

    ASSERT_TRUE(store->last_error().has_value());
    EXPECT_EQ(store->last_error()->code, ErrorCode::IoError);
    EXPECT_TRUE(store->initialized());
}

TEST_F(KeyValueStoreTest, SeedWriteFailureKeepsSeedInMemoryForRetry) {
    file_->set_fail_writes(true);
    auto opened = KeyValueStore::open("settings", options(), Json{{"a", 1}});
    scheduler_->run_pending();
    auto store = opened.store;

    ASSERT_FALSE(opened.ready.get().ok());
    EXPECT_EQ(opened.ready.get().error().code, ErrorCode::IoError);
    EXPECT_EQ(store->get_item("a"), Json(1));
    EXPECT_TRUE(store->pending_flush());

    file_->set_fail_writes(false);
    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(file_->contents(), R"({"a":1})");
    EXPECT_FALSE(store->pending_flush());
}

TEST_F(KeyValueStoreTest, NonObjectInitialDataIsRejected) {
    auto store = open_ready(Json::array({1, 2}));

    ASSERT_TRUE(store->last_error().has_value());
    EXPECT_EQ(store->last_error()->code, ErrorCode::SerializationError);
    EXPECT_EQ(store->size(), 0);
    EXPECT_EQ(file_->write_count(), 0);
}

// READS AND WRITES ------------------------------------------------------------------------

TEST_F(KeyValueStoreTest, GetMissingKeyReturnsNullopt) {
    auto store = open_ready();
    EXPECT_FALSE(store->get_item("missing").has_value());
    EXPECT_FALSE(store->last_error().has_value());
}

TEST_F(KeyValueStoreTest, StoredNullIsDistinctFromAbsent) {
    auto store = open_ready();
    store->set_item("nothing", nullptr);

    auto value = store->get_item("nothing");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->is_null());
}

TEST_F(KeyValueStoreTest, SetItemReplacesInPlaceAndAppendsNewKeys) {
    auto store = open_ready();
    store->set_item("a", 1);
    store->set_item("b", 2);
    store->set_item("c", 3);
    store->set_item("b", "two");

    EXPECT_EQ(store->keys(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(store->get_item("b"), Json("two"));
    EXPECT_EQ(store->size(), 3);
}

TEST_F(KeyValueStoreTest, RemoveAbsentKeyIsNoop) {
    auto store = open_ready();
    store->set_item("a", 1);

    auto future = store->remove("missing");
    scheduler_->advance(kDelay);

    ASSERT_TRUE(is_ready(future));
    EXPECT_TRUE(future.get().ok());
    EXPECT_EQ(store->snapshot(), (Json{{"a", 1}}));
}

TEST_F(KeyValueStoreTest, RemovePresentKey) {
    auto store = open_ready();
    store->set_item("a", 1);
    store->set_item("b", 2);

    store->remove("a");

    EXPECT_FALSE(store->get_item("a").has_value());
    EXPECT_FALSE(store->contains("a"));
    EXPECT_TRUE(store->contains("b"));
}

TEST_F(KeyValueStoreTest, ClearEmptiesMappingAndFile) {
    auto store = open_ready(Json{{"a", 1}, {"b", 2}});

    auto future = store->clear();
    EXPECT_EQ(store->size(), 0);

    scheduler_->advance(kDelay);
    ASSERT_TRUE(is_ready(future));
    EXPECT_TRUE(future.get().ok());
    EXPECT_EQ(file_->contents(), "{}");
}

TEST_F(KeyValueStoreTest, UnserializableValueIsRejectedWithoutTouchingMapping) {
    auto store = open_ready();
    std::vector<Json> published;
    store->subscribe([&](const Json& mapping) { published.push_back(mapping); });

    auto bad = store->set_item("bad", Json("\xff"));

    ASSERT_TRUE(is_ready(bad));
    ASSERT_FALSE(bad.get().ok());
    EXPECT_EQ(bad.get().error().code, ErrorCode::SerializationError);
    EXPECT_FALSE(store->contains("bad"));
    EXPECT_FALSE(store->pending_flush());
    EXPECT_TRUE(published.empty());
    ASSERT_TRUE(store->last_error().has_value());
    EXPECT_EQ(store->last_error()->code, ErrorCode::SerializationError);

    // later writes are unaffected
    auto good = store->set_item("good", 1);
    scheduler_->advance(kDelay);
    ASSERT_TRUE(is_ready(good));
    EXPECT_TRUE(good.get().ok());
    EXPECT_EQ(file_->contents(), R"({"good":1})");
    EXPECT_TRUE(store->flush().ok());
}

// DEBOUNCED FLUSH -------------------------------------------------------------------------

TEST_F(KeyValueStoreTest, RapidMutationsCoalesceIntoOneWrite) {
    auto store = open_ready();
    const auto writes_after_seed = file_->write_count();

    std::vector<FlushFuture> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(store->set_item("key" + std::to_string(i), i));
    }
    EXPECT_TRUE(store->pending_flush());
    EXPECT_EQ(file_->write_count(), writes_after_seed);

    scheduler_->advance(kDelay - Duration(1));
    EXPECT_EQ(file_->write_count(), writes_after_seed);

    scheduler_->advance(Duration(1));
    ASSERT_EQ(file_->write_count(), writes_after_seed + 1);
    EXPECT_FALSE(store->pending_flush());

    auto written = Json::parse(file_->contents().value());
    EXPECT_EQ(written.size(), 10);
    EXPECT_EQ(written["key9"], 9);

    for (const auto& future : futures) {
        ASSERT_TRUE(is_ready(future));
        EXPECT_TRUE(future.get().ok());
    }
}

TEST_F(KeyValueStoreTest, EachMutationRearmsTheTimer) {
    auto store = open_ready();
    const auto writes_after_seed = file_->write_count();

    store->set_item("a", 1);
    scheduler_->advance(Duration(30));
    store->set_item("b", 2);
    scheduler_->advance(Duration(30));
    EXPECT_EQ(file_->write_count(), writes_after_seed);

    scheduler_->advance(Duration(20));
    ASSERT_EQ(file_->write_count(), writes_after_seed + 1);
    EXPECT_EQ(file_->contents(), R"({"a":1,"b":2})");
}

TEST_F(KeyValueStoreTest, FlushWritesStateAsOfExecution) {
    auto store = open_ready();
    auto first = store->set_item("a", 1);
    auto second = store->remove("a");
    store->set_item("b", 2);
    EXPECT_FALSE(is_ready(first));

    scheduler_->advance(kDelay);

    ASSERT_TRUE(is_ready(first));
    ASSERT_TRUE(is_ready(second));
    EXPECT_TRUE(first.get().ok());
    EXPECT_EQ(file_->contents(), R"({"b":2})");
}

TEST_F(KeyValueStoreTest, FlushWithNothingPendingRewritesIdenticalBytes) {
    auto store = open_ready(Json{{"a", 1}});
    const auto writes_before = file_->write_count();

    ASSERT_TRUE(store->flush().ok());
    ASSERT_TRUE(store->flush().ok());

    auto writes = file_->writes();
    ASSERT_EQ(writes.size(), writes_before + 2);
    EXPECT_EQ(writes[writes.size() - 1], writes[writes.size() - 2]);
}

TEST_F(KeyValueStoreTest, ManualFlushSettlesPendingMutation) {
    auto store = open_ready();
    auto future = store->set_item("a", 1);
    const auto writes_before = file_->write_count();

    ASSERT_TRUE(store->flush().ok());
    ASSERT_TRUE(is_ready(future));
    EXPECT_TRUE(future.get().ok());
    EXPECT_FALSE(store->pending_flush());

    // the armed timer finds nothing pending
    scheduler_->advance(kDelay);
    EXPECT_EQ(file_->write_count(), writes_before + 1);
}

TEST_F(KeyValueStoreTest, FlushFailureKeepsPendingAndReportsError) {
    auto store = open_ready();
    std::vector<Error> observed;
    store->watch_errors([&](const Error& error) { observed.push_back(error); });

    file_->set_fail_writes(true);
    auto future = store->set_item("a", 1);
    scheduler_->advance(kDelay);

    ASSERT_TRUE(is_ready(future));
    ASSERT_FALSE(future.get().ok());
    EXPECT_EQ(future.get().error().code, ErrorCode::IoError);
    EXPECT_TRUE(store->pending_flush());
    EXPECT_EQ(store->get_item("a"), Json(1));
    ASSERT_EQ(observed.size(), 1);
    EXPECT_EQ(observed[0].code, ErrorCode::IoError);

    // the next mutation retries writing the full state
    file_->set_fail_writes(false);
    auto retry = store->set_item("b", 2);
    scheduler_->advance(kDelay);

    ASSERT_TRUE(retry.get().ok());
    EXPECT_FALSE(store->pending_flush());
    EXPECT_EQ(file_->contents(), R"({"a":1,"b":2})");

    // the error slot is sticky
    ASSERT_TRUE(store->last_error().has_value());
    EXPECT_EQ(store->last_error()->code, ErrorCode::IoError);
}

TEST_F(KeyValueStoreTest, ManualFlushFailureLeavesStateUnchanged) {
    auto store = open_ready(Json{{"a", 1}});
    store->set_item("b", 2);
    auto before = file_->contents();

    file_->set_fail_writes(true);
    auto result = store->flush();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
    EXPECT_EQ(store->snapshot(), (Json{{"a", 1}, {"b", 2}}));
    EXPECT_EQ(file_->contents(), before);
    EXPECT_TRUE(store->pending_flush());
}

TEST_F(KeyValueStoreTest, ReadsDoNotWaitForWriteInProgress) {
    auto store = open_ready(Json{{"a", 1}});
    file_->hold_writes();

    std::thread writer([&] { EXPECT_TRUE(store->flush().ok()); });
    file_->wait_for_held_write();

    auto read = std::async(std::launch::async, [&] { return store->get_item("a"); });
    const auto status = read.wait_for(std::chrono::seconds(2));
    file_->release_writes();
    writer.join();

    ASSERT_EQ(status, std::future_status::ready);
    EXPECT_EQ(read.get(), Json(1));
}

TEST_F(KeyValueStoreTest, MutationDuringWriteStaysPending) {
    auto store = open_ready();
    auto first = store->set_item("a", 1);
    file_->hold_writes();

    std::thread writer([&] { EXPECT_TRUE(store->flush().ok()); });
    file_->wait_for_held_write();
    auto second = store->set_item("b", 2);
    file_->release_writes();
    writer.join();

    // the write only covered the state it serialized
    ASSERT_TRUE(is_ready(first));
    EXPECT_TRUE(first.get().ok());
    EXPECT_FALSE(is_ready(second));
    EXPECT_TRUE(store->pending_flush());
    EXPECT_EQ(file_->contents(), R"({"a":1})");

    scheduler_->advance(kDelay);
    ASSERT_TRUE(is_ready(second));
    EXPECT_TRUE(second.get().ok());
    EXPECT_FALSE(store->pending_flush());
    EXPECT_EQ(file_->contents(), R"({"a":1,"b":2})");
}

TEST_F(KeyValueStoreTest, SupersededTimerNeitherWritesNorForgetsNewerTimer) {
    auto scheduler = std::make_shared<UncancellableScheduler>();
    StoreOptions opts = options();
    opts.scheduler = scheduler;
    KeyValueStore store("settings", opts);
    ASSERT_TRUE(store.init().ok());
    const auto writes_after_seed = file_->write_count();

    store.set_item("a", 1);
    scheduler->inner.advance(Duration(30));
    auto future = store.set_item("b", 2);
    const auto newest = scheduler->last_scheduled;

    // the first timer still fires
    scheduler->inner.advance(Duration(20));
    EXPECT_EQ(file_->write_count(), writes_after_seed);
    EXPECT_FALSE(is_ready(future));

    store.dispose();
    ASSERT_FALSE(scheduler->cancel_requests.empty());
    EXPECT_EQ(scheduler->cancel_requests.back(), newest);

    scheduler->inner.advance(kDelay);
    EXPECT_EQ(file_->write_count(), writes_after_seed);
}

// CHANGE STREAM ---------------------------------------------------------------------------

TEST_F(KeyValueStoreTest, ChangeStreamPublishesFullMappingInOrder) {
    auto store = open_ready();
    std::vector<Json> published;
    store->subscribe([&](const Json& mapping) { published.push_back(mapping); });

    store->set_item("a", 1);
    store->set_item("b", 2);
    store->remove("a");

    ASSERT_EQ(published.size(), 3);
    EXPECT_EQ(published[0], (Json{{"a", 1}}));
    EXPECT_EQ(published[1], (Json{{"a", 1}, {"b", 2}}));
    EXPECT_EQ(published[2], (Json{{"b", 2}}));
}

TEST_F(KeyValueStoreTest, ClearPublishesEmptyMapping) {
    auto store = open_ready(Json{{"a", 1}});
    std::vector<Json> published;
    store->subscribe([&](const Json& mapping) { published.push_back(mapping); });

    store->clear();

    ASSERT_EQ(published.size(), 1);
    EXPECT_EQ(published[0], Json::object());
}

TEST_F(KeyValueStoreTest, LateSubscriberSeesNoHistory) {
    auto store = open_ready();
    store->set_item("a", 1);

    std::vector<Json> published;
    store->subscribe([&](const Json& mapping) { published.push_back(mapping); });
    EXPECT_TRUE(published.empty());

    store->set_item("b", 2);
    ASSERT_EQ(published.size(), 1);
    EXPECT_EQ(published[0], (Json{{"a", 1}, {"b", 2}}));
}

TEST_F(KeyValueStoreTest, EverySubscriberIsNotifiedUntilUnsubscribed) {
    auto store = open_ready();
    int first = 0;
    int second = 0;
    auto first_id = store->subscribe([&](const Json&) { ++first; });
    store->subscribe([&](const Json&) { ++second; });

    store->set_item("a", 1);
    EXPECT_TRUE(store->unsubscribe(first_id));
    store->set_item("a", 2);

    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 2);
    EXPECT_FALSE(store->unsubscribe(first_id));
}

TEST_F(KeyValueStoreTest, SubscriberMayReadTheStore) {
    auto store = open_ready();
    std::optional<Json> seen;
    store->subscribe([&](const Json&) { seen = store->get_item("a"); });

    store->set_item("a", "x");
    EXPECT_EQ(seen, Json("x"));
}

// ERROR SLOT ------------------------------------------------------------------------------

TEST_F(KeyValueStoreTest, ReportErrorOverwritesSlotAndNotifiesWatchers) {
    auto store = open_ready();
    int notified = 0;
    auto id = store->watch_errors([&](const Error&) { ++notified; });

    store->report_error(Error{ErrorCode::SerializationError, "first"});
    store->report_error(Error{ErrorCode::IoError, "second"});

    ASSERT_TRUE(store->last_error().has_value());
    EXPECT_EQ(*store->last_error(), (Error{ErrorCode::IoError, "second"}));
    EXPECT_EQ(notified, 2);

    EXPECT_TRUE(store->unwatch_errors(id));
    store->report_error(Error{ErrorCode::IoError, "third"});
    EXPECT_EQ(notified, 2);
}

// DISPOSE ---------------------------------------------------------------------------------

TEST_F(KeyValueStoreTest, DisposeCancelsPendingFlushWithoutWriting) {
    auto store = open_ready();
    const auto writes_before = file_->write_count();
    int notified = 0;
    store->subscribe([&](const Json&) { ++notified; });

    auto future = store->set_item("a", 1);
    store->dispose();

    EXPECT_TRUE(store->disposed());
    EXPECT_EQ(scheduler_->pending_timers(), 0);
    ASSERT_TRUE(is_ready(future));
    EXPECT_EQ(future.get().error().code, ErrorCode::Disposed);

    scheduler_->advance(kDelay * 2);
    EXPECT_EQ(file_->write_count(), writes_before);
    EXPECT_TRUE(store->pending_flush());
    // still readable in memory
    EXPECT_EQ(store->get_item("a"), Json(1));
    EXPECT_EQ(notified, 1);
}

TEST_F(KeyValueStoreTest, MutationsAfterDisposeAreRejected) {
    auto store = open_ready(Json{{"a", 1}});
    store->dispose();

    auto future = store->set_item("b", 2);
    ASSERT_TRUE(is_ready(future));
    EXPECT_EQ(future.get().error().code, ErrorCode::Disposed);
    EXPECT_EQ(store->remove("a").get().error().code, ErrorCode::Disposed);
    EXPECT_EQ(store->clear().get().error().code, ErrorCode::Disposed);
    EXPECT_EQ(store->snapshot(), (Json{{"a", 1}}));
}

TEST_F(KeyValueStoreTest, FlushAfterDisposeStillWrites) {
    auto store = open_ready();
    store->set_item("a", 1);
    store->dispose();

    ASSERT_TRUE(store->flush().ok());
    EXPECT_EQ(file_->contents(), R"({"a":1})");
}

TEST_F(KeyValueStoreTest, DisposeTwiceIsHarmless) {
    auto store = open_ready();
    store->dispose();
    store->dispose();
    EXPECT_TRUE(store->disposed());
}

TEST_F(KeyValueStoreTest, ConstructorRejectsMissingCollaborators) {
    StoreOptions opts;
    opts.scheduler = scheduler_;
    EXPECT_THROW(KeyValueStore("settings", opts), std::invalid_argument);

    opts.file = file_;
    opts.scheduler = nullptr;
    EXPECT_THROW(KeyValueStore("settings", opts), std::invalid_argument);
}

// ON DISK ---------------------------------------------------------------------------------

class KeyValueStoreDiskTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "key_value_store_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        path_ = test_dir_ / "prefs.json";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::shared_ptr<util::Scheduler> scheduler_ = std::make_shared<ManualScheduler>();
    std::filesystem::path test_dir_;
    std::filesystem::path path_;
};

TEST_F(KeyValueStoreDiskTest, RoundTripThroughFreshStore) {
    const Json mapping = Json::parse(
        R"({"name":"ada","age":36,"tags":["math","engines"],"meta":{"active":true},"none":null})");
    {
        StoreOptions opts;
        opts.file = std::make_shared<LocalFileStore>(path_);
        opts.scheduler = scheduler_;
        KeyValueStore store("prefs", opts);
        ASSERT_TRUE(store.init(Json{{"stale", 1}}).ok());

        store.clear();
        for (const auto& item : mapping.items()) {
            store.set_item(item.key(), item.value());
        }
        ASSERT_TRUE(store.flush().ok());
    }

    StoreOptions opts;
    opts.file = std::make_shared<LocalFileStore>(path_);
    opts.scheduler = scheduler_;
    KeyValueStore fresh("prefs", opts);
    ASSERT_TRUE(fresh.init().ok());

    for (const auto& item : mapping.items()) {
        EXPECT_EQ(fresh.get_item(item.key()), item.value()) << item.key();
    }
    EXPECT_FALSE(fresh.get_item("stale").has_value());
}

TEST_F(KeyValueStoreDiskTest, CorruptFileOnDiskIsOverwrittenWithValidJson) {
    {
        std::ofstream out(path_);
        out << "{\"unterminated\": ";
    }

    StoreOptions opts;
    opts.file = std::make_shared<LocalFileStore>(path_);
    opts.scheduler = scheduler_;
    KeyValueStore store("prefs", opts);

    auto result = store.init();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::LoadError);

    store.set_item("fixed", true);
    ASSERT_TRUE(store.flush().ok());

    std::ifstream in(path_);
    Json on_disk = Json::parse(in);
    EXPECT_EQ(on_disk, (Json{{"fixed", true}}));
}

TEST_F(KeyValueStoreDiskTest, DebouncedFlushOnEventLoop) {
    StoreOptions opts;
    opts.file = std::make_shared<LocalFileStore>(path_);
    opts.scheduler = std::make_shared<util::EventLoop>();
    opts.flush_delay = Duration(10);

    auto opened = KeyValueStore::open("prefs", opts, Json{{"seed", 0}});
    ASSERT_EQ(opened.ready.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_TRUE(opened.ready.get().ok());

    opened.store->set_item("a", 1);
    auto future = opened.store->set_item("b", 2);
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ASSERT_TRUE(future.get().ok());

    std::ifstream in(path_);
    Json on_disk = Json::parse(in);
    EXPECT_EQ(on_disk, (Json{{"seed", 0}, {"a", 1}, {"b", 2}}));
}

}  // namespace localstore::core::test
