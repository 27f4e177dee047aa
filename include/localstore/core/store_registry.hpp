#ifndef LOCALSTORE_CORE_STORE_REGISTRY_HPP
#define LOCALSTORE_CORE_STORE_REGISTRY_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "localstore/core/file_store.hpp"
#include "localstore/core/key_value_store.hpp"
#include "localstore/util/scheduler.hpp"
#include "localstore/util/types.hpp"

namespace localstore::core {

using FileStoreFactory = std::function<std::shared_ptr<IFileStore>(const std::filesystem::path&)>;

struct RegistryOptions {
    // nullptr: the registry runs its own EventLoop
    std::shared_ptr<util::Scheduler> scheduler = nullptr;
    // overrides default_store_dir() for stores requested without a directory
    std::optional<std::filesystem::path> default_dir = std::nullopt;
    util::Duration flush_delay = util::Duration(50);
    // nullptr: LocalFileStore
    FileStoreFactory file_factory = nullptr;
};

/*
    hands out exactly one KeyValueStore per name. the first get() for a name decides its file and
    initial data, later calls return the cached instance and ignore both. entries are never
    evicted, a disposed store stays cached.
*/
class StoreRegistry {
   public:
    StoreRegistry();
    explicit StoreRegistry(RegistryOptions options);
    ~StoreRegistry();

    StoreRegistry(const StoreRegistry&) = delete;
    StoreRegistry& operator=(const StoreRegistry&) = delete;

    // returns immediately, wait on the store's ready() before first use
    [[nodiscard]] std::shared_ptr<KeyValueStore> get(
        const std::string& name, const std::optional<std::filesystem::path>& dir = std::nullopt,
        const std::optional<Json>& initial_data = std::nullopt);

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::shared_ptr<util::Scheduler> scheduler() const;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace localstore::core

#endif
