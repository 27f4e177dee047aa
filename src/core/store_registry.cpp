#include "localstore/core/store_registry.hpp"

#include <mutex>
#include <unordered_map>
#include <utility>

#include "localstore/util/logger.hpp"

namespace localstore::core {

class StoreRegistry::Impl {
   public:
    explicit Impl(RegistryOptions options) : options_(std::move(options)) {
        if (!options_.scheduler) {
            options_.scheduler = std::make_shared<util::EventLoop>();
        }
        if (!options_.file_factory) {
            options_.file_factory = [](const std::filesystem::path& path) {
                return std::make_shared<LocalFileStore>(path);
            };
        }
    }

    std::shared_ptr<KeyValueStore> get(const std::string& name,
                                       const std::optional<std::filesystem::path>& dir,
                                       const std::optional<Json>& initial_data) {
        std::lock_guard lock(mutex_);

        auto it = stores_.find(name);
        if (it != stores_.end()) {
            if (dir.has_value() || initial_data.has_value()) {
                LOG_DEBUG("store '" + name + "' already open, ignoring directory and initial data");
            }
            if (it->second->disposed()) {
                LOG_WARN("returning disposed store '" + name + "'");
            }
            return it->second;
        }

        auto path = resolve_store_path(name, dir.has_value() ? dir : options_.default_dir);

        StoreOptions store_options;
        store_options.file = options_.file_factory(path);
        store_options.scheduler = options_.scheduler;
        store_options.flush_delay = options_.flush_delay;

        auto opened =
            KeyValueStore::open(name, store_options, initial_data.value_or(Json::object()));
        stores_.emplace(name, opened.store);
        LOG_INFO("opened store '" + name + "' at " + path.string());
        return opened.store;
    }

    bool contains(std::string_view name) const {
        std::lock_guard lock(mutex_);
        return stores_.find(std::string(name)) != stores_.end();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return stores_.size();
    }

    std::shared_ptr<util::Scheduler> scheduler() const {
        return options_.scheduler;
    }

   private:
    RegistryOptions options_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<KeyValueStore>> stores_;
};

// PIMPL INTERFACE ---------------------------------------------------------------------------

StoreRegistry::StoreRegistry() : impl_(std::make_unique<Impl>(RegistryOptions{})) {}
StoreRegistry::StoreRegistry(RegistryOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}
StoreRegistry::~StoreRegistry() = default;
std::shared_ptr<KeyValueStore> StoreRegistry::get(const std::string& name,
                                                  const std::optional<std::filesystem::path>& dir,
                                                  const std::optional<Json>& initial_data) {
    return impl_->get(name, dir, initial_data);
}
bool StoreRegistry::contains(std::string_view name) const {
    return impl_->contains(name);
}
std::size_t StoreRegistry::size() const {
    return impl_->size();
}
std::shared_ptr<util::Scheduler> StoreRegistry::scheduler() const {
    return impl_->scheduler();
}

}  // namespace localstore::core
