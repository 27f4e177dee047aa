#include <chrono>
#include <exception>
#include <filesystem>
#include <future>
#include <iostream>
#include <string>
#include <vector>

#include "localstore/core/key_value_store.hpp"
#include "localstore/core/store_registry.hpp"
#include "localstore/util/config.hpp"
#include "localstore/util/logger.hpp"

namespace {

using localstore::core::Json;
using localstore::core::KeyValueStore;

constexpr auto kInitTimeout = std::chrono::seconds(10);

// values that do not parse as JSON are stored as plain strings
Json parse_value(const std::string& text) {
    Json value = Json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        return Json(text);
    }
    return value;
}

bool wait_for_flush(const localstore::core::FlushFuture& future) {
    auto result = future.get();
    if (!result.ok()) {
        LOG_ERROR(result.error().describe());
        return false;
    }
    return true;
}

int run_command(KeyValueStore& store, const std::vector<std::string>& args) {
    const std::string& command = args[1];

    if (command == "get" && args.size() == 3) {
        auto value = store.get_item(args[2]);
        if (!value.has_value()) {
            LOG_ERROR("no such key: " + args[2]);
            return 1;
        }
        std::cout << value->dump(2) << std::endl;
        return 0;
    }
    if (command == "set" && args.size() == 4) {
        return wait_for_flush(store.set_item(args[2], parse_value(args[3]))) ? 0 : 1;
    }
    if (command == "remove" && args.size() == 3) {
        return wait_for_flush(store.remove(args[2])) ? 0 : 1;
    }
    if (command == "clear" && args.size() == 2) {
        return wait_for_flush(store.clear()) ? 0 : 1;
    }
    if (command == "keys" && args.size() == 2) {
        for (const auto& key : store.keys()) {
            std::cout << key << "\n";
        }
        return 0;
    }
    if (command == "dump" && args.size() == 2) {
        std::cout << store.snapshot().dump(2) << std::endl;
        return 0;
    }

    LOG_ERROR("unknown command or wrong number of arguments: " + command);
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        localstore::util::Config defaults;
        localstore::util::Config file_config = defaults;
        localstore::util::Config cli_config = defaults;

        // first pass: find config_path
        std::filesystem::path config_path;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
                break;
            }
        }

        // load config file if specified
        if (!config_path.empty()) {
            auto loaded = localstore::util::Config::load_file(config_path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << config_path << std::endl;
            }
        }

        auto cli_result = localstore::util::Config::parse_args(argc, argv);
        if (!cli_result) {
            return 0;  // --help was shown
        }
        cli_config = *cli_result;

        // Merge: CLI > file > defaults
        auto config = localstore::util::Config::merge(file_config, cli_config, defaults);

        localstore::util::Logger::instance().set_level(config.log_level);

        if (config.positional.size() < 2) {
            std::cerr << "Usage: " << argv[0] << " [options] <store> <command> [key] [value]\n"
                      << "Try --help for details." << std::endl;
            return 1;
        }

        localstore::core::RegistryOptions registry_opts;
        registry_opts.default_dir = config.data_dir;
        registry_opts.flush_delay = localstore::util::Duration(config.flush_delay_ms);
        localstore::core::StoreRegistry registry(registry_opts);

        auto store = registry.get(config.positional[0]);
        auto ready = store->ready();
        if (ready.wait_for(kInitTimeout) != std::future_status::ready) {
            LOG_ERROR("timed out opening store '" + store->name() + "'");
            return 1;
        }
        if (auto init = ready.get(); !init.ok()) {
            LOG_ERROR("failed to open store '" + store->name() + "': " + init.error().describe());
            return 1;
        }

        int status = run_command(*store, config.positional);

        // durability point before exit
        if (auto flushed = store->flush(); !flushed.ok()) {
            LOG_ERROR(flushed.error().describe());
            status = 1;
        }
        store->dispose();
        return status;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
