#ifndef LOCALSTORE_UTIL_CONFIG_HPP
#define LOCALSTORE_UTIL_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "localstore/util/logger.hpp"

namespace localstore::util {

struct Config {
    // storage. no data_dir means the platform default directory
    std::optional<std::filesystem::path> data_dir = std::nullopt;
    int64_t flush_delay_ms = 50;

    // logging
    LogLevel log_level = LogLevel::Info;

    // non-option command line arguments, in order
    std::vector<std::string> positional;

    // Load from file (TOML-like format)
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // merge: CLI overrides file
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);
};

[[nodiscard]] LogLevel parse_log_level(const std::string& s);

}  // namespace localstore::util

#endif
