#include "localstore/util/config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace localstore::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

int64_t parse_delay(const std::string& s) {
    int64_t value = std::stoll(s);
    if (value < 0) {
        throw std::invalid_argument("flush delay must not be negative: " + s);
    }
    return value;
}

}  // namespace

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "none") return LogLevel::None;
    return LogLevel::Info;
}

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "data_dir") {
            config.data_dir = value;
        } else if (key == "flush_delay_ms") {
            config.flush_delay_ms = parse_delay(value);
        } else if (key == "log_level") {
            config.log_level = parse_log_level(value);
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options] <store> <command> [key] [value]\n"
                      << "Commands:\n"
                      << "  get KEY                    Print the value stored under KEY\n"
                      << "  set KEY VALUE              Store VALUE (JSON, or a plain string)\n"
                      << "  remove KEY                 Delete KEY\n"
                      << "  clear                      Delete every key\n"
                      << "  keys                       List keys, one per line\n"
                      << "  dump                       Print the whole store as JSON\n"
                      << "Options:\n"
                      << "  -c, --config FILE          Config file path\n"
                      << "  -d, --data-dir DIR         Directory holding the store files\n"
                      << "  -f, --flush-delay MS       Debounce window for disk writes (default: 50)\n"
                      << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
                      << "  -h, --help                 Show this help\n";
            return std::nullopt;
        }
        if ((arg == "-d" || arg == "--data-dir") && i + 1 < argc) {
            config.data_dir = argv[++i];
        } else if ((arg == "-f" || arg == "--flush-delay") && i + 1 < argc) {
            config.flush_delay_ms = parse_delay(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            config.log_level = parse_log_level(argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // Config file handled separately in main
            ++i;
        } else {
            config.positional.push_back(arg);
        }
    }

    return config;
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;
    // File overrides defaults
    if (file_config.data_dir != defaults.data_dir) result.data_dir = file_config.data_dir;
    if (file_config.flush_delay_ms != defaults.flush_delay_ms) result.flush_delay_ms = file_config.flush_delay_ms;
    if (file_config.log_level != defaults.log_level) result.log_level = file_config.log_level;

    // CLI overrides file
    if (cli_config.data_dir != defaults.data_dir) result.data_dir = cli_config.data_dir;
    if (cli_config.flush_delay_ms != defaults.flush_delay_ms) result.flush_delay_ms = cli_config.flush_delay_ms;
    if (cli_config.log_level != defaults.log_level) result.log_level = cli_config.log_level;

    // only the command line carries positional arguments
    result.positional = cli_config.positional;

    return result;
}

}  // namespace localstore::util
