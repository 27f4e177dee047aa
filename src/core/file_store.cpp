#include "localstore/core/file_store.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "localstore/core/result.hpp"

namespace localstore::core {

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> env_path(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return fs::path(value);
}

}  // namespace

LocalFileStore::LocalFileStore(fs::path path) : path_(std::move(path)) {}

bool LocalFileStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

std::optional<std::string> LocalFileStore::read_all() const {
    if (!exists()) {
        return std::nullopt;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw IoError("failed to open store file: " + path_.string());
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IoError("failed to read store file: " + path_.string());
    }
    return buffer.str();
}

void LocalFileStore::write_all(std::string_view bytes) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw IoError("failed to create directory " + path_.parent_path().string() + ": " +
                          ec.message());
        }
    }

    // write to temp file first then rename. a crash mid write keeps the previous content
    fs::path temp_path = path_.string() + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw IoError("failed to open temp file: " + temp_path.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(temp_path, ec);
            throw IoError("failed to write store file: " + temp_path.string());
        }
    }

    fs::rename(temp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw IoError("failed to replace store file " + path_.string() + ": " + ec.message());
    }
}

fs::path LocalFileStore::path() const {
    return path_;
}

fs::path default_store_dir() {
    if (auto dir = env_path("LOCALSTORE_DIR")) {
        return *dir;
    }
    if (auto xdg = env_path("XDG_DATA_HOME")) {
        return *xdg / "localstore";
    }
    if (auto home = env_path("HOME")) {
        return *home / ".local" / "share" / "localstore";
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "localstore";
}

fs::path resolve_store_path(std::string_view name, const std::optional<fs::path>& dir) {
    fs::path base = dir.has_value() ? *dir : default_store_dir();
    return base / (std::string(name) + ".json");
}

}  // namespace localstore::core
