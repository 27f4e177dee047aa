#ifndef LOCALSTORE_CORE_FILE_STORE_HPP
#define LOCALSTORE_CORE_FILE_STORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace localstore::core {

/*
    byte-level access to the one file backing a store. the store only ever reads or replaces the
    whole file. implementations throw IoError when the filesystem refuses.
*/
class IFileStore {
   public:
    virtual ~IFileStore() = default;

    [[nodiscard]] virtual bool exists() const = 0;
    // nullopt when the file does not exist
    [[nodiscard]] virtual std::optional<std::string> read_all() const = 0;
    virtual void write_all(std::string_view bytes) = 0;
    [[nodiscard]] virtual std::filesystem::path path() const = 0;
};

class LocalFileStore : public IFileStore {
   public:
    explicit LocalFileStore(std::filesystem::path path);

    [[nodiscard]] bool exists() const override;
    [[nodiscard]] std::optional<std::string> read_all() const override;
    void write_all(std::string_view bytes) override;
    [[nodiscard]] std::filesystem::path path() const override;

   private:
    std::filesystem::path path_;
};

// $LOCALSTORE_DIR, $XDG_DATA_HOME/localstore, $HOME/.local/share/localstore, <tmp>/localstore
[[nodiscard]] std::filesystem::path default_store_dir();

// <dir>/<name>.json, dir falls back to default_store_dir()
[[nodiscard]] std::filesystem::path resolve_store_path(
    std::string_view name, const std::optional<std::filesystem::path>& dir = std::nullopt);

}  // namespace localstore::core

#endif
