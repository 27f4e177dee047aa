#include "localstore/core/value_adapter.hpp"

#include <exception>
#include <future>
#include <string>
#include <utility>

namespace localstore::core {

Result<Json> normalize(const ToJson& value) {
    try {
        Json json = value.to_json();
        // dump() rejects what the file format cannot hold (e.g. strings that are not UTF-8)
        static_cast<void>(json.dump());
        return json;
    } catch (const std::exception& e) {
        return Error{ErrorCode::SerializationError, e.what()};
    }
}

FlushFuture set_item(KeyValueStore& store, std::string_view key, const ToJson& value) {
    Result<Json> normalized = normalize(value);
    if (!normalized.ok()) {
        Error error{ErrorCode::SerializationError,
                    "value for key '" + std::string(key) + "': " + normalized.error().message};
        store.report_error(error);

        std::promise<Result<void>> promise;
        promise.set_value(std::move(error));
        return promise.get_future().share();
    }
    return store.set_item(key, std::move(normalized).value());
}

}  // namespace localstore::core
