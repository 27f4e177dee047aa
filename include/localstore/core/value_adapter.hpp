#ifndef LOCALSTORE_CORE_VALUE_ADAPTER_HPP
#define LOCALSTORE_CORE_VALUE_ADAPTER_HPP

#include <string_view>

#include "localstore/core/key_value_store.hpp"
#include "localstore/core/result.hpp"
#include "localstore/util/types.hpp"

namespace localstore::core {

// implemented by caller types that know how to turn themselves into JSON
class ToJson {
   public:
    virtual ~ToJson() = default;
    [[nodiscard]] virtual Json to_json() const = 0;
};

// SerializationError when to_json() throws or yields something that cannot be dumped
[[nodiscard]] Result<Json> normalize(const ToJson& value);

/*
    stores `value` under `key`. a serialization failure never reaches the store's mapping: it is
    reported on the store's error channel and returned as an already resolved future.
*/
FlushFuture set_item(KeyValueStore& store, std::string_view key, const ToJson& value);

}  // namespace localstore::core

#endif
