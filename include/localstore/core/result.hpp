#ifndef LOCALSTORE_CORE_RESULT_HPP
#define LOCALSTORE_CORE_RESULT_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace localstore::core {

enum class ErrorCode {
    LoadError,           // backing file is not valid JSON, or its root is not an object
    IoError,             // reading or writing the backing file failed
    SerializationError,  // a value could not be turned into JSON
    Disposed,            // operation on (or flush cancelled by) a disposed store
    Internal             // the in-memory mapping broke an invariant
};

[[nodiscard]] std::string_view to_string(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;

    [[nodiscard]] std::string describe() const;

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

// thrown by FileStore implementations, the store turns it into an ErrorCode::IoError result
class IoError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/*
    outcome of an operation whose failure is an expected, recoverable condition (bad file, full
    disk). the store never unwinds the caller's control flow for these, it hands back a Result and
    records the error on its error channel.
*/
template <typename T>
class Result {
   public:
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const {
        return data_.index() == 0;
    }
    explicit operator bool() const {
        return ok();
    }

    // precondition: ok()
    [[nodiscard]] const T& value() const& {
        return std::get<0>(data_);
    }
    [[nodiscard]] T&& value() && {
        return std::get<0>(std::move(data_));
    }

    // precondition: !ok()
    [[nodiscard]] const Error& error() const {
        return std::get<1>(data_);
    }

   private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
   public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    [[nodiscard]] bool ok() const {
        return !error_.has_value();
    }
    explicit operator bool() const {
        return ok();
    }

    // precondition: !ok()
    [[nodiscard]] const Error& error() const {
        return error_.value();
    }

   private:
    std::optional<Error> error_;
};

}  // namespace localstore::core

#endif
