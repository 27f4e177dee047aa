#include "localstore/core/result.hpp"

namespace localstore::core {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::LoadError:
            return "LoadError";
        case ErrorCode::IoError:
            return "IOError";
        case ErrorCode::SerializationError:
            return "SerializationError";
        case ErrorCode::Disposed:
            return "Disposed";
        case ErrorCode::Internal:
            return "Internal";
    }
    return "Unknown";
}

std::string Error::describe() const {
    return std::string(to_string(code)) + ": " + message;
}

}  // namespace localstore::core
