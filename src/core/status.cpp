#include "core/status.hpp"

namespace chunkfwd {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:            return "OK";
        case ErrorCode::kConfiguration: return "ConfigurationError";
        case ErrorCode::kOverflow:      return "OverflowError";
        case ErrorCode::kCompression:   return "CompressionError";
        case ErrorCode::kIO:            return "IOError";
        case ErrorCode::kUsage:         return "UsageError";
    }
    return "UnknownError";
}

std::string Status::to_string() const {
    if (ok()) return "OK";
    return std::string(error_code_name(code_)) + ": " + message_;
}

} // namespace chunkfwd
