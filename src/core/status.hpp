#pragma once

#include <string>
#include <utility>

namespace chunkfwd {

enum class ErrorCode {
    kOk = 0,
    kConfiguration, // illegal construction parameters
    kOverflow,      // offset does not fit the offset table width
    kCompression,   // compressor failed on a chunk
    kIO,            // open/write/close failure
    kUsage,         // operation not valid in the current writer state
};

const char* error_code_name(ErrorCode code);

// Result of a fallible operation. Default-constructed Status is OK.
class Status {
public:
    Status() = default;
    Status(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    bool ok() const { return code_ == ErrorCode::kOk; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // "<code>: <message>", or "OK"
    std::string to_string() const;

private:
    ErrorCode code_ = ErrorCode::kOk;
    std::string message_;
};

inline Status configuration_error(std::string msg) {
    return Status(ErrorCode::kConfiguration, std::move(msg));
}
inline Status overflow_error(std::string msg) {
    return Status(ErrorCode::kOverflow, std::move(msg));
}
inline Status compression_error(std::string msg) {
    return Status(ErrorCode::kCompression, std::move(msg));
}
inline Status io_error(std::string msg) {
    return Status(ErrorCode::kIO, std::move(msg));
}
inline Status usage_error(std::string msg) {
    return Status(ErrorCode::kUsage, std::move(msg));
}

} // namespace chunkfwd
