#pragma once

#include <cstdint>
#include <string>

namespace chunkfwd {

// Compression identifiers as stored in the forward index header.
enum class ChunkCompressionType : int32_t {
    kPassThrough = 0,
    kSnappy = 1,
    kZstandard = 2,
    kLz4 = 3,
    kLz4LengthPrefixed = 4,
    kGzip = 5,
};

inline int32_t compression_type_value(ChunkCompressionType type) {
    return static_cast<int32_t>(type);
}

// "PASS_THROUGH", "GZIP", ...
const char* compression_type_name(ChunkCompressionType type);

// Case-insensitive name lookup. Returns false for an unknown name.
bool parse_compression_type(const std::string& name, ChunkCompressionType& out);

// Header value lookup. Returns false for an unknown value.
bool compression_type_from_value(int32_t value, ChunkCompressionType& out);

} // namespace chunkfwd
