#include "compression/compression_type.hpp"

#include <algorithm>
#include <cctype>

namespace chunkfwd {

namespace {

struct TypeEntry {
    ChunkCompressionType type;
    const char* name;
};

constexpr TypeEntry kTypes[] = {
    {ChunkCompressionType::kPassThrough,       "PASS_THROUGH"},
    {ChunkCompressionType::kSnappy,            "SNAPPY"},
    {ChunkCompressionType::kZstandard,         "ZSTANDARD"},
    {ChunkCompressionType::kLz4,               "LZ4"},
    {ChunkCompressionType::kLz4LengthPrefixed, "LZ4_LENGTH_PREFIXED"},
    {ChunkCompressionType::kGzip,              "GZIP"},
};

} // namespace

const char* compression_type_name(ChunkCompressionType type) {
    for (const auto& e : kTypes) {
        if (e.type == type) return e.name;
    }
    return "UNKNOWN";
}

bool parse_compression_type(const std::string& name, ChunkCompressionType& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const auto& e : kTypes) {
        if (upper == e.name) {
            out = e.type;
            return true;
        }
    }
    return false;
}

bool compression_type_from_value(int32_t value, ChunkCompressionType& out) {
    for (const auto& e : kTypes) {
        if (static_cast<int32_t>(e.type) == value) {
            out = e.type;
            return true;
        }
    }
    return false;
}

} // namespace chunkfwd
