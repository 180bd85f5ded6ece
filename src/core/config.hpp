#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>

namespace chunkfwd {

// Raw forward index format versions
inline constexpr int32_t MIN_FORMAT_VERSION = 2;
inline constexpr int32_t MAX_FORMAT_VERSION = 5;
inline constexpr int32_t DEFAULT_FORMAT_VERSION = 2;

// Header layout: seven int32 fields, then the chunk offset table
inline constexpr size_t HEADER_FIELD_COUNT = 7;
inline constexpr size_t HEADER_FIELD_SIZE = sizeof(int32_t);
inline constexpr size_t HEADER_FIXED_SIZE = HEADER_FIELD_COUNT * HEADER_FIELD_SIZE; // 28

// Largest chunk (and largest offset a v2 offset table can hold)
inline constexpr int64_t MAX_CHUNK_SIZE = std::numeric_limits<int32_t>::max();
inline constexpr uint64_t MAX_INT_OFFSET = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());

// Var-byte chunks start with one int32 row offset per document
inline constexpr int32_t VAR_ROW_OFFSET_SIZE = sizeof(int32_t);

// Per-column chunking defaults
inline constexpr int64_t DEFAULT_TARGET_MAX_CHUNK_SIZE = int64_t(1) << 20; // 1 MB
inline constexpr int32_t DEFAULT_TARGET_DOCS_PER_CHUNK = 1000;

// File extension of a single-value raw forward index
inline constexpr const char* RAW_SV_FWD_EXTENSION = ".sv.raw.fwd";

// Offset table entry width for a format version: int32 for v2, int64 after.
inline constexpr size_t offset_entry_size(int32_t version) {
    return version == 2 ? sizeof(int32_t) : sizeof(int64_t);
}

// Number of chunks needed for total_docs documents (ceiling division).
inline constexpr int32_t num_chunks_for(int32_t total_docs, int32_t docs_per_chunk) {
    return static_cast<int32_t>(
        (static_cast<int64_t>(total_docs) + docs_per_chunk - 1) / docs_per_chunk);
}

// Round up to the next power of two (v >= 1).
inline constexpr int32_t next_power_of_two(int32_t v) {
    uint32_t x = static_cast<uint32_t>(v) - 1;
    x |= x >> 1;
    x |= x >> 2;
    x |= x >> 4;
    x |= x >> 8;
    x |= x >> 16;
    return static_cast<int32_t>(x + 1);
}

} // namespace chunkfwd
