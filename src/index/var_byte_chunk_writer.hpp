#pragma once

#include "index/chunk_fwd_writer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkfwd {

// Writes variable-length byte values into a chunked forward index.
//
// Chunk layout (before compression):
//   int32 row_offset[docs_per_chunk]   start of each value, from chunk start
//   value bytes, concatenated
//
// In a partially filled chunk the row offsets of absent docs are zero.
// Only format versions 2 and 3 accept variable-width values.
class VarByteChunkWriter {
public:
    explicit VarByteChunkWriter(const Logger& logger = Logger(Logger::kWarn));

    // Uncompressed chunk capacity for docs_per_chunk values of at most
    // longest_entry bytes each.
    static int64_t chunk_size_for(int32_t docs_per_chunk, int32_t longest_entry);

    Status open(const std::string& path, ChunkCompressionType compression,
                int32_t total_docs, int32_t docs_per_chunk, int32_t longest_entry,
                int32_t version);

    Status put_bytes(const uint8_t* data, size_t n);
    Status put_string(const std::string& value);

    Status close();

    const ChunkForwardIndexWriter& writer() const { return writer_; }

private:
    Status write_chunk();

    ChunkForwardIndexWriter writer_;
    size_t row_offsets_size_ = 0;  // bytes of row offsets per chunk
    size_t row_offset_pos_ = 0;    // next row offset slot
    size_t data_pos_ = 0;          // next value byte
};

} // namespace chunkfwd
