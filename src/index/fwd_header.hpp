#pragma once

#include "compression/compression_type.hpp"
#include "core/status.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chunkfwd {

// Raw forward index file header (all fields big-endian):
//
//   0x00  int32  format version (2..5)
//   0x04  int32  number of chunks = ceil(total_docs / docs_per_chunk)
//   0x08  int32  docs per chunk
//   0x0C  int32  entry size in bytes (max size for var-byte entries)
//   0x10  int32  total docs
//   0x14  int32  compression type
//   0x18  int32  start of chunk offset table (always 0x1C)
//   0x1C  chunk offsets, int32 for version 2, int64 for version 3+
//
// The chunk offsets are collected in memory as chunks are flushed and the
// whole header is serialized once when the file is finalized.
class ForwardIndexHeader {
public:
    ForwardIndexHeader() = default;
    ForwardIndexHeader(int32_t version, int32_t total_docs, int32_t docs_per_chunk,
                       int32_t entry_size, ChunkCompressionType compression);

    // Version 2 or 3 always; 4 or 5 only for fixed-width entries.
    static Status validate_version(int32_t version, bool fixed_width);

    int32_t version() const { return version_; }
    int32_t num_chunks() const { return num_chunks_; }
    int32_t docs_per_chunk() const { return docs_per_chunk_; }
    int32_t entry_size() const { return entry_size_; }
    int32_t total_docs() const { return total_docs_; }
    ChunkCompressionType compression() const { return compression_; }
    int32_t offset_table_start() const;

    size_t offset_size() const;
    size_t size() const;

    const std::vector<uint64_t>& chunk_offsets() const { return chunk_offsets_; }
    bool offsets_full() const {
        return chunk_offsets_.size() >= static_cast<size_t>(num_chunks_);
    }

    // Check that offset can be stored in this header's offset width.
    Status check_offset(uint64_t offset) const;

    // Record the file offset of the next chunk.
    Status add_chunk_offset(uint64_t offset);

    // Exactly size() bytes. Offset slots of chunks never flushed are zero.
    std::vector<uint8_t> serialize() const;

private:
    int32_t version_ = 0;
    int32_t num_chunks_ = 0;
    int32_t docs_per_chunk_ = 0;
    int32_t entry_size_ = 0;
    int32_t total_docs_ = 0;
    ChunkCompressionType compression_ = ChunkCompressionType::kPassThrough;
    std::vector<uint64_t> chunk_offsets_;
};

} // namespace chunkfwd
