#pragma once

#include "compression/chunk_compressor.hpp"
#include "core/status.hpp"
#include "index/fwd_header.hpp"
#include "io/chunk_buffer.hpp"
#include "io/data_file.hpp"
#include "util/logger.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkfwd {

struct ChunkWriterParams {
    ChunkCompressionType compression = ChunkCompressionType::kPassThrough;
    int32_t total_docs = 0;
    int32_t docs_per_chunk = 0;
    int64_t chunk_size = 0;   // uncompressed chunk capacity in bytes
    int32_t entry_size = 0;   // max entry size for var-byte values
    int32_t version = 2;
    bool fixed_width = false; // required for version 4/5
};

// Chunk-based raw forward index writer. Layout:
//
//   [header (see fwd_header.hpp)] [chunk 0] [chunk 1] ... [chunk N-1]
//
// Chunks are compressed and written back to back starting right after the
// header; the header, with every chunk's start offset, is written to offset
// 0 on close().
//
// Encoders fill chunk_buffer() and call flush_chunk() at chunk boundaries.
// A writer has one owner: open, fills/flushes, close, in that order, from a
// single thread. It is single use; reopening after close is rejected.
class ChunkForwardIndexWriter {
public:
    explicit ChunkForwardIndexWriter(const Logger& logger = Logger(Logger::kWarn));
    ~ChunkForwardIndexWriter();

    ChunkForwardIndexWriter(const ChunkForwardIndexWriter&) = delete;
    ChunkForwardIndexWriter& operator=(const ChunkForwardIndexWriter&) = delete;

    // Validate params, build the compressor and open path.
    Status open(const std::string& path, const ChunkWriterParams& params);

    // Same, with a caller-supplied compressor. Its type() is recorded in the
    // header. The compressor is closed by this writer.
    Status open(const std::string& path, const ChunkWriterParams& params,
                std::unique_ptr<ChunkCompressor> compressor);

    ChunkBuffer& chunk_buffer() { return chunk_buffer_; }
    const ChunkBuffer& chunk_buffer() const { return chunk_buffer_; }

    // Compress and write the pending chunk bytes and record their offset.
    Status flush_chunk();

    // Flush a pending partial chunk, write the header, close the file and
    // release the compressor.
    Status close();

    bool is_open() const { return state_ == State::kOpen; }
    bool is_closed() const { return state_ == State::kClosed; }

    const ForwardIndexHeader& header() const { return header_; }
    uint64_t data_offset() const { return data_offset_; }
    int32_t chunks_written() const {
        return static_cast<int32_t>(header_.chunk_offsets().size());
    }

private:
    enum class State { kUnopened, kOpen, kClosed };

    Status validate(const ChunkWriterParams& params) const;
    Status release(Status st);

    Logger logger_;
    State state_ = State::kUnopened;
    ForwardIndexHeader header_;
    DataFile data_file_;
    std::unique_ptr<ChunkCompressor> compressor_;
    ChunkBuffer chunk_buffer_;
    std::vector<uint8_t> compressed_buffer_;
    uint64_t data_offset_ = 0;
};

} // namespace chunkfwd
