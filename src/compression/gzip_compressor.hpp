#pragma once

#include "compression/chunk_compressor.hpp"

#include <zlib.h>

namespace chunkfwd {

// zlib deflate stream per chunk, followed by the uncompressed length as a
// big-endian int64:
//
//   [deflate stream (zlib wrapper)] [uint64 raw_length]
//
// One z_stream is kept for the compressor's lifetime and reset per chunk.
class GzipCompressor : public ChunkCompressor {
public:
    static constexpr size_t kTrailerSize = sizeof(uint64_t);

    GzipCompressor() = default;
    ~GzipCompressor() override;

    GzipCompressor(const GzipCompressor&) = delete;
    GzipCompressor& operator=(const GzipCompressor&) = delete;

    // Must succeed before compress() is used.
    Status init(int level = Z_DEFAULT_COMPRESSION);

    ChunkCompressionType type() const override { return ChunkCompressionType::kGzip; }
    size_t max_compressed_size(size_t n) const override;
    Status compress(const uint8_t* src, size_t n,
                    uint8_t* dst, size_t dst_capacity,
                    size_t& out_size) override;
    void close() override;

private:
    z_stream strm_{};
    bool initialized_ = false;
};

} // namespace chunkfwd
