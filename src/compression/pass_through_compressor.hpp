#pragma once

#include "compression/chunk_compressor.hpp"

namespace chunkfwd {

// Stores chunks uncompressed.
class PassThroughCompressor : public ChunkCompressor {
public:
    ChunkCompressionType type() const override { return ChunkCompressionType::kPassThrough; }
    size_t max_compressed_size(size_t n) const override { return n; }
    Status compress(const uint8_t* src, size_t n,
                    uint8_t* dst, size_t dst_capacity,
                    size_t& out_size) override;
    void close() override {}
};

} // namespace chunkfwd
