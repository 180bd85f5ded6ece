#pragma once

#include "compression/compression_type.hpp"
#include "core/status.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace chunkfwd {

// Compresses one chunk at a time into a caller-owned staging buffer.
struct ChunkCompressor {
    virtual ~ChunkCompressor() = default;

    virtual ChunkCompressionType type() const = 0;
    virtual const char* name() const { return compression_type_name(type()); }

    // Upper bound for the compressed size of an input of length n.
    virtual size_t max_compressed_size(size_t n) const = 0;

    // Compress src[0, n) into dst. dst_capacity must be at least
    // max_compressed_size(n). On success out_size holds the bytes produced.
    virtual Status compress(const uint8_t* src, size_t n,
                            uint8_t* dst, size_t dst_capacity,
                            size_t& out_size) = 0;

    // Release algorithm state. Safe to call more than once.
    virtual void close() = 0;
};

// Build the compressor for a header compression type. Only PASS_THROUGH and
// GZIP are built in; other identifiers fail with kConfiguration.
Status make_chunk_compressor(ChunkCompressionType type,
                             std::unique_ptr<ChunkCompressor>& out);

} // namespace chunkfwd
