#pragma once

#include "index/chunk_fwd_writer.hpp"

#include <cstdint>
#include <string>

namespace chunkfwd {

// Writes fixed-width values (int32, int64, float, double) into a chunked
// forward index. Each chunk holds docs_per_chunk() big-endian values with
// no per-chunk header.
class FixedByteChunkWriter {
public:
    explicit FixedByteChunkWriter(const Logger& logger = Logger(Logger::kWarn));

    // Version 2: docs_per_chunk is used as given. Version 3+: rounded up to a
    // power of two so readers can locate a doc's chunk with a shift.
    static int32_t normalize_docs_per_chunk(int32_t version, int32_t docs_per_chunk);

    Status open(const std::string& path, ChunkCompressionType compression,
                int32_t total_docs, int32_t docs_per_chunk, int32_t entry_size,
                int32_t version);

    Status put_int(int32_t value);
    Status put_long(int64_t value);
    Status put_float(float value);
    Status put_double(double value);

    Status close();

    int32_t docs_per_chunk() const { return writer_.header().docs_per_chunk(); }
    const ChunkForwardIndexWriter& writer() const { return writer_; }

private:
    Status check_width(size_t width) const;
    Status flush_if_full();

    ChunkForwardIndexWriter writer_;
};

} // namespace chunkfwd
