#include "index/fixed_byte_chunk_writer.hpp"
#include "core/config.hpp"

namespace chunkfwd {

FixedByteChunkWriter::FixedByteChunkWriter(const Logger& logger)
    : writer_(logger) {}

int32_t FixedByteChunkWriter::normalize_docs_per_chunk(int32_t version,
                                                       int32_t docs_per_chunk) {
    if (version < 3 || docs_per_chunk <= 0) return docs_per_chunk;
    return next_power_of_two(docs_per_chunk);
}

Status FixedByteChunkWriter::open(const std::string& path,
                                  ChunkCompressionType compression,
                                  int32_t total_docs, int32_t docs_per_chunk,
                                  int32_t entry_size, int32_t version) {
    if (docs_per_chunk > (1 << 30) && version >= 3) {
        return configuration_error("docs per chunk " + std::to_string(docs_per_chunk) +
                                   " cannot be rounded to a power of two");
    }
    ChunkWriterParams params;
    params.compression = compression;
    params.total_docs = total_docs;
    params.docs_per_chunk = normalize_docs_per_chunk(version, docs_per_chunk);
    params.chunk_size = static_cast<int64_t>(entry_size) * params.docs_per_chunk;
    params.entry_size = entry_size;
    params.version = version;
    params.fixed_width = true;
    return writer_.open(path, params);
}

Status FixedByteChunkWriter::check_width(size_t width) const {
    if (!writer_.is_open()) {
        return usage_error("put on a fixed-byte writer that is not open");
    }
    if (static_cast<size_t>(writer_.header().entry_size()) != width) {
        return usage_error("value of " + std::to_string(width) +
                           " bytes does not match entry size " +
                           std::to_string(writer_.header().entry_size()));
    }
    return Status();
}

// Only reachable when an earlier flush of a full chunk failed
static Status chunk_full_error() {
    return usage_error("chunk buffer is full after a failed flush");
}

Status FixedByteChunkWriter::flush_if_full() {
    if (writer_.chunk_buffer().full()) {
        return writer_.flush_chunk();
    }
    return Status();
}

Status FixedByteChunkWriter::put_int(int32_t value) {
    Status st = check_width(sizeof(value));
    if (!st.ok()) return st;
    if (!writer_.chunk_buffer().put_int32(value)) return chunk_full_error();
    return flush_if_full();
}

Status FixedByteChunkWriter::put_long(int64_t value) {
    Status st = check_width(sizeof(value));
    if (!st.ok()) return st;
    if (!writer_.chunk_buffer().put_int64(value)) return chunk_full_error();
    return flush_if_full();
}

Status FixedByteChunkWriter::put_float(float value) {
    Status st = check_width(sizeof(value));
    if (!st.ok()) return st;
    if (!writer_.chunk_buffer().put_float(value)) return chunk_full_error();
    return flush_if_full();
}

Status FixedByteChunkWriter::put_double(double value) {
    Status st = check_width(sizeof(value));
    if (!st.ok()) return st;
    if (!writer_.chunk_buffer().put_double(value)) return chunk_full_error();
    return flush_if_full();
}

Status FixedByteChunkWriter::close() {
    return writer_.close();
}

} // namespace chunkfwd
