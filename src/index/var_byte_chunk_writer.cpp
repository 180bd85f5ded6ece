#include "index/var_byte_chunk_writer.hpp"
#include "core/config.hpp"

namespace chunkfwd {

VarByteChunkWriter::VarByteChunkWriter(const Logger& logger)
    : writer_(logger) {}

int64_t VarByteChunkWriter::chunk_size_for(int32_t docs_per_chunk, int32_t longest_entry) {
    return static_cast<int64_t>(docs_per_chunk) *
           (VAR_ROW_OFFSET_SIZE + static_cast<int64_t>(longest_entry));
}

Status VarByteChunkWriter::open(const std::string& path,
                                ChunkCompressionType compression,
                                int32_t total_docs, int32_t docs_per_chunk,
                                int32_t longest_entry, int32_t version) {
    ChunkWriterParams params;
    params.compression = compression;
    params.total_docs = total_docs;
    params.docs_per_chunk = docs_per_chunk;
    params.chunk_size = chunk_size_for(docs_per_chunk, longest_entry);
    params.entry_size = longest_entry;
    params.version = version;
    params.fixed_width = false;

    Status st = writer_.open(path, params);
    if (!st.ok()) return st;

    row_offsets_size_ = static_cast<size_t>(docs_per_chunk) * VAR_ROW_OFFSET_SIZE;
    row_offset_pos_ = 0;
    data_pos_ = row_offsets_size_;
    return Status();
}

Status VarByteChunkWriter::put_bytes(const uint8_t* data, size_t n) {
    if (!writer_.is_open()) {
        return usage_error("put on a var-byte writer that is not open");
    }
    if (n > static_cast<size_t>(writer_.header().entry_size())) {
        return usage_error("value of " + std::to_string(n) +
                           " bytes exceeds the longest entry size " +
                           std::to_string(writer_.header().entry_size()));
    }
    if (row_offset_pos_ >= row_offsets_size_) {
        return usage_error("chunk buffer is full after a failed flush");
    }

    ChunkBuffer& buf = writer_.chunk_buffer();
    // Both always fit: the chunk has room for docs_per_chunk longest entries
    if (!buf.put_int32_at(row_offset_pos_, static_cast<int32_t>(data_pos_)) ||
        !buf.seek(data_pos_) || !buf.append(data, n)) {
        return usage_error("value of " + std::to_string(n) +
                           " bytes does not fit the chunk buffer");
    }
    row_offset_pos_ += VAR_ROW_OFFSET_SIZE;
    data_pos_ += n;

    if (row_offset_pos_ == row_offsets_size_) {
        return write_chunk();
    }
    return Status();
}

Status VarByteChunkWriter::put_string(const std::string& value) {
    return put_bytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

// Zero the row offsets of absent docs, flush, and start a new chunk.
Status VarByteChunkWriter::write_chunk() {
    ChunkBuffer& buf = writer_.chunk_buffer();
    for (size_t pos = row_offset_pos_; pos < row_offsets_size_; pos += VAR_ROW_OFFSET_SIZE) {
        if (!buf.put_int32_at(pos, 0)) {
            return usage_error("row offset slot " + std::to_string(pos) +
                               " is past the chunk buffer");
        }
    }
    if (!buf.seek(data_pos_)) {
        return usage_error("chunk data position " + std::to_string(data_pos_) +
                           " is past the chunk buffer");
    }

    Status st = writer_.flush_chunk();
    if (!st.ok()) return st;

    row_offset_pos_ = 0;
    data_pos_ = row_offsets_size_;
    return Status();
}

Status VarByteChunkWriter::close() {
    if (writer_.is_open() && row_offset_pos_ > 0) {
        Status st = write_chunk();
        if (!st.ok()) {
            Status close_st = writer_.close();
            if (!close_st.ok()) {
                return Status(st.code(), st.message() + "; then " + close_st.to_string());
            }
            return st;
        }
    }
    return writer_.close();
}

} // namespace chunkfwd
