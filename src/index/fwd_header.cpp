#include "index/fwd_header.hpp"
#include "core/byte_order.hpp"
#include "core/config.hpp"

#include <string>

namespace chunkfwd {

ForwardIndexHeader::ForwardIndexHeader(int32_t version, int32_t total_docs,
                                       int32_t docs_per_chunk, int32_t entry_size,
                                       ChunkCompressionType compression)
    : version_(version),
      num_chunks_(num_chunks_for(total_docs, docs_per_chunk)),
      docs_per_chunk_(docs_per_chunk),
      entry_size_(entry_size),
      total_docs_(total_docs),
      compression_(compression) {
    chunk_offsets_.reserve(static_cast<size_t>(num_chunks_));
}

Status ForwardIndexHeader::validate_version(int32_t version, bool fixed_width) {
    if (version == 2 || version == 3) return Status();
    if (fixed_width && (version == 4 || version == 5)) return Status();
    return configuration_error("illegal version: " + std::to_string(version) + " for " +
                               (fixed_width ? "fixed" : "variable") + " bytes values");
}

int32_t ForwardIndexHeader::offset_table_start() const {
    return static_cast<int32_t>(HEADER_FIXED_SIZE);
}

size_t ForwardIndexHeader::offset_size() const {
    return offset_entry_size(version_);
}

size_t ForwardIndexHeader::size() const {
    return HEADER_FIXED_SIZE + static_cast<size_t>(num_chunks_) * offset_size();
}

Status ForwardIndexHeader::check_offset(uint64_t offset) const {
    if (offset_size() == sizeof(int32_t) && offset > MAX_INT_OFFSET) {
        return overflow_error("integer overflow detected: chunk offset " +
                              std::to_string(offset) + " does not fit a version " +
                              std::to_string(version_) +
                              " offset table. Try to use raw version 3 or 4, "
                              "reduce docs per chunk or max chunk size");
    }
    return Status();
}

Status ForwardIndexHeader::add_chunk_offset(uint64_t offset) {
    if (offsets_full()) {
        return usage_error("chunk offset table is full: " + std::to_string(num_chunks_) +
                           " chunk(s) declared for " + std::to_string(total_docs_) +
                           " docs");
    }
    Status st = check_offset(offset);
    if (!st.ok()) return st;
    chunk_offsets_.push_back(offset);
    return Status();
}

std::vector<uint8_t> ForwardIndexHeader::serialize() const {
    std::vector<uint8_t> buf(size(), 0);
    uint8_t* p = buf.data();

    const int32_t fields[HEADER_FIELD_COUNT] = {
        version_,
        num_chunks_,
        docs_per_chunk_,
        entry_size_,
        total_docs_,
        compression_type_value(compression_),
        offset_table_start(),
    };
    for (int32_t f : fields) {
        store_be32(p, static_cast<uint32_t>(f));
        p += HEADER_FIELD_SIZE;
    }

    const size_t width = offset_size();
    for (uint64_t off : chunk_offsets_) {
        if (width == sizeof(int32_t)) {
            store_be32(p, static_cast<uint32_t>(off));
        } else {
            store_be64(p, off);
        }
        p += width;
    }
    return buf;
}

} // namespace chunkfwd
