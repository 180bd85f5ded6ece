#pragma once

#include "compression/compression_type.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>

namespace chunkfwd {

class Logger;

// Configuration for single-value raw forward index creation.
struct RawIndexConfig {
    ChunkCompressionType compression = ChunkCompressionType::kPassThrough;
    int32_t version = DEFAULT_FORMAT_VERSION;
    int64_t target_max_chunk_size = DEFAULT_TARGET_MAX_CHUNK_SIZE;
    int32_t target_docs_per_chunk = DEFAULT_TARGET_DOCS_PER_CHUNK;
};

struct RawIndexSummary {
    std::string column;
    std::string path;
    DataType type = DataType::kInt;
    int32_t num_docs = 0;
    int32_t docs_per_chunk = 0;
    int32_t num_chunks = 0;
    int32_t entry_size = 0;     // longest entry for var-byte columns
    uint64_t file_size = 0;
};

// Docs per chunk so that a chunk stays within the target size:
// max(1, min(target_docs_per_chunk, target_max_chunk_size / entry size)).
int32_t fixed_docs_per_chunk(int32_t entry_size, const RawIndexConfig& config);

// Var-byte chunks also carry one int32 row offset per doc.
int32_t var_docs_per_chunk(int32_t longest_entry, const RawIndexConfig& config);

// "<dir>/<column>.sv.raw.fwd"
std::string raw_index_path(const std::string& dir, const std::string& column);

// Write the raw forward index of one column into out_dir. On failure the
// partially written file is removed.
Status build_raw_index(const std::string& column,
                       const ColumnValues& values,
                       const std::string& out_dir,
                       const RawIndexConfig& config,
                       const Logger& logger,
                       RawIndexSummary& summary);

} // namespace chunkfwd
