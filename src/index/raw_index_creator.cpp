#include "index/raw_index_creator.hpp"
#include "index/fixed_byte_chunk_writer.hpp"
#include "index/var_byte_chunk_writer.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>
#include <system_error>

namespace chunkfwd {

int32_t fixed_docs_per_chunk(int32_t entry_size, const RawIndexConfig& config) {
    int64_t by_size = entry_size > 0 ? config.target_max_chunk_size / entry_size : 1;
    int64_t n = std::min<int64_t>(config.target_docs_per_chunk, by_size);
    return static_cast<int32_t>(std::max<int64_t>(1, n));
}

int32_t var_docs_per_chunk(int32_t longest_entry, const RawIndexConfig& config) {
    int64_t overhead = static_cast<int64_t>(longest_entry) + VAR_ROW_OFFSET_SIZE;
    int64_t n = std::min<int64_t>(config.target_docs_per_chunk,
                                  config.target_max_chunk_size / overhead);
    return static_cast<int32_t>(std::max<int64_t>(1, n));
}

std::string raw_index_path(const std::string& dir, const std::string& column) {
    return (std::filesystem::path(dir) / (column + RAW_SV_FWD_EXTENSION)).string();
}

static Status write_fixed(const std::string& path, const ColumnValues& values,
                          int32_t num_docs, const RawIndexConfig& config,
                          const Logger& logger, RawIndexSummary& summary) {
    const int32_t entry_size = fixed_width_of(values.type);
    FixedByteChunkWriter writer(logger);
    Status st = writer.open(path, config.compression, num_docs,
                            fixed_docs_per_chunk(entry_size, config),
                            entry_size, config.version);
    if (!st.ok()) return st;

    for (int32_t i = 0; i < num_docs && st.ok(); i++) {
        switch (values.type) {
            case DataType::kInt:    st = writer.put_int(values.int_values[i]); break;
            case DataType::kLong:   st = writer.put_long(values.long_values[i]); break;
            case DataType::kFloat:  st = writer.put_float(values.float_values[i]); break;
            case DataType::kDouble: st = writer.put_double(values.double_values[i]); break;
            default:
                st = configuration_error(std::string(data_type_name(values.type)) +
                                         " is not a fixed-width type");
                break;
        }
    }
    if (!st.ok()) {
        Status close_st = writer.close();
        if (!close_st.ok()) logger.debug("close after failure: %s", close_st.to_string().c_str());
        return st;
    }
    st = writer.close();
    if (!st.ok()) return st;

    summary.entry_size = entry_size;
    summary.docs_per_chunk = writer.writer().header().docs_per_chunk();
    summary.num_chunks = writer.writer().chunks_written();
    summary.file_size = writer.writer().data_offset();
    return Status();
}

static Status write_var(const std::string& path, const ColumnValues& values,
                        int32_t num_docs, const RawIndexConfig& config,
                        const Logger& logger, RawIndexSummary& summary) {
    size_t longest = 0;
    for (const auto& v : values.bytes_values) longest = std::max(longest, v.size());
    if (longest > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return configuration_error("entry of " + std::to_string(longest) +
                                   " bytes exceeds the 2GB entry limit");
    }
    const int32_t longest_entry = static_cast<int32_t>(longest);

    VarByteChunkWriter writer(logger);
    Status st = writer.open(path, config.compression, num_docs,
                            var_docs_per_chunk(longest_entry, config),
                            longest_entry, config.version);
    if (!st.ok()) return st;

    for (int32_t i = 0; i < num_docs && st.ok(); i++) {
        st = writer.put_string(values.bytes_values[i]);
    }
    if (!st.ok()) {
        Status close_st = writer.close();
        if (!close_st.ok()) logger.debug("close after failure: %s", close_st.to_string().c_str());
        return st;
    }
    st = writer.close();
    if (!st.ok()) return st;

    summary.entry_size = longest_entry;
    summary.docs_per_chunk = writer.writer().header().docs_per_chunk();
    summary.num_chunks = writer.writer().chunks_written();
    summary.file_size = writer.writer().data_offset();
    return Status();
}

Status build_raw_index(const std::string& column,
                       const ColumnValues& values,
                       const std::string& out_dir,
                       const RawIndexConfig& config,
                       const Logger& logger,
                       RawIndexSummary& summary) {
    if (values.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return configuration_error("column '" + column + "' has " +
                                   std::to_string(values.size()) +
                                   " docs, more than a forward index can address");
    }

    summary = RawIndexSummary();
    summary.column = column;
    summary.type = values.type;
    summary.num_docs = static_cast<int32_t>(values.size());
    summary.path = raw_index_path(out_dir, column);

    logger.debug("building '%s' (%s, %d docs, version %d, %s)", summary.path.c_str(),
                 data_type_name(values.type), summary.num_docs, config.version,
                 compression_type_name(config.compression));

    Status st = is_fixed_width(values.type)
        ? write_fixed(summary.path, values, summary.num_docs, config, logger, summary)
        : write_var(summary.path, values, summary.num_docs, config, logger, summary);

    if (!st.ok()) {
        std::error_code ec;
        std::filesystem::remove(summary.path, ec);
        if (ec) {
            logger.warn("cannot remove partial file '%s': %s", summary.path.c_str(),
                        ec.message().c_str());
        }
        return st;
    }

    logger.debug("wrote '%s': %d chunk(s) of %d docs, %lu bytes", summary.path.c_str(),
                 summary.num_chunks, summary.docs_per_chunk,
                 static_cast<unsigned long>(summary.file_size));
    return Status();
}

} // namespace chunkfwd
