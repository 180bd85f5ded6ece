#include "compression/chunk_compressor.hpp"
#include "compression/gzip_compressor.hpp"
#include "compression/pass_through_compressor.hpp"

#include <string>

namespace chunkfwd {

Status make_chunk_compressor(ChunkCompressionType type,
                             std::unique_ptr<ChunkCompressor>& out) {
    switch (type) {
        case ChunkCompressionType::kPassThrough:
            out = std::make_unique<PassThroughCompressor>();
            return Status();
        case ChunkCompressionType::kGzip: {
            auto gzip = std::make_unique<GzipCompressor>();
            Status st = gzip->init();
            if (!st.ok()) return st;
            out = std::move(gzip);
            return Status();
        }
        case ChunkCompressionType::kSnappy:
        case ChunkCompressionType::kZstandard:
        case ChunkCompressionType::kLz4:
        case ChunkCompressionType::kLz4LengthPrefixed:
            return configuration_error(std::string("compression type ") +
                                       compression_type_name(type) +
                                       " is not available in this build");
    }
    return configuration_error("unknown compression type value " +
                               std::to_string(compression_type_value(type)));
}

} // namespace chunkfwd
