#include "compression/gzip_compressor.hpp"
#include "core/byte_order.hpp"

#include <climits>
#include <string>

namespace chunkfwd {

GzipCompressor::~GzipCompressor() {
    close();
}

Status GzipCompressor::init(int level) {
    close();
    strm_ = z_stream{};
    int rc = deflateInit(&strm_, level);
    if (rc != Z_OK) {
        return compression_error(std::string("gzip: deflateInit failed: ") +
                                 (strm_.msg ? strm_.msg : zError(rc)));
    }
    initialized_ = true;
    return Status();
}

size_t GzipCompressor::max_compressed_size(size_t n) const {
    return static_cast<size_t>(compressBound(static_cast<uLong>(n))) + kTrailerSize;
}

Status GzipCompressor::compress(const uint8_t* src, size_t n,
                                uint8_t* dst, size_t dst_capacity,
                                size_t& out_size) {
    if (!initialized_) {
        return compression_error("gzip: compressor is not initialized or already closed");
    }
    if (n > UINT_MAX) {
        return compression_error("gzip: chunk of " + std::to_string(n) +
                                 " bytes exceeds deflate input limit");
    }
    if (dst_capacity < max_compressed_size(n)) {
        return compression_error("gzip: staging buffer of " + std::to_string(dst_capacity) +
                                 " bytes is below bound " +
                                 std::to_string(max_compressed_size(n)));
    }

    int rc = deflateReset(&strm_);
    if (rc != Z_OK) {
        return compression_error(std::string("gzip: deflateReset failed: ") + zError(rc));
    }

    strm_.next_in = const_cast<Bytef*>(src);
    strm_.avail_in = static_cast<uInt>(n);
    strm_.next_out = dst;
    strm_.avail_out = static_cast<uInt>(dst_capacity - kTrailerSize);

    rc = deflate(&strm_, Z_FINISH);
    if (rc != Z_STREAM_END) {
        return compression_error(std::string("gzip: deflate failed: ") +
                                 (strm_.msg ? strm_.msg : zError(rc)));
    }

    size_t stream_size = static_cast<size_t>(strm_.total_out);
    store_be64(dst + stream_size, static_cast<uint64_t>(n));
    out_size = stream_size + kTrailerSize;
    return Status();
}

void GzipCompressor::close() {
    if (initialized_) {
        deflateEnd(&strm_);
        initialized_ = false;
    }
}

} // namespace chunkfwd
