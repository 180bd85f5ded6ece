#include "compression/pass_through_compressor.hpp"

#include <cstring>
#include <string>

namespace chunkfwd {

Status PassThroughCompressor::compress(const uint8_t* src, size_t n,
                                       uint8_t* dst, size_t dst_capacity,
                                       size_t& out_size) {
    if (n > dst_capacity) {
        return compression_error("pass-through: " + std::to_string(n) +
                                 " bytes do not fit staging buffer of " +
                                 std::to_string(dst_capacity));
    }
    if (n > 0) std::memcpy(dst, src, n);
    out_size = n;
    return Status();
}

} // namespace chunkfwd
