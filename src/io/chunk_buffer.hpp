#pragma once

#include "core/byte_order.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace chunkfwd {

// Fixed-capacity scratch region for one uncompressed chunk.
//
// position() is the fill level: the number of bytes the next flush takes.
// Typed puts are big-endian. Writes that would pass capacity return false
// and leave the buffer unchanged.
class ChunkBuffer {
public:
    ChunkBuffer() = default;
    explicit ChunkBuffer(size_t capacity) : data_(capacity, 0) {}

    size_t capacity() const { return data_.size(); }
    size_t position() const { return position_; }
    size_t remaining() const { return data_.size() - position_; }
    bool empty() const { return position_ == 0; }
    bool full() const { return position_ == data_.size(); }

    const uint8_t* data() const { return data_.data(); }

    bool append(const uint8_t* bytes, size_t n) {
        if (n > remaining()) return false;
        if (n > 0) std::memcpy(data_.data() + position_, bytes, n);
        position_ += n;
        return true;
    }

    bool put_int32(int32_t v) {
        if (remaining() < sizeof(v)) return false;
        store_be32(data_.data() + position_, static_cast<uint32_t>(v));
        position_ += sizeof(v);
        return true;
    }

    bool put_int64(int64_t v) {
        if (remaining() < sizeof(v)) return false;
        store_be64(data_.data() + position_, static_cast<uint64_t>(v));
        position_ += sizeof(v);
        return true;
    }

    bool put_float(float v) { return put_int32(static_cast<int32_t>(float_bits(v))); }
    bool put_double(double v) { return put_int64(static_cast<int64_t>(double_bits(v))); }

    // Store an int32 at an absolute position without moving position().
    bool put_int32_at(size_t pos, int32_t v) {
        if (pos > data_.size() || data_.size() - pos < sizeof(v)) return false;
        store_be32(data_.data() + pos, static_cast<uint32_t>(v));
        return true;
    }

    // Move the fill level within [0, capacity].
    bool seek(size_t pos) {
        if (pos > data_.size()) return false;
        position_ = pos;
        return true;
    }

    // Contents are kept; only the fill level resets.
    void clear() { position_ = 0; }

private:
    std::vector<uint8_t> data_;
    size_t position_ = 0;
};

} // namespace chunkfwd
