#pragma once

#include "core/status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkfwd {

// Read/write file handle with positional writes.
class DataFile {
public:
    DataFile() = default;
    ~DataFile();

    DataFile(const DataFile&) = delete;
    DataFile& operator=(const DataFile&) = delete;

    DataFile(DataFile&& other) noexcept;
    DataFile& operator=(DataFile&& other) noexcept;

    // Create or truncate path for read/write.
    Status open(const std::string& path);

    // Write all n bytes at offset, retrying short writes and EINTR.
    Status pwrite_all(const uint8_t* data, size_t n, uint64_t offset);

    Status close();

    bool is_open() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

private:
    int fd_ = -1;
    std::string path_;
};

} // namespace chunkfwd
