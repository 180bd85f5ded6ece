#include "io/data_file.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace chunkfwd {

DataFile::~DataFile() {
    if (fd_ >= 0) ::close(fd_);
}

DataFile::DataFile(DataFile&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

DataFile& DataFile::operator=(DataFile&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

Status DataFile::open(const std::string& path) {
    if (fd_ >= 0) {
        return usage_error("DataFile: '" + path_ + "' is already open");
    }
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error("cannot open '" + path + "' for writing: " + std::strerror(errno));
    }
    fd_ = fd;
    path_ = path;
    return Status();
}

Status DataFile::pwrite_all(const uint8_t* data, size_t n, uint64_t offset) {
    if (fd_ < 0) {
        return usage_error("DataFile: write on a closed file");
    }
    size_t done = 0;
    while (done < n) {
        ssize_t w = ::pwrite(fd_, data + done, n - done,
                             static_cast<off_t>(offset + done));
        if (w < 0) {
            if (errno == EINTR) continue;
            return io_error("write of " + std::to_string(n) + " bytes at offset " +
                            std::to_string(offset) + " to '" + path_ + "' failed: " +
                            std::strerror(errno));
        }
        if (w == 0) {
            return io_error("write to '" + path_ + "' made no progress at offset " +
                            std::to_string(offset + done));
        }
        done += static_cast<size_t>(w);
    }
    return Status();
}

Status DataFile::close() {
    if (fd_ < 0) return Status();
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        return io_error("close of '" + path_ + "' failed: " + std::strerror(errno));
    }
    return Status();
}

} // namespace chunkfwd
