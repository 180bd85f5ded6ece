#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace chunkfwd {

// Progress display on stderr, advanced from concurrent tasks.
class Progress {
public:
    Progress(const std::string& label, uint64_t total, bool enabled = true)
        : label_(label), total_(total), enabled_(enabled),
          start_(std::chrono::steady_clock::now()) {}

    // Record one more finished item.
    void advance() {
        std::lock_guard<std::mutex> lock(mutex_);
        current_++;
        if (!enabled_ || total_ == 0) return;

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - last_print_).count();
        if (elapsed < 500 && current_ < total_) return;

        last_print_ = now;
        double pct = 100.0 * static_cast<double>(current_) / static_cast<double>(total_);
        auto total_elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            now - start_).count();

        std::fprintf(stderr, "\r%s: %.1f%% (%lu/%lu) [%lds]",
                     label_.c_str(), pct,
                     static_cast<unsigned long>(current_),
                     static_cast<unsigned long>(total_),
                     static_cast<long>(total_elapsed));
        std::fflush(stderr);
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) return;
        auto total_elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_).count();
        std::fprintf(stderr, "\r%s: done (%lu/%lu, %lds)\n",
                     label_.c_str(),
                     static_cast<unsigned long>(current_),
                     static_cast<unsigned long>(total_),
                     static_cast<long>(total_elapsed));
        std::fflush(stderr);
    }

private:
    std::mutex mutex_;
    std::string label_;
    uint64_t total_;
    uint64_t current_ = 0;
    bool enabled_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_print_;
};

} // namespace chunkfwd
