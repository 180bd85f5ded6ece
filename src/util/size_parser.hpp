#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

namespace chunkfwd {

// Parse a byte size with optional K, M or G suffix ("1M" -> 1048576).
// Returns 0 on parse error.
inline uint64_t parse_size_string(const std::string& s) {
    if (s.empty()) return 0;

    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || val < 0) return 0;

    uint64_t multiplier = 1;
    if (end && *end != '\0') {
        switch (*end) {
            case 'K': case 'k': multiplier = uint64_t(1) << 10; break;
            case 'M': case 'm': multiplier = uint64_t(1) << 20; break;
            case 'G': case 'g': multiplier = uint64_t(1) << 30; break;
            default: return 0;
        }
        // Allow an optional trailing 'B' ("512KB")
        const char* rest = end + 1;
        if ((*rest == 'B' || *rest == 'b')) rest++;
        if (*rest != '\0') return 0;
    }
    return static_cast<uint64_t>(val * static_cast<double>(multiplier));
}

} // namespace chunkfwd
