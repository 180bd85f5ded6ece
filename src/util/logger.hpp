#pragma once

#include <cstdio>
#include <cstdarg>
#include <string>

namespace chunkfwd {

// Leveled logger writing to stderr. Each line is emitted with a single
// fprintf so lines from concurrent column builds do not interleave.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo) : level_(level) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    // Copy of this logger whose lines start with "<tag>: ".
    Logger tagged(const std::string& tag) const {
        Logger l(level_);
        l.tag_ = tag;
        return l;
    }

    void error(const char* fmt, ...) const {
        if (level_ < kError) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

    // printf-style formatting of a whole message, no length limit.
    static std::string vformat(const char* fmt, va_list ap) {
        va_list ap2;
        va_copy(ap2, ap);
        int n = std::vsnprintf(nullptr, 0, fmt, ap2);
        va_end(ap2);
        if (n <= 0) return std::string();
        std::string msg(static_cast<size_t>(n) + 1, '\0');
        std::vsnprintf(&msg[0], msg.size(), fmt, ap);
        msg.resize(static_cast<size_t>(n));
        return msg;
    }

    static std::string format(const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        std::string msg = vformat(fmt, ap);
        va_end(ap);
        return msg;
    }

private:
    Level level_;
    std::string tag_;

    void log_impl(const char* level, const char* fmt, va_list ap) const {
        std::string msg = vformat(fmt, ap);
        if (tag_.empty()) {
            std::fprintf(stderr, "[%s] %s\n", level, msg.c_str());
        } else {
            std::fprintf(stderr, "[%s] %s: %s\n", level, tag_.c_str(), msg.c_str());
        }
    }
};

} // namespace chunkfwd
