#include "io/column_value_reader.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>

namespace chunkfwd {

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        end--;
    return s.substr(start, end - start);
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;
    out = static_cast<int64_t>(v);
    return true;
}

static bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (*end != '\0' || errno == ERANGE) return false;
    out = v;
    return true;
}

static bool parse_hex(const std::string& s, std::string& out) {
    if (s.size() % 2 != 0) return false;
    out.clear();
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        int hi = hex_digit(s[i]);
        int lo = hex_digit(s[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return true;
}

static Status bad_value(const std::string& source, size_t line_no, DataType type,
                        const std::string& text) {
    return configuration_error(source + ":" + std::to_string(line_no) + ": invalid " +
                               data_type_name(type) + " value '" + text + "'");
}

Status parse_column_values(std::istream& in, DataType type,
                           const std::string& source, ColumnValues& out) {
    out = ColumnValues();
    out.type = type;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (type == DataType::kString) {
            out.bytes_values.push_back(line);
            continue;
        }

        std::string text = trim(line);
        switch (type) {
            case DataType::kInt: {
                int64_t v;
                if (!parse_int64(text, v) ||
                    v < std::numeric_limits<int32_t>::min() ||
                    v > std::numeric_limits<int32_t>::max()) {
                    return bad_value(source, line_no, type, text);
                }
                out.int_values.push_back(static_cast<int32_t>(v));
                break;
            }
            case DataType::kLong: {
                int64_t v;
                if (!parse_int64(text, v)) return bad_value(source, line_no, type, text);
                out.long_values.push_back(v);
                break;
            }
            case DataType::kFloat: {
                double v;
                if (!parse_double(text, v) ||
                    (std::isfinite(v) && std::fabs(v) > std::numeric_limits<float>::max())) {
                    return bad_value(source, line_no, type, text);
                }
                out.float_values.push_back(static_cast<float>(v));
                break;
            }
            case DataType::kDouble: {
                double v;
                if (!parse_double(text, v)) return bad_value(source, line_no, type, text);
                out.double_values.push_back(v);
                break;
            }
            case DataType::kBytes: {
                std::string bytes;
                if (!parse_hex(text, bytes)) return bad_value(source, line_no, type, text);
                out.bytes_values.push_back(std::move(bytes));
                break;
            }
            case DataType::kString:
                break;
        }
    }
    if (in.bad()) {
        return io_error("read error on " + source + " after line " + std::to_string(line_no));
    }
    return Status();
}

Status read_column_values(const std::string& path, DataType type, ColumnValues& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return io_error("cannot open column file '" + path + "': " + std::strerror(errno));
    }
    return parse_column_values(file, type, path, out);
}

} // namespace chunkfwd
