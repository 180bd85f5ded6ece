#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkfwd {

// Single-value column types with a raw forward index
enum class DataType : uint8_t {
    kInt = 0,
    kLong = 1,
    kFloat = 2,
    kDouble = 3,
    kString = 4,
    kBytes = 5,
};

// Stored width of a fixed-width type, 0 for variable-width types
inline constexpr int32_t fixed_width_of(DataType t) {
    switch (t) {
        case DataType::kInt:    return 4;
        case DataType::kLong:   return 8;
        case DataType::kFloat:  return 4;
        case DataType::kDouble: return 8;
        default:                return 0;
    }
}

inline constexpr bool is_fixed_width(DataType t) {
    return fixed_width_of(t) != 0;
}

const char* data_type_name(DataType t);

// Case-insensitive ("INT", "long", ...). Returns false for unknown names.
bool parse_data_type(const std::string& name, DataType& out);

// Parsed values of one column. Only the vector matching the type is filled;
// STRING and BYTES values both live in bytes_values.
struct ColumnValues {
    DataType type = DataType::kInt;
    std::vector<int32_t> int_values;
    std::vector<int64_t> long_values;
    std::vector<float> float_values;
    std::vector<double> double_values;
    std::vector<std::string> bytes_values;

    size_t size() const;
};

} // namespace chunkfwd
