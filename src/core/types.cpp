#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace chunkfwd {

const char* data_type_name(DataType t) {
    switch (t) {
        case DataType::kInt:    return "INT";
        case DataType::kLong:   return "LONG";
        case DataType::kFloat:  return "FLOAT";
        case DataType::kDouble: return "DOUBLE";
        case DataType::kString: return "STRING";
        case DataType::kBytes:  return "BYTES";
    }
    return "UNKNOWN";
}

bool parse_data_type(const std::string& name, DataType& out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    static const DataType kAll[] = {
        DataType::kInt, DataType::kLong, DataType::kFloat,
        DataType::kDouble, DataType::kString, DataType::kBytes,
    };
    for (DataType t : kAll) {
        if (upper == data_type_name(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

size_t ColumnValues::size() const {
    switch (type) {
        case DataType::kInt:    return int_values.size();
        case DataType::kLong:   return long_values.size();
        case DataType::kFloat:  return float_values.size();
        case DataType::kDouble: return double_values.size();
        case DataType::kString:
        case DataType::kBytes:  return bytes_values.size();
    }
    return 0;
}

} // namespace chunkfwd
