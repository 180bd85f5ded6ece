#pragma once

#include "core/status.hpp"
#include "core/types.hpp"

#include <istream>
#include <string>

namespace chunkfwd {

// Read a text column file: one document value per line, in doc id order.
//   - INT/LONG/FLOAT/DOUBLE: decimal text, surrounding whitespace ignored
//   - STRING: the line as is (an empty line is an empty string)
//   - BYTES: hex digits, two per byte
// A trailing '\r' is removed from every line.
Status read_column_values(const std::string& path, DataType type, ColumnValues& out);

// Same, from an open stream. source names the input in error messages.
Status parse_column_values(std::istream& in, DataType type,
                           const std::string& source, ColumnValues& out);

} // namespace chunkfwd
