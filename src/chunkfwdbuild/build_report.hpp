#pragma once

#include "core/status.hpp"
#include "index/raw_index_creator.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace chunkfwd {

// {"version": 2, "compression": "GZIP", "columns": [{"name": ..., ...}]}
Json::Value build_report_json(const std::vector<RawIndexSummary>& columns,
                              const RawIndexConfig& config);

// Write the report to path, or to stdout when path is "-".
Status write_build_report(const std::string& path, const Json::Value& report);

} // namespace chunkfwd
