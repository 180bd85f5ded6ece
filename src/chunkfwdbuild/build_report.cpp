#include "chunkfwdbuild/build_report.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>

namespace chunkfwd {

Json::Value build_report_json(const std::vector<RawIndexSummary>& columns,
                              const RawIndexConfig& config) {
    Json::Value report;
    report["version"] = config.version;
    report["compression"] = compression_type_name(config.compression);
    report["target_max_chunk_size"] = static_cast<Json::Int64>(config.target_max_chunk_size);
    report["target_docs_per_chunk"] = config.target_docs_per_chunk;

    Json::Value cols(Json::arrayValue);
    uint64_t total_bytes = 0;
    for (const auto& c : columns) {
        Json::Value obj;
        obj["name"] = c.column;
        obj["type"] = data_type_name(c.type);
        obj["path"] = c.path;
        obj["num_docs"] = c.num_docs;
        obj["docs_per_chunk"] = c.docs_per_chunk;
        obj["num_chunks"] = c.num_chunks;
        obj["entry_size"] = c.entry_size;
        obj["file_size"] = static_cast<Json::UInt64>(c.file_size);
        cols.append(obj);
        total_bytes += c.file_size;
    }
    report["columns"] = cols;
    report["total_bytes"] = static_cast<Json::UInt64>(total_bytes);
    return report;
}

Status write_build_report(const std::string& path, const Json::Value& report) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

    if (path == "-") {
        writer->write(report, &std::cout);
        std::cout << "\n";
        std::cout.flush();
        if (!std::cout) return io_error("cannot write build report to stdout");
        return Status();
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        return io_error("cannot open report '" + path + "': " + std::strerror(errno));
    }
    writer->write(report, &out);
    out << "\n";
    out.close();
    if (!out) return io_error("cannot write report '" + path + "'");
    return Status();
}

} // namespace chunkfwd
