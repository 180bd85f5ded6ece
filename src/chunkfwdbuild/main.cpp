#include "chunkfwdbuild/build_report.hpp"
#include "chunkfwdbuild/column_spec.hpp"
#include "compression/compression_type.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "core/version.hpp"
#include "index/raw_index_creator.hpp"
#include "io/column_value_reader.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/progress.hpp"
#include "util/size_parser.hpp"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include <tbb/global_control.h>
#include <tbb/task_group.h>

using namespace chunkfwd;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n\n"
        "Required:\n"
        "  -col <name>:<TYPE>:<path>  Column to index (repeatable)\n"
        "                             TYPE: INT, LONG, FLOAT, DOUBLE, STRING, BYTES\n"
        "                             path: text file, one value per line\n"
        "                             (BYTES values are hex encoded)\n"
        "  -o <dir>                   Output directory\n\n"
        "Options:\n"
        "  -compression <type>        PASS_THROUGH or GZIP (default: PASS_THROUGH)\n"
        "  -version <2|3|4|5>         Raw format version (default: %d)\n"
        "                             4 and 5 are valid for fixed-width types only\n"
        "  -max_chunk_size <size>     Target max uncompressed chunk size\n"
        "                             Accepts K, M, G suffixes (default: 1M)\n"
        "  -docs_per_chunk <int>      Target docs per chunk (default: %d)\n"
        "  -report <path|->           Write a JSON build report ('-' = stdout)\n"
        "  -threads <int>             Number of threads (default: all cores)\n"
        "  -v, --verbose              Verbose output\n"
        "  -h, --help                 Show this help\n"
        "  --version                  Show version\n",
        prog, DEFAULT_FORMAT_VERSION, DEFAULT_TARGET_DOCS_PER_CHUNK);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "chunkfwdbuild")) return 0;

    if (cli.has("-h") || cli.has("--help") || argc < 2) {
        print_usage(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    std::vector<ColumnSpec> columns;
    Status st = parse_column_specs(cli.get_strings("-col"), columns);
    if (!st.ok()) {
        std::fprintf(stderr, "Error: %s\n", st.message().c_str());
        return 1;
    }
    if (columns.empty()) {
        std::fprintf(stderr, "Error: at least one -col is required\n");
        print_usage(argv[0]);
        return 1;
    }

    std::string out_dir = cli.get_string("-o");
    if (out_dir.empty()) {
        std::fprintf(stderr, "Error: -o is required\n");
        print_usage(argv[0]);
        return 1;
    }

    RawIndexConfig config;
    if (cli.has("-compression")) {
        std::string name = cli.get_string("-compression");
        if (!parse_compression_type(name, config.compression)) {
            std::fprintf(stderr, "Error: unknown -compression '%s'\n", name.c_str());
            return 1;
        }
    }

    config.version = cli.get_int("-version", DEFAULT_FORMAT_VERSION);
    if (config.version < MIN_FORMAT_VERSION || config.version > MAX_FORMAT_VERSION) {
        std::fprintf(stderr, "Error: -version must be between %d and %d\n",
                     MIN_FORMAT_VERSION, MAX_FORMAT_VERSION);
        return 1;
    }

    if (cli.has("-max_chunk_size")) {
        std::string s = cli.get_string("-max_chunk_size");
        uint64_t size = parse_size_string(s);
        if (size == 0 || size > static_cast<uint64_t>(MAX_CHUNK_SIZE)) {
            std::fprintf(stderr, "Error: invalid -max_chunk_size '%s' (1 byte to 2G)\n",
                         s.c_str());
            return 1;
        }
        config.target_max_chunk_size = static_cast<int64_t>(size);
    }

    config.target_docs_per_chunk = cli.get_int("-docs_per_chunk", DEFAULT_TARGET_DOCS_PER_CHUNK);
    if (config.target_docs_per_chunk < 1) {
        std::fprintf(stderr, "Error: -docs_per_chunk must be >= 1\n");
        return 1;
    }

    Logger logger = make_logger(cli);
    int threads = resolve_threads(cli);

    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        std::fprintf(stderr, "Error: cannot create output directory '%s': %s\n",
                     out_dir.c_str(), ec.message().c_str());
        return 1;
    }

    logger.info("Columns: %zu, output: %s", columns.size(), out_dir.c_str());
    logger.info("Parameters: version=%d, compression=%s, max_chunk_size=%ld, "
                "docs_per_chunk=%d, threads=%d",
                config.version, compression_type_name(config.compression),
                static_cast<long>(config.target_max_chunk_size),
                config.target_docs_per_chunk, threads);

    tbb::global_control gc(tbb::global_control::max_allowed_parallelism, threads);

    // One task per column; each task owns its writer for the whole build.
    std::vector<RawIndexSummary> summaries(columns.size());
    std::vector<std::string> error_messages(columns.size());
    std::atomic<bool> any_error{false};
    Progress progress("Columns", columns.size(), !logger.verbose());

    tbb::task_group tg;
    for (size_t ci = 0; ci < columns.size(); ci++) {
        tg.run([&, ci]() {
            const ColumnSpec& spec = columns[ci];
            Logger col_logger = logger.tagged(spec.name);

            ColumnValues values;
            Status cst = read_column_values(spec.input_path, spec.type, values);
            if (cst.ok()) {
                cst = build_raw_index(spec.name, values, out_dir, config, col_logger,
                                      summaries[ci]);
            }
            if (!cst.ok()) {
                error_messages[ci] = "column '" + spec.name + "': " + cst.to_string();
                any_error.store(true, std::memory_order_relaxed);
            }
            progress.advance();
        });
    }
    tg.wait();
    progress.finish();

    if (any_error.load()) {
        for (const auto& msg : error_messages) {
            if (!msg.empty()) std::fprintf(stderr, "Error: %s\n", msg.c_str());
        }
        return 1;
    }

    for (const auto& s : summaries) {
        logger.info("%s: %d docs, %d chunk(s), %lu bytes -> %s", s.column.c_str(),
                    s.num_docs, s.num_chunks, static_cast<unsigned long>(s.file_size),
                    s.path.c_str());
    }

    if (cli.has("-report")) {
        std::string report_path = cli.get_string("-report");
        st = write_build_report(report_path, build_report_json(summaries, config));
        if (!st.ok()) {
            std::fprintf(stderr, "Error: %s\n", st.message().c_str());
            return 1;
        }
    }

    logger.info("All columns completed successfully.");
    return 0;
}
