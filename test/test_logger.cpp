#include "test_util.hpp"
#include "util/logger.hpp"

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace chunkfwd;

static const std::string kTestDir = "/tmp/test_chunkfwd_logger";

// Run fn with stderr redirected to a file and return what it printed.
template <typename Fn>
static std::string capture_stderr(Fn fn) {
    std::string path = kTestDir + "/stderr.txt";
    std::fflush(stderr);
    int saved = ::dup(2);
    FILE* out = std::fopen(path.c_str(), "w");
    if (saved < 0 || !out) {
        if (out) std::fclose(out);
        if (saved >= 0) ::close(saved);
        return std::string();
    }
    ::dup2(::fileno(out), 2);
    fn();
    std::fflush(stderr);
    ::dup2(saved, 2);
    ::close(saved);
    std::fclose(out);

    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void test_format() {
    CHECK(Logger::format("chunk %d of '%s'", 3, "a.fwd") == "chunk 3 of 'a.fwd'");
    CHECK(Logger::format("%s", "").empty());

    std::string long_path(5000, 'p');
    std::string msg = Logger::format("cannot open '%s': %s", long_path.c_str(), "No space");
    CHECK_EQ(msg.size(), 5000u + 24u);
    CHECK(msg.compare(msg.size() - 10, 10, ": No space") == 0);
}

static void test_long_line_kept_whole() {
    std::string column(3000, 'c');
    Logger logger = Logger(Logger::kInfo).tagged(column);
    std::string text = capture_stderr([&] {
        logger.error("write of %d bytes to '%s' failed", 4096, column.c_str());
    });
    std::string expected = "[ERROR] " + column + ": write of 4096 bytes to '" + column +
                           "' failed\n";
    CHECK(text == expected);
}

static void test_levels() {
    Logger logger(Logger::kWarn);
    std::string text = capture_stderr([&] {
        logger.debug("hidden %d", 1);
        logger.info("hidden %d", 2);
        logger.warn("shown %d", 3);
    });
    CHECK(text == "[WARN] shown 3\n");
    CHECK(!logger.verbose());
    logger.set_level(Logger::kDebug);
    CHECK(logger.verbose());
}

int main() {
    std::filesystem::remove_all(kTestDir);
    std::filesystem::create_directories(kTestDir);

    test_format();
    test_long_line_kept_whole();
    test_levels();

    std::filesystem::remove_all(kTestDir);
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
