#include "test_util.hpp"
#include "fwd_test_reader.hpp"
#include "compression/pass_through_compressor.hpp"
#include "core/config.hpp"
#include "index/chunk_fwd_writer.hpp"
#include "util/logger.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace chunkfwd;

static const std::string kTestDir = "/tmp/test_chunkfwd_writer";

static Logger quiet_logger() {
    return Logger(Logger::kError);
}

static ChunkWriterParams int_params(int32_t total_docs, int32_t docs_per_chunk,
                                    int32_t version = 2) {
    ChunkWriterParams p;
    p.compression = ChunkCompressionType::kPassThrough;
    p.total_docs = total_docs;
    p.docs_per_chunk = docs_per_chunk;
    p.chunk_size = static_cast<int64_t>(docs_per_chunk) * 4;
    p.entry_size = 4;
    p.version = version;
    p.fixed_width = true;
    return p;
}

// Pass-through compressor that counts close() calls.
class CountingCompressor : public PassThroughCompressor {
public:
    explicit CountingCompressor(int* closes) : closes_(closes) {}
    void close() override { (*closes_)++; }

private:
    int* closes_;
};

// Fails every chunk.
class FailingCompressor : public ChunkCompressor {
public:
    explicit FailingCompressor(int* closes) : closes_(closes) {}
    ChunkCompressionType type() const override { return ChunkCompressionType::kPassThrough; }
    size_t max_compressed_size(size_t n) const override { return n; }
    Status compress(const uint8_t*, size_t, uint8_t*, size_t, size_t&) override {
        return compression_error("injected failure");
    }
    void close() override { (*closes_)++; }

private:
    int* closes_;
};

// Claims more output than the staging buffer holds.
class OverReportingCompressor : public ChunkCompressor {
public:
    explicit OverReportingCompressor(int* closes) : closes_(closes) {}
    ChunkCompressionType type() const override { return ChunkCompressionType::kPassThrough; }
    size_t max_compressed_size(size_t n) const override { return n; }
    Status compress(const uint8_t* src, size_t n, uint8_t* dst, size_t,
                    size_t& out_size) override {
        if (n > 0) std::memcpy(dst, src, n);
        out_size = n + 4096;
        return Status();
    }
    void close() override { (*closes_)++; }

private:
    int* closes_;
};

// Reports the input length without touching the output, so large chunks
// cost no copying.
class SizeOnlyCompressor : public ChunkCompressor {
public:
    explicit SizeOnlyCompressor(int* closes) : closes_(closes) {}
    ChunkCompressionType type() const override { return ChunkCompressionType::kPassThrough; }
    size_t max_compressed_size(size_t n) const override { return n; }
    Status compress(const uint8_t*, size_t n, uint8_t*, size_t, size_t& out_size) override {
        out_size = n;
        return Status();
    }
    void close() override { (*closes_)++; }

private:
    int* closes_;
};

static bool put_ints(ChunkForwardIndexWriter& w, int32_t first, int32_t count) {
    for (int32_t i = 0; i < count; i++) {
        if (!w.chunk_buffer().put_int32(first + i)) return false;
    }
    return true;
}

static void test_rejected_construction() {
    std::string path = kTestDir + "/rejected.fwd";
    {
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(10, 4, 6);
        CHECK_CODE(w.open(path, p), ErrorCode::kConfiguration);
        CHECK(!w.is_open());
    }
    {
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(10, 4, 4);
        p.fixed_width = false;
        CHECK_CODE(w.open(path, p), ErrorCode::kConfiguration);
    }
    {
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(10, 4, 5);
        p.fixed_width = false;
        CHECK_CODE(w.open(path, p), ErrorCode::kConfiguration);
    }
    {
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(10, 4);
        p.chunk_size = MAX_CHUNK_SIZE + 1;
        CHECK_CODE(w.open(path, p), ErrorCode::kConfiguration);
    }
    {
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(10, 4);
        p.chunk_size = 0;
        CHECK_CODE(w.open(path, p), ErrorCode::kConfiguration);
    }
    {
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(10, 4);
        p.docs_per_chunk = 0;
        CHECK_CODE(w.open(path, p), ErrorCode::kConfiguration);
    }
    {
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(10, 4);
        p.total_docs = -1;
        CHECK_CODE(w.open(path, p), ErrorCode::kConfiguration);
    }
    {
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(10, 4);
        p.compression = ChunkCompressionType::kSnappy;
        CHECK_CODE(w.open(path, p), ErrorCode::kConfiguration);
    }
    // Rejected parameters never create the file
    CHECK(!std::filesystem::exists(path));
}

static void test_variable_width_versions() {
    for (int32_t version : {2, 3}) {
        std::string path = kTestDir + "/var_v" + std::to_string(version) + ".fwd";
        ChunkForwardIndexWriter w(quiet_logger());
        ChunkWriterParams p = int_params(0, 8, version);
        p.fixed_width = false;
        CHECK_OK(w.open(path, p));
        CHECK(w.is_open());
        CHECK_OK(w.close());

        FwdFile f;
        CHECK(parse_fwd_file(path, f));
        CHECK_EQ(f.version, version);
        CHECK_EQ(f.num_chunks, 0);
        CHECK_EQ(f.bytes.size(), HEADER_FIXED_SIZE);
    }
}

static void test_open_failure_releases_compressor() {
    int closes = 0;
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_CODE(w.open("/nonexistent_chunkfwd_dir/x.fwd", int_params(4, 4),
                      std::make_unique<CountingCompressor>(&closes)),
               ErrorCode::kIO);
    CHECK_EQ(closes, 1);
    CHECK(!w.is_open());

    closes = 0;
    ChunkForwardIndexWriter w2(quiet_logger());
    CHECK_CODE(w2.open(kTestDir + "/bad.fwd", int_params(4, 4, 9),
                       std::make_unique<CountingCompressor>(&closes)),
               ErrorCode::kConfiguration);
    CHECK_EQ(closes, 1);
}

static void test_partial_final_chunk() {
    std::string path = kTestDir + "/partial.fwd";
    const int32_t dpc = 4;
    const int32_t docs = 2 * dpc + 3;

    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open(path, int_params(docs, dpc)));
    CHECK_EQ(w.header().num_chunks(), 3);
    CHECK_EQ(w.data_offset(), 28u + 3u * 4u);

    CHECK(put_ints(w, 0, dpc));
    CHECK(w.chunk_buffer().full());
    CHECK_OK(w.flush_chunk());
    CHECK(put_ints(w, dpc, dpc));
    CHECK_OK(w.flush_chunk());
    CHECK(put_ints(w, 2 * dpc, 3));
    CHECK_EQ(w.chunks_written(), 2);
    CHECK_OK(w.close());
    CHECK(w.is_closed());
    CHECK_EQ(w.chunks_written(), 3);

    FwdFile f;
    CHECK(parse_fwd_file(path, f));
    CHECK_EQ(f.version, 2);
    CHECK_EQ(f.num_chunks, 3);
    CHECK_EQ(f.docs_per_chunk, dpc);
    CHECK_EQ(f.entry_size, 4);
    CHECK_EQ(f.total_docs, docs);
    CHECK_EQ(f.compression, 0);
    CHECK_EQ(f.offsets_start, 28);

    CHECK_EQ(f.offsets.size(), 3u);
    if (f.offsets.size() == 3) {
        CHECK_EQ(f.offsets[0], f.header_size());
        CHECK(f.offsets[0] < f.offsets[1]);
        CHECK(f.offsets[1] < f.offsets[2]);
        CHECK_EQ(f.offsets[1] - f.offsets[0], 16u);
        CHECK_EQ(f.bytes.size() - f.offsets[2], 12u);
    }

    std::vector<std::vector<uint8_t>> entries;
    CHECK(read_fixed_entries(f, entries));
    for (size_t i = 0; i < entries.size(); i++) {
        CHECK_EQ(be_int32(entries[i]), static_cast<int32_t>(i));
    }
}

static void test_long_offsets() {
    std::string path = kTestDir + "/v3.fwd";
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open(path, int_params(4, 2, 3)));
    CHECK_EQ(w.data_offset(), 28u + 2u * 8u);
    CHECK(put_ints(w, 100, 2));
    CHECK_OK(w.flush_chunk());
    CHECK(put_ints(w, 200, 2));
    CHECK_OK(w.flush_chunk());
    CHECK_OK(w.close());

    FwdFile f;
    CHECK(parse_fwd_file(path, f));
    CHECK_EQ(f.offsets.size(), 2u);
    if (f.offsets.size() == 2) {
        CHECK_EQ(f.offsets[0], 44u);
        CHECK_EQ(f.offsets[1], 52u);
    }
    CHECK_EQ(f.bytes.size(), 60u);
}

static void test_empty_flush() {
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open(kTestDir + "/empty_flush.fwd", int_params(4, 4)));
    CHECK_CODE(w.flush_chunk(), ErrorCode::kUsage);
    CHECK_EQ(w.chunks_written(), 0);
    CHECK(put_ints(w, 0, 4));
    CHECK_OK(w.close());
}

static void test_flush_beyond_declared() {
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open(kTestDir + "/beyond.fwd", int_params(4, 4)));
    CHECK(put_ints(w, 0, 4));
    CHECK_OK(w.flush_chunk());
    CHECK(put_ints(w, 4, 1));
    CHECK_CODE(w.flush_chunk(), ErrorCode::kUsage);
    CHECK_EQ(w.chunks_written(), 1);
    // Pending bytes cannot be flushed either
    CHECK_CODE(w.close(), ErrorCode::kUsage);
    CHECK(w.is_closed());
}

static void test_use_after_close() {
    std::string path = kTestDir + "/after_close.fwd";
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_CODE(w.close(), ErrorCode::kUsage);
    CHECK_CODE(w.flush_chunk(), ErrorCode::kUsage);

    CHECK_OK(w.open(path, int_params(2, 2)));
    CHECK(put_ints(w, 7, 2));
    CHECK_OK(w.close());

    CHECK_CODE(w.close(), ErrorCode::kUsage);
    CHECK_CODE(w.flush_chunk(), ErrorCode::kUsage);
    CHECK_CODE(w.open(path, int_params(2, 2)), ErrorCode::kUsage);

    int closes = 0;
    CHECK_CODE(w.open(path, int_params(2, 2),
                      std::make_unique<CountingCompressor>(&closes)),
               ErrorCode::kUsage);
    CHECK_EQ(closes, 1);

    // The file from the first open is untouched
    FwdFile f;
    CHECK(parse_fwd_file(path, f));
    CHECK_EQ(f.total_docs, 2);
    CHECK_EQ(f.bytes.size(), 28u + 4u + 8u);
}

static void test_fewer_chunks_than_declared() {
    std::string path = kTestDir + "/short.fwd";
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open(path, int_params(10, 4)));
    CHECK(put_ints(w, 0, 4));
    CHECK_OK(w.flush_chunk());
    CHECK_CODE(w.close(), ErrorCode::kUsage);
    CHECK(w.is_closed());

    // Header still written, missing offsets are zero
    FwdFile f;
    CHECK(parse_fwd_file(path, f));
    CHECK_EQ(f.num_chunks, 3);
    CHECK_EQ(f.offsets.size(), 3u);
    if (f.offsets.size() == 3) {
        CHECK_EQ(f.offsets[0], 40u);
        CHECK_EQ(f.offsets[1], 0u);
        CHECK_EQ(f.offsets[2], 0u);
    }
}

static void test_compressor_closed_once() {
    int closes = 0;
    {
        ChunkForwardIndexWriter w(quiet_logger());
        CHECK_OK(w.open(kTestDir + "/counting.fwd", int_params(3, 2),
                        std::make_unique<CountingCompressor>(&closes)));
        CHECK(put_ints(w, 0, 2));
        CHECK_OK(w.flush_chunk());
        CHECK(put_ints(w, 2, 1));
        CHECK_OK(w.close());
        CHECK_EQ(w.chunks_written(), 2);
        CHECK_EQ(closes, 1);
        CHECK_CODE(w.close(), ErrorCode::kUsage);
    }
    CHECK_EQ(closes, 1);

    // Closed by the destructor when the owner forgets
    closes = 0;
    std::string path = kTestDir + "/dropped.fwd";
    {
        ChunkForwardIndexWriter w(quiet_logger());
        CHECK_OK(w.open(path, int_params(2, 2),
                        std::make_unique<CountingCompressor>(&closes)));
        CHECK(put_ints(w, 5, 2));
    }
    CHECK_EQ(closes, 1);
    FwdFile f;
    CHECK(parse_fwd_file(path, f));
    CHECK_EQ(f.offsets.size(), 1u);
    if (!f.offsets.empty()) CHECK_EQ(f.offsets[0], 32u);
}

static void test_header_write_failure() {
    // Writes to /dev/full fail with ENOSPC
    if (!std::filesystem::exists("/dev/full")) return;

    int closes = 0;
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open("/dev/full", int_params(0, 4),
                    std::make_unique<CountingCompressor>(&closes)));
    CHECK_CODE(w.close(), ErrorCode::kIO);
    CHECK(w.is_closed());
    CHECK_EQ(closes, 1);
}

static void test_compression_failure() {
    int closes = 0;
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open(kTestDir + "/failing.fwd", int_params(4, 4),
                    std::make_unique<FailingCompressor>(&closes)));
    uint64_t offset = w.data_offset();
    CHECK(put_ints(w, 0, 4));
    CHECK_CODE(w.flush_chunk(), ErrorCode::kCompression);
    CHECK_EQ(w.chunks_written(), 0);
    CHECK_EQ(w.data_offset(), offset);
    CHECK(w.chunk_buffer().full());

    // close retries the pending chunk, fails again and still releases
    CHECK_CODE(w.close(), ErrorCode::kCompression);
    CHECK(w.is_closed());
    CHECK_EQ(closes, 1);
}

static void test_compressed_size_beyond_buffer() {
    std::string path = kTestDir + "/over_reporting.fwd";
    int closes = 0;
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open(path, int_params(4, 4),
                    std::make_unique<OverReportingCompressor>(&closes)));
    uint64_t offset = w.data_offset();
    CHECK(put_ints(w, 0, 4));
    CHECK_CODE(w.flush_chunk(), ErrorCode::kCompression);
    CHECK_EQ(w.chunks_written(), 0);
    CHECK_EQ(w.data_offset(), offset);
    // Nothing reached the file
    CHECK_EQ(std::filesystem::file_size(path), 0u);

    CHECK_CODE(w.close(), ErrorCode::kCompression);
    CHECK(w.is_closed());
    CHECK_EQ(closes, 1);
}

static void test_int_offset_overflow() {
    // 32 chunks of 64MB push the next v2 offset past INT32_MAX; the bytes
    // go to /dev/null
    if (!std::filesystem::exists("/dev/null")) return;

    const int64_t chunk_size = int64_t(1) << 26;
    ChunkWriterParams p = int_params(33, 1);
    p.chunk_size = chunk_size;

    int closes = 0;
    ChunkForwardIndexWriter w(quiet_logger());
    CHECK_OK(w.open("/dev/null", p, std::make_unique<SizeOnlyCompressor>(&closes)));
    CHECK_EQ(w.data_offset(), 28u + 33u * 4u);

    for (int i = 0; i < 32; i++) {
        CHECK(w.chunk_buffer().seek(static_cast<size_t>(chunk_size)));
        CHECK_OK(w.flush_chunk());
    }
    CHECK_EQ(w.chunks_written(), 32);
    uint64_t offset = w.data_offset();
    CHECK(offset > MAX_INT_OFFSET);

    CHECK(w.chunk_buffer().seek(static_cast<size_t>(chunk_size)));
    CHECK_CODE(w.flush_chunk(), ErrorCode::kOverflow);
    CHECK_EQ(w.chunks_written(), 32);
    CHECK_EQ(w.data_offset(), offset);
    CHECK_EQ(w.header().chunk_offsets().back(), 28u + 33u * 4u + 31u * (1u << 26));

    CHECK_CODE(w.close(), ErrorCode::kOverflow);
    CHECK(w.is_closed());
    CHECK_EQ(closes, 1);
}

int main() {
    std::filesystem::remove_all(kTestDir);
    std::filesystem::create_directories(kTestDir);

    test_rejected_construction();
    test_variable_width_versions();
    test_open_failure_releases_compressor();
    test_partial_final_chunk();
    test_long_offsets();
    test_empty_flush();
    test_flush_beyond_declared();
    test_use_after_close();
    test_fewer_chunks_than_declared();
    test_compressor_closed_once();
    test_header_write_failure();
    test_compression_failure();
    test_compressed_size_beyond_buffer();
    test_int_offset_overflow();

    std::filesystem::remove_all(kTestDir);
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
