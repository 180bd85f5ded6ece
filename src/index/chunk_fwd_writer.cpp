#include "index/chunk_fwd_writer.hpp"
#include "core/config.hpp"

#include <utility>

namespace chunkfwd {

ChunkForwardIndexWriter::ChunkForwardIndexWriter(const Logger& logger)
    : logger_(logger) {}

ChunkForwardIndexWriter::~ChunkForwardIndexWriter() {
    if (state_ == State::kOpen) {
        Status st = close();
        if (!st.ok()) {
            logger_.error("closing forward index on destruction: %s",
                          st.to_string().c_str());
        }
    }
}

Status ChunkForwardIndexWriter::validate(const ChunkWriterParams& params) const {
    Status st = ForwardIndexHeader::validate_version(params.version, params.fixed_width);
    if (!st.ok()) return st;

    if (params.chunk_size > MAX_CHUNK_SIZE) {
        return configuration_error("chunk size limited to 2GB, got " +
                                   std::to_string(params.chunk_size) + " bytes");
    }
    if (params.chunk_size <= 0) {
        return configuration_error("chunk size must be positive, got " +
                                   std::to_string(params.chunk_size));
    }
    if (params.docs_per_chunk <= 0) {
        return configuration_error("docs per chunk must be positive, got " +
                                   std::to_string(params.docs_per_chunk));
    }
    if (params.total_docs < 0) {
        return configuration_error("total docs must not be negative, got " +
                                   std::to_string(params.total_docs));
    }
    if (params.entry_size < 0) {
        return configuration_error("entry size must not be negative, got " +
                                   std::to_string(params.entry_size));
    }
    return Status();
}

Status ChunkForwardIndexWriter::open(const std::string& path,
                                     const ChunkWriterParams& params) {
    if (state_ != State::kUnopened) {
        return usage_error("forward index writer for '" + data_file_.path() +
                           "' cannot be reopened");
    }
    Status st = validate(params);
    if (!st.ok()) return st;

    std::unique_ptr<ChunkCompressor> compressor;
    st = make_chunk_compressor(params.compression, compressor);
    if (!st.ok()) return st;
    return open(path, params, std::move(compressor));
}

Status ChunkForwardIndexWriter::open(const std::string& path,
                                     const ChunkWriterParams& params,
                                     std::unique_ptr<ChunkCompressor> compressor) {
    if (!compressor) {
        return configuration_error("no compressor supplied for '" + path + "'");
    }
    if (state_ != State::kUnopened) {
        compressor->close();
        return usage_error("forward index writer for '" + data_file_.path() +
                           "' cannot be reopened");
    }
    Status st = validate(params);
    if (!st.ok()) {
        compressor->close();
        return st;
    }

    header_ = ForwardIndexHeader(params.version, params.total_docs, params.docs_per_chunk,
                                 params.entry_size, compressor->type());

    const size_t chunk_size = static_cast<size_t>(params.chunk_size);
    chunk_buffer_ = ChunkBuffer(chunk_size);
    // May exceed the chunk size for incompressible data
    compressed_buffer_.assign(compressor->max_compressed_size(chunk_size), 0);

    st = data_file_.open(path);
    if (!st.ok()) {
        compressor->close();
        chunk_buffer_ = ChunkBuffer();
        compressed_buffer_ = std::vector<uint8_t>();
        return st;
    }

    compressor_ = std::move(compressor);
    data_offset_ = header_.size();
    state_ = State::kOpen;

    logger_.debug("opened '%s': version=%d, docs=%d, docs_per_chunk=%d, chunks=%d, "
                  "chunk_size=%zu, compression=%s, header=%zu bytes",
                  path.c_str(), header_.version(), header_.total_docs(),
                  header_.docs_per_chunk(), header_.num_chunks(), chunk_size,
                  compressor_->name(), header_.size());
    return Status();
}

Status ChunkForwardIndexWriter::flush_chunk() {
    if (state_ != State::kOpen) {
        return usage_error("flush on a forward index writer that is not open");
    }
    if (chunk_buffer_.empty()) {
        return usage_error("flush of an empty chunk would waste an offset table slot");
    }
    if (header_.offsets_full()) {
        return usage_error("'" + data_file_.path() + "': all " +
                           std::to_string(header_.num_chunks()) +
                           " declared chunks are already written");
    }

    // The offset is checked before anything reaches the file
    Status st = header_.check_offset(data_offset_);
    if (!st.ok()) {
        logger_.error("'%s': %s", data_file_.path().c_str(), st.message().c_str());
        return st;
    }

    size_t size_to_write = 0;
    st = compressor_->compress(chunk_buffer_.data(), chunk_buffer_.position(),
                               compressed_buffer_.data(), compressed_buffer_.size(),
                               size_to_write);
    if (!st.ok()) {
        logger_.error("compressing chunk %d of '%s': %s", chunks_written(),
                      data_file_.path().c_str(), st.message().c_str());
        return st;
    }
    if (size_to_write > compressed_buffer_.size()) {
        st = compression_error(std::string(compressor_->name()) + ": reported " +
                               std::to_string(size_to_write) +
                               " compressed bytes for a staging buffer of " +
                               std::to_string(compressed_buffer_.size()));
        logger_.error("compressing chunk %d of '%s': %s", chunks_written(),
                      data_file_.path().c_str(), st.message().c_str());
        return st;
    }

    st = data_file_.pwrite_all(compressed_buffer_.data(), size_to_write, data_offset_);
    if (!st.ok()) {
        logger_.error("writing chunk %d: %s", chunks_written(), st.message().c_str());
        return st;
    }

    st = header_.add_chunk_offset(data_offset_);
    if (!st.ok()) return st;

    data_offset_ += size_to_write;
    chunk_buffer_.clear();
    return Status();
}

// Close the file and the compressor on every path; keep the first error.
Status ChunkForwardIndexWriter::release(Status st) {
    Status close_st = data_file_.close();
    if (compressor_) {
        compressor_->close();
        compressor_.reset();
    }
    chunk_buffer_ = ChunkBuffer();
    compressed_buffer_ = std::vector<uint8_t>();
    state_ = State::kClosed;
    return st.ok() ? close_st : st;
}

Status ChunkForwardIndexWriter::close() {
    if (state_ == State::kUnopened) {
        return usage_error("close on a forward index writer that was never opened");
    }
    if (state_ == State::kClosed) {
        return usage_error("forward index writer for '" + data_file_.path() +
                           "' is already closed");
    }

    Status st;
    if (!chunk_buffer_.empty()) {
        st = flush_chunk();
    }
    if (st.ok()) {
        std::vector<uint8_t> header = header_.serialize();
        st = data_file_.pwrite_all(header.data(), header.size(), 0);
    }
    st = release(std::move(st));
    if (!st.ok()) return st;

    if (chunks_written() < header_.num_chunks()) {
        logger_.warn("'%s' closed after %d of %d declared chunks",
                     data_file_.path().c_str(), chunks_written(), header_.num_chunks());
        return usage_error("closed after " + std::to_string(chunks_written()) + " of " +
                           std::to_string(header_.num_chunks()) +
                           " declared chunks; trailing chunk offsets are zero");
    }

    logger_.debug("closed '%s': %d chunk(s), %lu bytes", data_file_.path().c_str(),
                  chunks_written(), static_cast<unsigned long>(data_offset_));
    return Status();
}

} // namespace chunkfwd
