#include "metricstore/export/stream_buffers.h"
#include "metricstore/common/logger.h"

#include <cstring>

namespace metricstore {
namespace exporter {

namespace {

constexpr size_t kChunkSize = 64 * 1024;
constexpr int kGzipWindowBits = 15 + 16;   // zlib window, gzip wrapper
constexpr int kMemLevel = 8;

} // namespace

CountingStreamBuf::int_type CountingStreamBuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    if (traits_type::eq_int_type(sink_->sputc(traits_type::to_char_type(ch)), traits_type::eof())) {
        return traits_type::eof();
    }
    ++bytes_;
    return ch;
}

std::streamsize CountingStreamBuf::xsputn(const char* data, std::streamsize count) {
    std::streamsize written = sink_->sputn(data, count);
    if (written > 0) {
        bytes_ += static_cast<uint64_t>(written);
    }
    return written;
}

int CountingStreamBuf::sync() {
    return sink_->pubsync();
}

GzipStreamBuf::GzipStreamBuf(std::streambuf* sink, int level)
    : sink_(sink), in_(kChunkSize), out_(kChunkSize) {
    std::memset(&stream_, 0, sizeof(stream_));
    int rc = deflateInit2(&stream_, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        METRICSTORE_ERROR("deflateInit2 failed: {}", rc);
        failed_ = true;
        return;
    }
    initialized_ = true;
    setp(in_.data(), in_.data() + in_.size());
}

GzipStreamBuf::~GzipStreamBuf() {
    if (initialized_ && !finished_) {
        auto finished = finish();
        if (!finished.ok()) {
            METRICSTORE_ERROR("Gzip stream not finished cleanly: {}", finished.error());
        }
    }
    if (initialized_) {
        deflateEnd(&stream_);
    }
}

bool GzipStreamBuf::deflatePending(int flush) {
    stream_.next_in = reinterpret_cast<Bytef*>(pbase());
    stream_.avail_in = static_cast<uInt>(pptr() - pbase());

    int rc = Z_OK;
    do {
        stream_.next_out = reinterpret_cast<Bytef*>(out_.data());
        stream_.avail_out = static_cast<uInt>(out_.size());
        rc = deflate(&stream_, flush);
        if (rc == Z_STREAM_ERROR) {
            return false;
        }
        auto produced = static_cast<std::streamsize>(out_.size() - stream_.avail_out);
        if (produced > 0 && sink_->sputn(out_.data(), produced) != produced) {
            return false;
        }
    } while (stream_.avail_out == 0 || (flush == Z_FINISH && rc != Z_STREAM_END));

    setp(in_.data(), in_.data() + in_.size());
    return true;
}

GzipStreamBuf::int_type GzipStreamBuf::overflow(int_type ch) {
    if (!ok() || finished_) {
        return traits_type::eof();
    }
    if (!deflatePending(Z_NO_FLUSH)) {
        failed_ = true;
        return traits_type::eof();
    }
    if (!traits_type::eq_int_type(ch, traits_type::eof())) {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }
    return traits_type::not_eof(ch);
}

int GzipStreamBuf::sync() {
    if (!ok()) {
        return -1;
    }
    if (finished_) {
        return sink_->pubsync();
    }
    if (!deflatePending(Z_NO_FLUSH)) {
        failed_ = true;
        return -1;
    }
    return sink_->pubsync();
}

core::Result<void> GzipStreamBuf::finish() {
    if (!initialized_) {
        return core::Result<void>::error("Gzip stream failed to initialize", core::Error::Code::INTERNAL);
    }
    if (finished_) {
        return core::Result<void>();
    }
    finished_ = true;
    if (failed_ || !deflatePending(Z_FINISH)) {
        failed_ = true;
        return core::Result<void>::error("Writing compressed export failed", core::Error::Code::STORAGE_UNAVAILABLE);
    }
    if (sink_->pubsync() != 0) {
        failed_ = true;
        return core::Result<void>::error("Flushing compressed export failed", core::Error::Code::STORAGE_UNAVAILABLE);
    }
    return core::Result<void>();
}

} // namespace exporter
} // namespace metricstore
