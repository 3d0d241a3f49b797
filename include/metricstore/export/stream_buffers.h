#ifndef METRICSTORE_EXPORT_STREAM_BUFFERS_H_
#define METRICSTORE_EXPORT_STREAM_BUFFERS_H_

#include <cstdint>
#include <streambuf>
#include <vector>

#include <zlib.h>

#include "metricstore/core/result.h"

namespace metricstore {
namespace exporter {

/**
 * @brief Pass-through buffer counting the bytes that reach its sink
 */
class CountingStreamBuf : public std::streambuf {
public:
    explicit CountingStreamBuf(std::streambuf* sink) : sink_(sink) {}

    uint64_t bytes() const { return bytes_; }

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* data, std::streamsize count) override;
    int sync() override;

private:
    std::streambuf* sink_;
    uint64_t bytes_ = 0;
};

/**
 * @brief Output buffer writing a gzip member to its sink
 *
 * finish() must be called to write the trailer; the destructor finishes an
 * unfinished stream but can only log a failure.
 */
class GzipStreamBuf : public std::streambuf {
public:
    GzipStreamBuf(std::streambuf* sink, int level);
    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;

    core::Result<void> finish();

    bool ok() const { return initialized_ && !failed_; }

protected:
    int_type overflow(int_type ch) override;
    int sync() override;

private:
    bool deflatePending(int flush);

    std::streambuf* sink_;
    z_stream stream_;
    std::vector<char> in_;
    std::vector<char> out_;
    bool initialized_ = false;
    bool finished_ = false;
    bool failed_ = false;
};

} // namespace exporter
} // namespace metricstore

#endif // METRICSTORE_EXPORT_STREAM_BUFFERS_H_
