#include "io/gzip_reader.hpp"

#include <stdexcept>

namespace worldfetch {

GzipReader::GzipReader(std::unique_ptr<IReader> source) : GzipReader(*source) {
    owned_ = std::move(source);
}

GzipReader::GzipReader(IReader& source) : source_(&source), in_buffer_(64 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }
}

GzipReader::~GzipReader() {
    inflateEnd(&strm_);
}

ssize_t GzipReader::Fail(std::string msg) {
    last_error_ = std::move(msg);
    return -1;
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (finished_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            const ssize_t n = source_->Read(in_buffer_);
            if (n < 0) {
                const std::string why = source_->LastError();
                return Fail(why.empty() ? "read error in compressed source" : why);
            }
            if (n == 0) {
                if (member_done_) {
                    finished_ = true;
                    break;
                }
                return Fail(any_output_ ? "unexpected end of compressed stream"
                                        : "empty or truncated gzip stream");
            }
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        if (member_done_) {
            // More input after a finished member: start the next one.
            if (inflateReset(&strm_) != Z_OK) {
                return Fail("inflateReset failed");
            }
            member_done_ = false;
        }

        const int ret = inflate(&strm_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            member_done_ = true;
            continue;
        }
        if (ret == Z_BUF_ERROR) {
            // No progress possible with the current buffers; loop refills input.
            if (strm_.avail_in == 0) continue;
            return Fail("inflate stalled on buffered input");
        }
        if (ret != Z_OK) {
            return Fail(std::string("invalid gzip data: ") + (strm_.msg ? strm_.msg : "inflate error"));
        }
        any_output_ = true;
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace worldfetch
