#pragma once

#include "io/io.hpp"

#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

namespace worldfetch {

// Inflates a gzip stream pulled from `source`. Concatenated gzip members are
// decoded back to back. A source that ends before the final member is
// complete is reported as an error, never as a clean EOF.
class GzipReader final : public IReader {
  public:
    explicit GzipReader(IReader& source);
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::string LastError() const override { return last_error_; }

  private:
    ssize_t Fail(std::string msg);

    std::unique_ptr<IReader> owned_;
    IReader* source_ = nullptr;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool member_done_ = false;
    bool finished_ = false;
    bool any_output_ = false;
    std::string last_error_;
};

} // namespace worldfetch
