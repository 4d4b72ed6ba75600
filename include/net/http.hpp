#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace worldfetch {

inline constexpr long kHttpOk = 200;
inline constexpr long kHttpPartialContent = 206;

// Inclusive byte interval, as written in a Range header.
struct ByteRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
};

struct HttpRequest {
    std::string url;
    std::optional<ByteRange> range;
    std::chrono::milliseconds timeout{std::chrono::minutes(30)};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
};

// A response whose headers have arrived. The body is pulled through the
// IReader interface.
class IHttpResponse : public IReader {
  public:
    virtual long Status() const = 0;
    // Case-insensitive lookup; the last occurrence wins.
    virtual std::optional<std::string> Header(std::string_view name) const = 0;

    std::optional<std::uint64_t> ContentLength() const;
    std::optional<std::uint64_t> TotalSize() const override { return ContentLength(); }
};

class IHttpTransport {
  public:
    virtual ~IHttpTransport() = default;

    // Transport-level failures (DNS, connect, TLS, timeout before headers)
    // come back as a failed Result. Any HTTP status is a successful Open.
    virtual Result Open(const HttpRequest& req, std::unique_ptr<IHttpResponse>& out) = 0;
};

// "bytes=<first>-<last>"
std::string FormatRangeHeader(const ByteRange& r);

// Total length from a Content-Range value such as "bytes 0-0/1048576".
// Missing, malformed and "*" totals yield nullopt.
std::optional<std::uint64_t> ParseContentRangeTotal(std::string_view header);

// Strict non-negative decimal parse, as used for Content-Length.
std::optional<std::uint64_t> ParseDecimal(std::string_view s);

} // namespace worldfetch
