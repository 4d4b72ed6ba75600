#include "net/http.hpp"

#include <charconv>
#include <string>

namespace worldfetch {

namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
        s.remove_suffix(1);
    return s;
}

} // namespace

std::optional<std::uint64_t> ParseDecimal(std::string_view s) {
    s = Trim(s);
    if (s.empty()) return std::nullopt;

    std::uint64_t v = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return v;
}

std::optional<std::uint64_t> ParseContentRangeTotal(std::string_view header) {
    header = Trim(header);
    if (header.empty()) return std::nullopt;

    const auto slash = header.rfind('/');
    if (slash == std::string_view::npos || slash + 1 == header.size()) return std::nullopt;

    const std::string_view total = header.substr(slash + 1);
    if (total == "*") return std::nullopt;
    return ParseDecimal(total);
}

std::string FormatRangeHeader(const ByteRange& r) {
    return "bytes=" + std::to_string(r.first) + "-" + std::to_string(r.last);
}

std::optional<std::uint64_t> IHttpResponse::ContentLength() const {
    const auto v = Header("content-length");
    if (!v) return std::nullopt;
    return ParseDecimal(*v);
}

} // namespace worldfetch
