#include "worldfetch/capability_prober.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <memory>
#include <vector>

namespace worldfetch {

namespace {

// The server may have ignored the Range hint and started on the full body;
// read a little so the peer sees a sane client, then drop the rest.
void DrainPrefix(IHttpResponse& resp, std::size_t limit) {
    std::vector<std::uint8_t> buf(std::min<std::size_t>(limit, 1024));
    std::size_t drained = 0;
    while (drained < limit && !buf.empty()) {
        const std::size_t want = std::min(buf.size(), limit - drained);
        const ssize_t n = resp.Read(std::span<std::uint8_t>(buf.data(), want));
        if (n <= 0) break;
        drained += static_cast<std::size_t>(n);
    }
}

} // namespace

TransferDescriptor CapabilityProber::Probe(const std::string& url) const {
    TransferDescriptor desc;
    desc.url = url;

    HttpRequest req;
    req.url = url;
    req.range = ByteRange{0, 0};
    req.timeout = opt_.timeout;
    req.connect_timeout = std::min(req.connect_timeout, opt_.timeout);

    std::unique_ptr<IHttpResponse> resp;
    auto open_res = transport_.Open(req, resp);
    if (!open_res.is_ok() || !resp) {
        LogDebug("probe failed: %s", open_res.msg.c_str());
        return desc;
    }

    const long status = resp->Status();
    if (status == kHttpPartialContent) {
        const auto content_range = resp->Header("content-range");
        const auto total = content_range ? ParseContentRangeTotal(*content_range) : std::nullopt;
        if (total && *total > 0) {
            desc.total_size = total;
            desc.range_supported = true;
        } else {
            LogDebug("probe: 206 without usable Content-Range (%s)",
                     content_range ? content_range->c_str() : "absent");
        }
    } else if (status == kHttpOk) {
        const auto length = resp->ContentLength();
        if (length && *length > 0) {
            desc.total_size = length;
        }
    } else {
        LogDebug("probe: unexpected HTTP status %ld", status);
    }

    DrainPrefix(*resp, opt_.max_drain_bytes);
    return desc;
}

} // namespace worldfetch
