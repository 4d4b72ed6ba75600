#pragma once

#include "net/http.hpp"
#include "worldfetch/transfer.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace worldfetch {

// Finds out whether a URL can be fetched in byte ranges and how large it is,
// using a one-byte ranged GET (pre-signed object storage URLs tend to be
// valid for GET only, so HEAD is not an option).
class CapabilityProber {
  public:
    struct Options {
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};
        // Upper bound on body bytes read and discarded after the headers.
        std::size_t max_drain_bytes = 1024;
    };

    explicit CapabilityProber(IHttpTransport& transport) : transport_(transport) {}
    CapabilityProber(IHttpTransport& transport, const Options& opt)
        : transport_(transport), opt_(opt) {}

    // Never fails: anything unexpected yields {unknown size, no range support}.
    TransferDescriptor Probe(const std::string& url) const;

  private:
    IHttpTransport& transport_;
    Options opt_{};
};

} // namespace worldfetch
