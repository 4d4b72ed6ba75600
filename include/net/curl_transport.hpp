#pragma once

#include "net/http.hpp"

namespace worldfetch {

// libcurl-backed transport. Each Open() gets its own easy handle driven by a
// private multi handle, so responses can be read incrementally and used from
// different threads concurrently.
class CurlTransport final : public IHttpTransport {
  public:
    CurlTransport();

    Result Open(const HttpRequest& req, std::unique_ptr<IHttpResponse>& out) override;
};

// curl_global_init exactly once per process.
void EnsureCurlInitialized();

} // namespace worldfetch
