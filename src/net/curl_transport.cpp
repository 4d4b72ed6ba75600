#include "net/curl_transport.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace worldfetch {

namespace {

// Once this much body data is queued the write callback pauses the transfer
// until Read() has drained it.
constexpr size_t kMaxPendingBytes = 1024 * 1024;
constexpr int kPollTimeoutMs = 500;

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view TrimHeaderValue(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
        s.remove_suffix(1);
    return s;
}

class CurlResponse final : public IHttpResponse {
  public:
    CurlResponse() = default;
    ~CurlResponse() override {
        if (multi_ && easy_) curl_multi_remove_handle(multi_.get(), easy_.get());
    }

    CurlResponse(const CurlResponse&) = delete;
    CurlResponse& operator=(const CurlResponse&) = delete;

    Result Start(const HttpRequest& req) {
        easy_.reset(curl_easy_init());
        multi_.reset(curl_multi_init());
        if (!easy_ || !multi_) return Result::Fail(-1, "Failed to allocate curl handle");

        CURL* h = easy_.get();
        curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(req.connect_timeout.count()));
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &CurlResponse::WriteCb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &CurlResponse::HeaderCb);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf_);

        if (req.range) {
            // CURLOPT_RANGE takes the bare "first-last" form.
            range_ = std::to_string(req.range->first) + "-" + std::to_string(req.range->last);
            curl_easy_setopt(h, CURLOPT_RANGE, range_.c_str());
        }

        if (curl_multi_add_handle(multi_.get(), h) != CURLM_OK) {
            return Result::Fail(-1, "curl_multi_add_handle failed");
        }

        while (!headers_complete_ && !done_) {
            auto r = Pump();
            if (!r.is_ok()) return r;
        }
        if (done_ && result_ != CURLE_OK) {
            return Result::Fail(static_cast<int>(result_), TransferError());
        }

        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status_);
        return Result::Ok();
    }

    long Status() const override { return status_; }

    std::optional<std::string> Header(std::string_view name) const override {
        auto it = headers_.find(Lower(name));
        if (it == headers_.end()) return std::nullopt;
        return it->second;
    }

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (out.empty()) return 0;

        while (pending_pos_ == pending_.size()) {
            pending_.clear();
            pending_pos_ = 0;
            if (paused_) {
                paused_ = false;
                // May re-enter WriteCb synchronously with the held-back data.
                if (curl_easy_pause(easy_.get(), CURLPAUSE_CONT) != CURLE_OK) {
                    last_error_ = "curl_easy_pause failed";
                    return -1;
                }
                continue;
            }
            if (done_) {
                if (result_ != CURLE_OK) {
                    last_error_ = TransferError();
                    return -1;
                }
                return 0;
            }
            auto r = Pump();
            if (!r.is_ok()) {
                last_error_ = r.msg;
                return -1;
            }
        }

        const size_t n = std::min(out.size(), pending_.size() - pending_pos_);
        std::memcpy(out.data(), pending_.data() + pending_pos_, n);
        pending_pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::string LastError() const override { return last_error_; }

  private:
    struct EasyDeleter {
        void operator()(CURL* h) const noexcept {
            if (h) curl_easy_cleanup(h);
        }
    };
    struct MultiDeleter {
        void operator()(CURLM* m) const noexcept {
            if (m) curl_multi_cleanup(m);
        }
    };

    // Drives the transfer until body data is queued, the transfer ends, or
    // the wait times out.
    Result Pump() {
        if (g_cancel.load(std::memory_order_relaxed)) {
            return Result::Fail(-1, "interrupted");
        }

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc != CURLM_OK) {
            return Result::Fail(-1, std::string("curl_multi_perform: ") + curl_multi_strerror(mc));
        }

        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &left)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
                done_ = true;
                headers_complete_ = true;
                result_ = msg->data.result;
            }
        }

        if (done_ || pending_pos_ < pending_.size() || paused_) return Result::Ok();

        mc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
        if (mc != CURLM_OK) {
            return Result::Fail(-1, std::string("curl_multi_poll: ") + curl_multi_strerror(mc));
        }
        return Result::Ok();
    }

    std::string TransferError() const {
        if (errbuf_[0] != '\0') return std::string(errbuf_);
        return curl_easy_strerror(result_);
    }

    static size_t WriteCb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponse*>(userdata);
        const size_t total = size * nmemb;
        self->headers_complete_ = true;
        if (self->pending_.size() - self->pending_pos_ >= kMaxPendingBytes) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->pending_.insert(self->pending_.end(),
                              reinterpret_cast<const std::uint8_t*>(ptr),
                              reinterpret_cast<const std::uint8_t*>(ptr) + total);
        return total;
    }

    static size_t HeaderCb(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlResponse*>(userdata);
        const size_t total = size * nitems;
        const std::string_view line(buffer, total);

        if (line.rfind("HTTP/", 0) == 0) {
            // New status line: a redirect hop or a 100-continue. Start over.
            self->headers_.clear();
            return total;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) return total;

        self->headers_[Lower(TrimHeaderValue(line.substr(0, colon)))] =
            std::string(TrimHeaderValue(line.substr(colon + 1)));
        return total;
    }

    std::unique_ptr<CURL, EasyDeleter> easy_;
    std::unique_ptr<CURLM, MultiDeleter> multi_;
    std::string range_;
    char errbuf_[CURL_ERROR_SIZE]{};

    std::map<std::string, std::string> headers_;
    long status_ = 0;
    bool headers_complete_ = false;

    std::vector<std::uint8_t> pending_;
    size_t pending_pos_ = 0;
    bool paused_ = false;

    bool done_ = false;
    CURLcode result_ = CURLE_OK;
    std::string last_error_;
};

} // namespace

void EnsureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlTransport::CurlTransport() { EnsureCurlInitialized(); }

Result CurlTransport::Open(const HttpRequest& req, std::unique_ptr<IHttpResponse>& out) {
    auto resp = std::make_unique<CurlResponse>();
    auto r = resp->Start(req);
    if (!r.is_ok()) {
        LogDebug("http open failed for %s: %s", req.range ? FormatRangeHeader(*req.range).c_str() : "full body",
                 r.msg.c_str());
        return r;
    }
    out = std::move(resp);
    return Result::Ok();
}

} // namespace worldfetch
