#include "worldfetch/chunk_downloader.hpp"

#include "system/signals.hpp"
#include "util/format.hpp"
#include "util/logger.hpp"
#include "worldfetch/progress_reporter.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>

namespace worldfetch {

namespace {

constexpr std::string_view kPhase = "download";

bool Cancelled(const std::atomic_bool& abort) {
    return abort.load(std::memory_order_relaxed) || g_cancel.load(std::memory_order_relaxed);
}

} // namespace

Result ChunkDownloader::FetchChunk(const std::string& url,
                                   const FileWriter& dst,
                                   const ChunkRange& chunk,
                                   ProgressCounter& progress,
                                   const std::atomic_bool& abort) const {
    HttpRequest req;
    req.url = url;
    req.range = ByteRange{chunk.first, chunk.last};
    req.timeout = opt_.request_timeout;

    std::unique_ptr<IHttpResponse> resp;
    auto open_res = transport_.Open(req, resp);
    if (!open_res.is_ok()) return open_res;

    if (resp->Status() != kHttpPartialContent) {
        return Result::Fail(-1, "expected 206 Partial Content, got " + std::to_string(resp->Status()));
    }

    std::vector<std::uint8_t> buf(std::max<std::size_t>(opt_.read_buffer_bytes, 1));
    const std::uint64_t end = chunk.last + 1;
    std::uint64_t offset = chunk.first;

    while (true) {
        if (Cancelled(abort)) {
            return Result::Fail(-1, g_cancel.load() ? "interrupted" : "cancelled");
        }

        const ssize_t n = resp->Read(buf);
        if (n < 0) return Result::Fail(-1, "reading body: " + resp->LastError());
        if (n == 0) break;

        const auto got = static_cast<std::uint64_t>(n);
        if (got > end - offset) {
            return Result::Fail(-1, "server sent more bytes than the requested range");
        }

        auto w = dst.WriteAt(offset, std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!w.is_ok()) return w;

        offset += got;
        progress.Add(got);
    }

    if (offset != end) {
        return Result::Fail(-1, "short body: got " + std::to_string(offset - chunk.first) + " of " +
                                    std::to_string(chunk.Length()) + " bytes");
    }
    return Result::Ok();
}

Result ChunkDownloader::Download(const std::string& url,
                                 FileWriter& dst,
                                 std::uint64_t total_size,
                                 int workers,
                                 ProgressCounter& progress) const {
    if (total_size == 0) {
        return Result::Fail(-1, "cannot plan a ranged download of unknown or zero size");
    }
    workers = std::clamp(workers, kMinConnections, kMaxConnections);

    // Pre-size so no worker ever has to extend the file.
    auto tr = dst.Truncate(total_size);
    if (!tr.is_ok()) return tr.Wrap("pre-allocating " + FormatBytes(total_size));

    const std::vector<ChunkRange> plan = PlanChunks(total_size, workers);

    std::mutex err_mu;
    std::optional<Result> first_error;
    std::atomic_bool abort{false};

    // Workers only bump the counter; reporting happens on its own thread.
    ProgressReporter reporter(progress, total_size, std::string(kPhase), opt_.progress_interval,
                              opt_.progress_sink);

    auto worker = [&](const ChunkRange& chunk) {
        LogDebug("worker %d: bytes %llu-%llu", chunk.worker_id,
                 (unsigned long long)chunk.first, (unsigned long long)chunk.last);
        auto r = FetchChunk(url, dst, chunk, progress, abort);
        if (r.is_ok()) return;

        std::lock_guard<std::mutex> lk(err_mu);
        if (!first_error) {
            first_error = r.Wrap("worker " + std::to_string(chunk.worker_id) + " (bytes " +
                                 std::to_string(chunk.first) + "-" + std::to_string(chunk.last) + ")");
            abort.store(true, std::memory_order_relaxed);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(plan.size());
    auto join_all = [&] {
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    };

    try {
        for (const ChunkRange& chunk : plan) {
            std::function<void()> job = [&worker, chunk] { worker(chunk); };
            threads.push_back(opt_.spawn_worker ? opt_.spawn_worker(std::move(job)) : std::thread(std::move(job)));
        }
    } catch (const std::system_error& e) {
        abort.store(true, std::memory_order_relaxed);
        join_all();
        reporter.Stop();
        return Result::Fail(e.code().value(), std::string("starting download workers: ") + e.what());
    }

    join_all();

    reporter.Stop();

    if (first_error) return *first_error;

    reporter.EmitNow();
    LogInfo("downloaded %s with %zu connections", FormatBytes(total_size).c_str(), plan.size());
    return Result::Ok();
}

} // namespace worldfetch
