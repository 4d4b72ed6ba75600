#pragma once

#include "io/file_writer.hpp"
#include "net/http.hpp"
#include "util/result.hpp"
#include "worldfetch/progress.hpp"
#include "worldfetch/transfer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace worldfetch {

// Fetches a whole resource with one ranged GET per worker, each writing its
// bytes at their final offset in `dst`. Either every byte is written or the
// call fails with the first worker error; there is no retry.
class ChunkDownloader {
  public:
    struct Options {
        std::chrono::milliseconds request_timeout{std::chrono::minutes(30)};
        std::chrono::milliseconds progress_interval{std::chrono::seconds(5)};
        std::size_t read_buffer_bytes = 256 * 1024;

        // Receives periodic progress from the reporter thread. Progress is
        // logged when unset.
        IProgress* progress_sink = nullptr;

        // Starts one worker thread. Empty means std::thread; a spawner may
        // throw std::system_error like the std::thread constructor does.
        std::function<std::thread(std::function<void()>)> spawn_worker;
    };

    explicit ChunkDownloader(IHttpTransport& transport) : transport_(transport) {}
    ChunkDownloader(IHttpTransport& transport, const Options& opt)
        : transport_(transport), opt_(opt) {}

    Result Download(const std::string& url,
                    FileWriter& dst,
                    std::uint64_t total_size,
                    int workers,
                    ProgressCounter& progress) const;

  private:
    Result FetchChunk(const std::string& url,
                      const FileWriter& dst,
                      const ChunkRange& chunk,
                      ProgressCounter& progress,
                      const std::atomic_bool& abort) const;

    IHttpTransport& transport_;
    Options opt_{};
};

} // namespace worldfetch
