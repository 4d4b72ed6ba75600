#pragma once

#include "net/http.hpp"
#include "util/result.hpp"
#include "worldfetch/capability_prober.hpp"
#include "worldfetch/chunk_downloader.hpp"
#include "worldfetch/progress.hpp"
#include "worldfetch/strategy.hpp"
#include "worldfetch/world_extractor.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace worldfetch {

// Downloads a tar.gz backup and extracts the requested worlds into
// `output_dir`, picking between a ranged parallel download into a temp file
// and a single streamed response.
class WorldFetcher {
  public:
    struct Options {
        DownloadOptions download;
        CapabilityProber::Options probe;
        ChunkDownloader::Options chunks;
        WorldExtractor::Options extract;
        std::chrono::milliseconds stream_timeout{std::chrono::minutes(30)};
        std::chrono::milliseconds progress_interval{std::chrono::seconds(5)};
        IProgress* progress_sink = nullptr;
    };

    explicit WorldFetcher(IHttpTransport& transport) : transport_(transport) {}
    WorldFetcher(IHttpTransport& transport, const Options& opt) : transport_(transport), opt_(opt) {}

    Result DownloadAndExtractWorlds(const std::string& url,
                                    const std::string& output_dir,
                                    const std::vector<std::string>& worlds,
                                    ExtractionTally* tally_out = nullptr) const;

  private:
    Result RunParallel(const std::string& url,
                       const std::string& output_dir,
                       const WorldFilter& filter,
                       std::uint64_t total_size,
                       int connections,
                       ExtractionTally& tally) const;

    Result RunSingleStream(const std::string& url,
                           const std::string& output_dir,
                           const WorldFilter& filter,
                           ExtractionTally& tally) const;

    IHttpTransport& transport_;
    Options opt_{};
};

} // namespace worldfetch
