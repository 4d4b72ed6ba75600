#include "worldfetch/world_fetcher.hpp"

#include "io/counting_reader.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/temp_file.hpp"
#include "util/format.hpp"
#include "util/logger.hpp"
#include "worldfetch/progress_reporter.hpp"

#include <filesystem>
#include <memory>

namespace worldfetch {

Result WorldFetcher::DownloadAndExtractWorlds(const std::string& url,
                                              const std::string& output_dir,
                                              const std::vector<std::string>& worlds,
                                              ExtractionTally* tally_out) const {
    const WorldFilter filter(worlds);
    if (filter.Empty()) return Result::Fail(-1, "no worlds requested");

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "creating output directory " + output_dir + ": " + ec.message());
    }

    const auto started = std::chrono::steady_clock::now();

    TransferDescriptor desc;
    desc.url = url;
    if (opt_.download.mode != DownloadMode::Single) {
        desc = CapabilityProber(transport_, opt_.probe).Probe(url);
        LogDebug("probe: size=%s range=%s",
                 desc.total_size ? FormatBytes(*desc.total_size).c_str() : "unknown",
                 desc.range_supported ? "yes" : "no");
    }

    auto decision = SelectStrategy(desc, opt_.download);
    if (!decision) return Result::Fail(-1, decision.error());
    LogInfo("%s", decision->reason.c_str());

    ExtractionTally tally;
    Result r = decision->parallel
                   ? RunParallel(url, output_dir, filter, *desc.total_size, decision->connections, tally)
                   : RunSingleStream(url, output_dir, filter, tally);
    if (!r.is_ok()) return r;

    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);
    LogInfo("download + extraction took %llds (%s written)", (long long)secs.count(),
            FormatBytes(tally.bytes).c_str());

    if (tally_out) *tally_out = std::move(tally);
    return Result::Ok();
}

Result WorldFetcher::RunParallel(const std::string& url,
                                 const std::string& output_dir,
                                 const WorldFilter& filter,
                                 std::uint64_t total_size,
                                 int connections,
                                 ExtractionTally& tally) const {
    // Same filesystem as the output keeps disk usage where the user expects it.
    ScopedTempFile temp;
    FileWriter writer;
    auto cr = temp.Create(output_dir, ".backup-", ".tar.gz", writer);
    if (!cr.is_ok()) return cr;

    ProgressCounter progress;
    ChunkDownloader::Options chunk_opt = opt_.chunks;
    chunk_opt.progress_interval = opt_.progress_interval;
    chunk_opt.progress_sink = opt_.progress_sink;

    auto dr = ChunkDownloader(transport_, chunk_opt).Download(url, writer, total_size, connections, progress);
    if (!dr.is_ok()) return dr.Wrap("parallel download");

    auto close_res = writer.Close();
    if (!close_res.is_ok()) return close_res.Wrap("closing temp file");

    FileReader archive;
    auto open_res = FileReader::Open(temp.Path(), archive);
    if (!open_res.is_ok()) return open_res.Wrap("opening downloaded archive");

    return WorldExtractor(opt_.extract).Extract(archive, output_dir, filter, tally).Wrap("extracting");
}

Result WorldFetcher::RunSingleStream(const std::string& url,
                                     const std::string& output_dir,
                                     const WorldFilter& filter,
                                     ExtractionTally& tally) const {
    HttpRequest req;
    req.url = url;
    req.timeout = opt_.stream_timeout;

    std::unique_ptr<IHttpResponse> resp;
    auto open_res = transport_.Open(req, resp);
    if (!open_res.is_ok()) return open_res.Wrap("download");

    if (resp->Status() != kHttpOk) {
        return Result::Fail(-1, "download returned status " + std::to_string(resp->Status()));
    }

    ProgressCounter received;
    CountingReader counted(*resp, received);
    ProgressReporter reporter(received, resp->ContentLength().value_or(0), "download",
                              opt_.progress_interval, opt_.progress_sink);

    auto r = WorldExtractor(opt_.extract).Extract(counted, output_dir, filter, tally);
    reporter.Stop();
    return r.Wrap("extracting");
}

} // namespace worldfetch
