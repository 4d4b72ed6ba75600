#pragma once

#include "io/io.hpp"
#include "util/result.hpp"
#include "worldfetch/transfer.hpp"
#include "worldfetch/world_filter.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace worldfetch {

struct ExtractionTally {
    // Regular files written, per world name.
    std::map<std::string, std::uint64_t, std::less<>> files;
    std::uint64_t bytes = 0;
    std::uint64_t directories = 0;
    // Matching entries dropped because they resolved outside the root.
    std::uint64_t unsafe_skipped = 0;

    std::uint64_t FilesFor(std::string_view world) const;
    // Requested worlds that produced no files, in filter order.
    std::vector<std::string> Missing(const WorldFilter& filter) const;
};

// Reads a gzip-compressed tar stream and writes the directories and regular
// files that belong to the filter's worlds under `dst_dir`. Everything else
// in the archive is skipped, as are links and special files.
class WorldExtractor {
  public:
    struct Options {
        // Regular files larger than this abort the extraction.
        std::uint64_t max_file_bytes = 10 * kGiB;
        std::size_t copy_buffer_bytes = 256 * 1024;
    };

    WorldExtractor() = default;
    explicit WorldExtractor(const Options& opt) : opt_(opt) {}

    Result Extract(IReader& compressed,
                   const std::string& dst_dir,
                   const WorldFilter& filter,
                   ExtractionTally& tally) const;

  private:
    Options opt_{};
};

} // namespace worldfetch
