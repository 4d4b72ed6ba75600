#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace worldfetch {

inline constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
inline constexpr std::uint64_t kGiB = 1024ULL * kMiB;

// Archives smaller than this are not worth several connections.
inline constexpr std::uint64_t kMinParallelSize = 64 * kMiB;

inline constexpr int kMinConnections = 1;
inline constexpr int kMaxConnections = 32;

// What the probe learned about a download URL.
struct TransferDescriptor {
    std::string url;
    std::optional<std::uint64_t> total_size;
    bool range_supported = false;
};

// One worker's share of the download; `last` is inclusive.
struct ChunkRange {
    int worker_id = 0;
    std::uint64_t first = 0;
    std::uint64_t last = 0;

    std::uint64_t Length() const { return last - first + 1; }
};

// Worker count scaled to the archive size: 2 below 256 MiB, 4 below 1 GiB,
// 8 below 4 GiB and 12 beyond.
int ConnectionCountForSize(std::uint64_t total_size);

// Splits [0, total_size) into `workers` contiguous ranges in ascending order.
// The last range absorbs the division remainder. When there are fewer bytes
// than workers, only one range per byte is produced. Empty for total_size 0.
std::vector<ChunkRange> PlanChunks(std::uint64_t total_size, int workers);

} // namespace worldfetch
