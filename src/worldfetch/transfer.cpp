#include "worldfetch/transfer.hpp"

#include <algorithm>

namespace worldfetch {

int ConnectionCountForSize(std::uint64_t total_size) {
    if (total_size < 256 * kMiB) return 2;
    if (total_size < 1 * kGiB) return 4;
    if (total_size < 4 * kGiB) return 8;
    return 12;
}

std::vector<ChunkRange> PlanChunks(std::uint64_t total_size, int workers) {
    std::vector<ChunkRange> plan;
    if (total_size == 0) return plan;

    const std::uint64_t n =
        std::min<std::uint64_t>(static_cast<std::uint64_t>(std::max(workers, 1)), total_size);
    const std::uint64_t chunk = total_size / n;

    plan.reserve(n);
    for (std::uint64_t i = 0; i < n; ++i) {
        ChunkRange r;
        r.worker_id = static_cast<int>(i);
        r.first = i * chunk;
        r.last = (i + 1 == n) ? total_size - 1 : r.first + chunk - 1;
        plan.push_back(r);
    }
    return plan;
}

} // namespace worldfetch
