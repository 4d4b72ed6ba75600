#include "util/format.hpp"

#include <cstdio>

namespace worldfetch {

std::string FormatBytes(std::uint64_t bytes) {
    constexpr std::uint64_t kUnit = 1024;
    char buf[32];
    if (bytes < kUnit) {
        std::snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
        return buf;
    }

    std::uint64_t div = kUnit;
    int exp = 0;
    for (std::uint64_t n = bytes / kUnit; n >= kUnit; n /= kUnit) {
        div *= kUnit;
        ++exp;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %ciB",
                  static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
    return buf;
}

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    const int pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}

} // namespace worldfetch
