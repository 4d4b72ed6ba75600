#pragma once

#include <cstdint>
#include <string>

namespace worldfetch {

// IEC byte count for log lines: "512 B", "1.5 KiB", "64.0 MiB".
std::string FormatBytes(std::uint64_t bytes);

// Integer percentage of done/total clamped to 100; 0 when total is 0.
int Percent(std::uint64_t done, std::uint64_t total);

} // namespace worldfetch
