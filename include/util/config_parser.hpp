#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"
#include "worldfetch/strategy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace worldfetch::config {

// Optional JSON config file. Every field may be overridden on the command line.
//
//   {
//     "url": "https://...",
//     "output_dir": "/srv/map",
//     "worlds": ["world", "world_nether"],
//     "download": { "mode": "auto", "connections": 0 },
//     "log_level": "info"
//   }
struct FetchConfig {
    std::string url;
    std::string output_dir;
    std::vector<std::string> worlds;
    std::optional<DownloadMode> mode;
    std::optional<int> connections;
    std::optional<LogLevel> log_level;

    void Reset();
    Result LoadFile(const std::string& path);
    Result LoadString(const std::string& json_text);
};

} // namespace worldfetch::config
