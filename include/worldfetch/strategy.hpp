#pragma once

#include "worldfetch/transfer.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace worldfetch {

enum class DownloadMode {
    Auto,
    Parallel, // fail instead of falling back when ranges are unavailable
    Single,   // stream one response straight into the extractor
};

// "auto", "parallel" / "force-parallel", "single" / "force-single".
std::optional<DownloadMode> ParseDownloadMode(std::string_view s);
const char* ToString(DownloadMode mode);

struct DownloadOptions {
    DownloadMode mode = DownloadMode::Auto;
    // 0 scales with the archive size; 1..32 is used as given.
    int connections = 0;
};

struct StrategyDecision {
    bool parallel = false;
    int connections = 1;
    // Human-readable account of the choice, always logged.
    std::string reason;
};

std::expected<StrategyDecision, std::string> SelectStrategy(const TransferDescriptor& desc,
                                                            const DownloadOptions& opt);

} // namespace worldfetch
