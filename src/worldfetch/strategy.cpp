#include "worldfetch/strategy.hpp"

#include "util/format.hpp"

namespace worldfetch {

std::optional<DownloadMode> ParseDownloadMode(std::string_view s) {
    if (s.empty() || s == "auto") return DownloadMode::Auto;
    if (s == "parallel" || s == "force-parallel") return DownloadMode::Parallel;
    if (s == "single" || s == "force-single") return DownloadMode::Single;
    return std::nullopt;
}

const char* ToString(DownloadMode mode) {
    switch (mode) {
        case DownloadMode::Auto:     return "auto";
        case DownloadMode::Parallel: return "parallel";
        case DownloadMode::Single:   return "single";
    }
    return "unknown";
}

std::expected<StrategyDecision, std::string> SelectStrategy(const TransferDescriptor& desc,
                                                            const DownloadOptions& opt) {
    if (opt.connections < 0 || opt.connections > kMaxConnections) {
        return std::unexpected("connections must be between 0 and " + std::to_string(kMaxConnections) +
                               " (got " + std::to_string(opt.connections) + ")");
    }

    StrategyDecision d;

    if (opt.mode == DownloadMode::Single) {
        d.reason = "single-connection download (streaming, forced)";
        return d;
    }

    const bool size_known = desc.total_size.has_value() && *desc.total_size > 0;
    const std::uint64_t size = size_known ? *desc.total_size : 0;

    auto workers = [&] {
        return opt.connections > 0 ? opt.connections : ConnectionCountForSize(size);
    };

    if (opt.mode == DownloadMode::Parallel) {
        if (!desc.range_supported) {
            return std::unexpected(
                "server does not support HTTP Range requests; cannot use parallel download mode");
        }
        if (!size_known) {
            return std::unexpected(
                "server did not report the archive size; cannot use parallel download mode");
        }
        d.parallel = true;
        d.connections = workers();
        d.reason = "parallel download (" + std::to_string(d.connections) + " connections, " +
                   FormatBytes(size) + ", forced)";
        return d;
    }

    if (desc.range_supported && size_known && size >= kMinParallelSize) {
        d.parallel = true;
        d.connections = workers();
        d.reason = "parallel download (" + std::to_string(d.connections) + " connections, " +
                   FormatBytes(size) + ")";
        return d;
    }

    if (!desc.range_supported) {
        d.reason = size_known ? "single-connection download (" + FormatBytes(size) +
                                    ", server does not support Range requests)"
                              : "single-connection download (size unknown, server does not support "
                                "Range requests)";
    } else if (!size_known) {
        d.reason = "single-connection download (size unknown)";
    } else {
        d.reason = "single-connection download (" + FormatBytes(size) + ", below " +
                   FormatBytes(kMinParallelSize) + " parallel threshold)";
    }
    return d;
}

} // namespace worldfetch
