#include "net/curl_transport.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "worldfetch/strategy.hpp"
#include "worldfetch/world_fetcher.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <getopt.h>
#include <string>
#include <vector>

namespace {

enum LongOnly : int {
    kOptConfig = 1000,
    kOptLogLevel,
};

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -u <url> -o <dir> -w <world> [-w <world> ...] [options]\n"
        "\n"
        "Options:\n"
        "  -u, --url           Pre-signed download URL of the tar.gz backup\n"
        "  -o, --output        Directory the worlds are extracted into\n"
        "  -w, --world         Top-level folder to extract (repeatable)\n"
        "  -m, --mode          auto | parallel | single (default auto)\n"
        "  -c, --connections   Parallel connections, 0 = by size (default 0, max 32)\n"
        "      --config        JSON config file; command line values take precedence\n"
        "      --log-level     debug | info | warn | error | none (default info)\n"
        "  -h, --help          Show this help\n",
        argv0);
}

} // namespace

int main(int argc, char** argv) {
    using namespace worldfetch;

    std::string url_cli;
    std::string output_cli;
    std::vector<std::string> worlds_cli;
    const char* mode_cli = nullptr;
    const char* connections_cli = nullptr;
    const char* config_path = nullptr;
    const char* log_level_cli = nullptr;

    static option long_opts[] = {
        {"url", required_argument, nullptr, 'u'},
        {"output", required_argument, nullptr, 'o'},
        {"world", required_argument, nullptr, 'w'},
        {"mode", required_argument, nullptr, 'm'},
        {"connections", required_argument, nullptr, 'c'},
        {"config", required_argument, nullptr, kOptConfig},
        {"log-level", required_argument, nullptr, kOptLogLevel},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hu:o:w:m:c:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'u':
                url_cli = optarg;
                break;
            case 'o':
                output_cli = optarg;
                break;
            case 'w':
                worlds_cli.emplace_back(optarg);
                break;
            case 'm':
                mode_cli = optarg;
                break;
            case 'c':
                connections_cli = optarg;
                break;
            case kOptConfig:
                config_path = optarg;
                break;
            case kOptLogLevel:
                log_level_cli = optarg;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    config::FetchConfig cfg;
    if (config_path) {
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 2;
        }
    }

    if (log_level_cli) {
        auto lvl = ParseLogLevel(log_level_cli);
        if (!lvl) {
            std::fprintf(stderr, "Invalid --log-level: %s\n", log_level_cli);
            return 2;
        }
        cfg.log_level = *lvl;
    }
    if (cfg.log_level) Logger::Instance().SetLevel(*cfg.log_level);

    if (!url_cli.empty()) cfg.url = url_cli;
    if (!output_cli.empty()) cfg.output_dir = output_cli;
    if (!worlds_cli.empty()) cfg.worlds = worlds_cli;

    if (mode_cli) {
        auto m = ParseDownloadMode(mode_cli);
        if (!m) {
            std::fprintf(stderr, "Invalid --mode: %s\n", mode_cli);
            return 2;
        }
        cfg.mode = *m;
    }
    if (connections_cli) {
        char* end = nullptr;
        const long v = std::strtol(connections_cli, &end, 10);
        if (!end || *end != '\0' || v < 0 || v > kMaxConnections) {
            std::fprintf(stderr, "Invalid --connections: %s (expected 0..%d)\n", connections_cli,
                         kMaxConnections);
            return 2;
        }
        cfg.connections = static_cast<int>(v);
    }

    if (cfg.url.empty() || cfg.output_dir.empty() || cfg.worlds.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    InstallSignalHandlers();

    WorldFetcher::Options opt;
    opt.download.mode = cfg.mode.value_or(DownloadMode::Auto);
    opt.download.connections = cfg.connections.value_or(0);

    try {
        CurlTransport transport;
        WorldFetcher fetcher(transport, opt);

        LogInfo("extracting %zu world(s) into %s (mode %s)", cfg.worlds.size(), cfg.output_dir.c_str(),
                ToString(opt.download.mode));
        auto res = fetcher.DownloadAndExtractWorlds(cfg.url, cfg.output_dir, cfg.worlds);
        if (!res.ok) {
            LogError("%s", res.msg.c_str());
            return 1;
        }
    } catch (const std::exception& e) {
        LogError("fatal: %s", e.what());
        return 1;
    }

    return 0;
}
