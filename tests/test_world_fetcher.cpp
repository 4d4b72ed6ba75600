#include "worldfetch/world_fetcher.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace worldfetch {
namespace {

namespace fs = std::filesystem;
using testutil::FakeHttpServer;
using testutil::TarEntry;

constexpr const char* kUrl = "https://storage.example/backups/2024-05-01.tar.gz?token=t";

std::vector<std::uint8_t> Backup() {
    return testutil::BuildTarGz({
        {"world/level.dat", "overworld"},
        {"world/region/r.0.0.mca", std::string(150000, 'o')},
        {"world/region/r.0.1.mca", std::string(90000, 'p')},
        {"world_nether/level.dat", "nether"},
        {"plugins/x.jar", std::string(40000, 'j')},
        {"server.properties", "motd=hi"},
    });
}

bool HasTempLeftovers(const std::string& dir) {
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().filename().string().rfind(".backup-", 0) == 0) return true;
    }
    return false;
}

class WorldFetcherTest : public ::testing::Test {
  protected:
    WorldFetcher::Options Opts(DownloadMode mode, int connections = 0) {
        WorldFetcher::Options opt;
        opt.download.mode = mode;
        opt.download.connections = connections;
        opt.progress_interval = std::chrono::milliseconds(20);
        return opt;
    }

    std::string Out() const { return tmp.Sub("map").string(); }

    testutil::TemporaryDirectory tmp;
};

TEST_F(WorldFetcherTest, AutoModeStreamsSmallArchive) {
    FakeHttpServer server(Backup());
    ExtractionTally tally;

    auto r = WorldFetcher(server, Opts(DownloadMode::Auto))
                 .DownloadAndExtractWorlds(kUrl, Out(), {"world"}, &tally);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    const auto seen = server.SeenRanges();
    ASSERT_EQ(seen.size(), 2U);
    ASSERT_TRUE(seen[0].has_value());
    EXPECT_EQ(seen[0]->last, 0U);
    EXPECT_FALSE(seen[1].has_value());

    EXPECT_EQ(tally.FilesFor("world"), 3U);
    EXPECT_EQ(testutil::ReadFile(fs::path(Out()) / "world/level.dat"), "overworld");
    EXPECT_FALSE(fs::exists(fs::path(Out()) / "plugins"));
    EXPECT_FALSE(fs::exists(fs::path(Out()) / "world_nether"));
}

TEST_F(WorldFetcherTest, ForcedParallelMatchesSingleStream) {
    const auto body = Backup();

    FakeHttpServer single_server(body);
    const std::string single_out = tmp.Sub("single").string();
    auto rs = WorldFetcher(single_server, Opts(DownloadMode::Single))
                  .DownloadAndExtractWorlds(kUrl, single_out, {"world", "world_nether"});
    ASSERT_TRUE(rs.is_ok()) << rs.msg;
    EXPECT_EQ(single_server.Requests(), 1);

    FakeHttpServer parallel_server(body);
    auto rp = WorldFetcher(parallel_server, Opts(DownloadMode::Parallel, 4))
                  .DownloadAndExtractWorlds(kUrl, Out(), {"world", "world_nether"});
    ASSERT_TRUE(rp.is_ok()) << rp.msg;
    EXPECT_EQ(parallel_server.Requests(), 1 + 4);

    EXPECT_FALSE(HasTempLeftovers(Out()));
    EXPECT_EQ(testutil::Snapshot(Out()), testutil::Snapshot(single_out));
}

TEST_F(WorldFetcherTest, ForcedParallelWithoutRangesFailsEarly) {
    FakeHttpServer::Behaviour b;
    b.support_ranges = false;
    FakeHttpServer server(Backup(), b);

    auto r = WorldFetcher(server, Opts(DownloadMode::Parallel))
                 .DownloadAndExtractWorlds(kUrl, Out(), {"world"});
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("Range"), std::string::npos) << r.msg;
    EXPECT_EQ(server.Requests(), 1);
    EXPECT_TRUE(fs::is_empty(Out()));
}

TEST_F(WorldFetcherTest, AutoModeFallsBackWithoutRanges) {
    FakeHttpServer::Behaviour b;
    b.support_ranges = false;
    FakeHttpServer server(Backup(), b);

    auto r = WorldFetcher(server, Opts(DownloadMode::Auto))
                 .DownloadAndExtractWorlds(kUrl, Out(), {"world_nether"});
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFile(fs::path(Out()) / "world_nether/level.dat"), "nether");
}

TEST_F(WorldFetcherTest, FailedChunkRemovesTempFile) {
    const auto body = Backup();
    FakeHttpServer::Behaviour b;
    b.error_at_first = PlanChunks(body.size(), 3)[2].first;
    FakeHttpServer server(body, b);

    auto r = WorldFetcher(server, Opts(DownloadMode::Parallel, 3))
                 .DownloadAndExtractWorlds(kUrl, Out(), {"world"});
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("parallel download"), std::string::npos) << r.msg;
    EXPECT_NE(r.msg.find("worker 2"), std::string::npos) << r.msg;
    EXPECT_FALSE(HasTempLeftovers(Out()));
    EXPECT_FALSE(fs::exists(fs::path(Out()) / "world"));
}

TEST_F(WorldFetcherTest, SingleStreamErrorStatusFails) {
    FakeHttpServer::Behaviour b;
    b.status = 404;
    FakeHttpServer server(Backup(), b);

    auto r = WorldFetcher(server, Opts(DownloadMode::Single))
                 .DownloadAndExtractWorlds(kUrl, Out(), {"world"});
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("status 404"), std::string::npos) << r.msg;
}

TEST_F(WorldFetcherTest, UnreachableServerFails) {
    FakeHttpServer::Behaviour b;
    b.fail_transport = true;
    FakeHttpServer server(Backup(), b);

    auto r = WorldFetcher(server, Opts(DownloadMode::Auto))
                 .DownloadAndExtractWorlds(kUrl, Out(), {"world"});
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("connection refused"), std::string::npos) << r.msg;
}

TEST_F(WorldFetcherTest, NoWorldsIsRejected) {
    FakeHttpServer server(Backup());

    auto r = WorldFetcher(server).DownloadAndExtractWorlds(kUrl, Out(), {});
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(server.Requests(), 0);
}

TEST_F(WorldFetcherTest, RequestedWorldAbsentStillSucceeds) {
    FakeHttpServer server(Backup());
    ExtractionTally tally;

    auto r = WorldFetcher(server, Opts(DownloadMode::Auto))
                 .DownloadAndExtractWorlds(kUrl, Out(), {"world_the_end"}, &tally);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(tally.FilesFor("world_the_end"), 0U);
    EXPECT_TRUE(fs::is_empty(Out()));
}

} // namespace
} // namespace worldfetch
