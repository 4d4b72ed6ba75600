#include "util/config_parser.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

namespace worldfetch::config {
namespace {

TEST(FetchConfigTest, LoadsAllFields) {
    FetchConfig cfg;
    auto r = cfg.LoadString(R"({
        "url": "https://storage.example/b.tar.gz",
        "output_dir": "/srv/map",
        "worlds": ["world", "world_nether"],
        "download": { "mode": "parallel", "connections": 6 },
        "log_level": "debug"
    })");
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(cfg.url, "https://storage.example/b.tar.gz");
    EXPECT_EQ(cfg.output_dir, "/srv/map");
    EXPECT_EQ(cfg.worlds, (std::vector<std::string>{"world", "world_nether"}));
    EXPECT_EQ(cfg.mode, DownloadMode::Parallel);
    EXPECT_EQ(cfg.connections, 6);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
}

TEST(FetchConfigTest, AllFieldsAreOptional) {
    FetchConfig cfg;
    auto r = cfg.LoadString("{}");
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(cfg.url.empty());
    EXPECT_TRUE(cfg.worlds.empty());
    EXPECT_FALSE(cfg.mode.has_value());
    EXPECT_FALSE(cfg.connections.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(FetchConfigTest, RejectsBadValues) {
    struct Case {
        const char* json;
        const char* expect;
    };
    const Case cases[] = {
        {R"({"url": 5})", "'url' must be a string"},
        {R"({"worlds": []})", "non-empty array"},
        {R"({"worlds": ["world", ""]})", "non-empty strings"},
        {R"({"download": "fast"})", "'download' must be an object"},
        {R"({"download": {"mode": "turbo"}})", "unknown download mode 'turbo'"},
        {R"({"download": {"connections": 64}})", "between 0 and 32"},
        {R"({"download": {"connections": "4"}})", "must be an integer"},
        {R"({"log_level": "loud"})", "unknown log_level"},
        {R"([1, 2])", "root must be JSON object"},
        {R"({"url": )", "invalid JSON"},
    };

    for (const auto& c : cases) {
        FetchConfig cfg;
        auto r = cfg.LoadString(c.json);
        ASSERT_FALSE(r.is_ok()) << c.json;
        EXPECT_EQ(r.msg.rfind("config: ", 0), 0U) << r.msg;
        EXPECT_NE(r.msg.find(c.expect), std::string::npos) << r.msg;
    }
}

TEST(FetchConfigTest, LoadsFromFile) {
    testutil::TemporaryDirectory tmp;
    const auto path = tmp.Sub("worldfetch.json");
    {
        std::ofstream os(path);
        os << R"({"worlds": ["lobby"], "download": {"mode": "single"}})";
    }

    FetchConfig cfg;
    auto r = cfg.LoadFile(path.string());
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.worlds, std::vector<std::string>{"lobby"});
    EXPECT_EQ(cfg.mode, DownloadMode::Single);
}

TEST(FetchConfigTest, MissingFileFails) {
    FetchConfig cfg;
    auto r = cfg.LoadFile("/nonexistent/worldfetch.json");
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("cannot open"), std::string::npos) << r.msg;
}

TEST(FetchConfigTest, ReloadResetsPreviousValues) {
    FetchConfig cfg;
    ASSERT_TRUE(cfg.LoadString(R"({"url": "a", "download": {"connections": 3}})").is_ok());
    ASSERT_TRUE(cfg.LoadString(R"({"output_dir": "b"})").is_ok());
    EXPECT_TRUE(cfg.url.empty());
    EXPECT_FALSE(cfg.connections.has_value());
    EXPECT_EQ(cfg.output_dir, "b");
}

} // namespace
} // namespace worldfetch::config
