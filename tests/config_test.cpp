#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <fstream>
#include <cstdio>
#include <nlohmann/json.hpp>

#include "config.h"
#include "log_utils.h"

using namespace std;
using json = nlohmann::json;

TEST(ResolverConfigTest, DefaultsMatchConstants)
{
    ResolverConfig config;
    EXPECT_TRUE(config.trustedDomains.empty());
    EXPECT_EQ(config.cacheTtl.count(), CACHE_TTL_MS);
    EXPECT_EQ(config.cacheMaxEntries, CACHE_MAX_ENTRIES);
    EXPECT_EQ(config.maxMirrors, 5);
    EXPECT_EQ(config.maxIframes, 3);
    EXPECT_EQ(config.matchInputCap, 1024u * 1024u);
    EXPECT_TRUE(config.discoverInternalId);
    EXPECT_EQ(config.mirrorEndpointTemplate, DEFAULT_MIRROR_ENDPOINT_TEMPLATE);
    EXPECT_TRUE(config.expandHlsVariants);
    EXPECT_EQ(config.maxHlsPlaylists, 3);
    EXPECT_EQ(config.playlistMaxBytes, HLS_PLAYLIST_MAX_BYTES);
}

TEST(ResolverConfigTest, OverlaysKnownKeysAndIgnoresUnknown)
{
    json j = json::parse(R"({
        "trusted_domains": ["site.example", "cdn.example"],
        "race_timeout_ms": 2500,
        "max_mirrors": 3,
        "page_max_bytes": 4096,
        "discover_internal_id": false,
        "expand_hls_variants": false,
        "max_hls_playlists": 1,
        "user_agent": "test-agent",
        "something_else": [1, 2, 3]
    })");
    ResolverConfig config;
    string error;
    ASSERT_TRUE(applyResolverConfig(j, config, error)) << error;
    ASSERT_EQ(config.trustedDomains.size(), 2u);
    EXPECT_EQ(config.trustedDomains[1], "cdn.example");
    EXPECT_EQ(config.raceTimeout.count(), 2500);
    EXPECT_EQ(config.maxMirrors, 3);
    EXPECT_EQ(config.pageMaxBytes, 4096u);
    EXPECT_FALSE(config.discoverInternalId);
    EXPECT_FALSE(config.expandHlsVariants);
    EXPECT_EQ(config.maxHlsPlaylists, 1);
    EXPECT_EQ(config.userAgent, "test-agent");
    EXPECT_EQ(config.mirrorTimeout.count(), MIRROR_PROBE_TIMEOUT_MS);
}

TEST(ResolverConfigTest, RejectsWrongTypes)
{
    ResolverConfig config;
    string error;
    EXPECT_FALSE(applyResolverConfig(json::parse(R"({"trusted_domains": "site.example"})"), config, error));
    EXPECT_NE(error.find("trusted_domains"), string::npos);
    EXPECT_FALSE(applyResolverConfig(json::parse(R"({"page_timeout_ms": -1})"), config, error));
    EXPECT_FALSE(applyResolverConfig(json::parse(R"({"max_mirrors": 1000})"), config, error));
    EXPECT_FALSE(applyResolverConfig(json::parse(R"({"cache_max_entries": "many"})"), config, error));
    EXPECT_FALSE(applyResolverConfig(json::parse(R"({"discover_internal_id": 1})"), config, error));
    EXPECT_FALSE(applyResolverConfig(json::parse(R"({"expand_hls_variants": "yes"})"), config, error));
    EXPECT_NE(error.find("expand_hls_variants"), string::npos);
    EXPECT_FALSE(applyResolverConfig(json::parse("[1, 2]"), config, error));
}

TEST(ResolverConfigTest, LoadsFromFile)
{
    string path = ::testing::TempDir() + "streamlens_config_test.json";
    {
        ofstream out(path);
        out << R"({"trusted_domains": ["site.example"], "cache_ttl_ms": 1000})";
    }
    ResolverConfig config;
    string error;
    ASSERT_TRUE(loadResolverConfig(path, config, error)) << error;
    EXPECT_EQ(config.trustedDomains[0], "site.example");
    EXPECT_EQ(config.cacheTtl.count(), 1000);
    remove(path.c_str());
}

TEST(ResolverConfigTest, ReportsMissingAndMalformedFiles)
{
    ResolverConfig config;
    string error;
    EXPECT_FALSE(loadResolverConfig(::testing::TempDir() + "does_not_exist.json", config, error));
    EXPECT_NE(error.find("cannot open"), string::npos);

    string path = ::testing::TempDir() + "streamlens_bad_config.json";
    {
        ofstream out(path);
        out << "{ not json";
    }
    EXPECT_FALSE(loadResolverConfig(path, config, error));
    EXPECT_NE(error.find("invalid JSON"), string::npos);
    remove(path.c_str());
}

TEST(LogUtilsTest, SinkReceivesTaggedLines)
{
    vector<pair<LogLevel, string>> lines;
    setLogSink([&lines](LogLevel level, const string& line) { lines.push_back({ level, line }); });
    logInfo("resolve", "hello");
    logWarn("SecurityValidator", "Rejected x");
    setLogSink(nullptr);
    logInfo("resolve", "not captured");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].first, LogLevel::Info);
    EXPECT_EQ(lines[0].second, "[resolve] hello");
    EXPECT_EQ(lines[1].first, LogLevel::Warn);
    EXPECT_EQ(lines[1].second, "[SecurityValidator] Rejected x");
}
