#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>

#include "config.h"
#include "extraction_chain.h"
#include "security_validator.h"
#include "regex_matcher.h"
#include "fake_fetcher.h"

using namespace std;

namespace {

const char* const PAGE = "https://site.example/movie/x";

ResolverConfig chainConfig() {
    ResolverConfig config;
    config.trustedDomains = { "site.example", "cdn.example", "player.example" };
    config.mirrorTimeout = chrono::milliseconds(2000);
    config.raceTimeout = chrono::milliseconds(3000);
    return config;
}

string mirrorUrl(int n) {
    return "https://site.example/wp-json/dooplayer/v2/12345/movie/" + to_string(n);
}

class ExtractionChainTest : public ::testing::Test {
protected:
    ExtractionChainTest()
        : config_(chainConfig()),
          validator_(config_.trustedDomains),
          chain_(config_, fetcher_, validator_, matcher_) {}

    ExtractionReport extract(const string& html, const string& internalId = string()) {
        ref_.canonicalUrl = PAGE;
        ref_.internalId = internalId;
        return chain_.extract(html, PAGE, ref_);
    }

    ResolverConfig config_;
    FakeFetcher fetcher_;
    SecurityValidator validator_;
    TimeoutSafeMatcher matcher_;
    ExtractionStrategyChain chain_;
    ContentPageRef ref_;
};

// Returns a fixed candidate list and counts how often it ran.
class ScriptedStrategy : public ExtractionStrategy {
public:
    ScriptedStrategy(const string& name, const vector<string>& urls, int* calls)
        : name_(name), urls_(urls), calls_(calls) {}
    string name() const override { return name_; }
    StrategyResult extract(const ExtractionContext&) override {
        ++*calls_;
        StrategyResult result;
        for (const auto& u : urls_) {
            CandidateSource c;
            c.url = u;
            c.strategy = name_;
            result.candidates.push_back(c);
        }
        return result;
    }
private:
    string name_;
    vector<string> urls_;
    int* calls_;
};

class ThrowingStrategy : public ExtractionStrategy {
public:
    string name() const override { return "Throwing"; }
    StrategyResult extract(const ExtractionContext&) override {
        throw ExtractionError("unexpected markup");
    }
};

} // namespace

TEST_F(ExtractionChainTest, StrategyOrder)
{
    vector<string> names = chain_.strategyNames();
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "StructuredTag");
    EXPECT_EQ(names[1], "NumberedMirrorApi");
    EXPECT_EQ(names[2], "EmbeddedScriptRegex");
    EXPECT_EQ(names[3], "IframeDelegation");
}

// An explicit <source> ends the chain before any mirror request
TEST_F(ExtractionChainTest, StructuredTagShortCircuitsMirrorApi)
{
    ExtractionReport report = extract(
        "<body><video><source src=\"https://cdn.example/a.mp4\" label=\"720p\"></video>"
        "<input type=\"hidden\" name=\"id\" value=\"12345\"></body>", "12345");
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.strategyName, "StructuredTag");
    EXPECT_EQ(report.sources[0].url(), "https://cdn.example/a.mp4");
    EXPECT_EQ(report.sources[0].qualityLabel(), "720p");
    EXPECT_EQ(fetcher_.totalFetches(), 0);
}

TEST_F(ExtractionChainTest, RelativeTagUrlsResolveAgainstPage)
{
    ExtractionReport report = extract("<body><video src=\"/media/a.720.mp4\"></video></body>");
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.sources[0].url(), "https://site.example/media/a.720.mp4");
    EXPECT_EQ(report.sources[0].qualityLabel(), "720p");
}

TEST_F(ExtractionChainTest, MirrorApiUsesDiscoveredId)
{
    fetcher_.respond(mirrorUrl(2), "{\"quality\":\"1080p\",\"url\":\"https://cdn.example/12345.mp4\"}", chrono::milliseconds(10));
    ExtractionReport report = extract("<body><input type=\"hidden\" name=\"id\" value=\"12345\"></body>");
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.strategyName, "NumberedMirrorApi");
    EXPECT_EQ(report.sources[0].mirrorIndex(), 2);
    EXPECT_EQ(report.sources[0].qualityLabel(), "1080p");
    EXPECT_EQ(fetcher_.fetchCount(mirrorUrl(1)), 1);
    EXPECT_EQ(fetcher_.fetchCount(mirrorUrl(5)), 1);
}

TEST_F(ExtractionChainTest, IdDiscoveryCanBeDisabled)
{
    config_.discoverInternalId = false;
    ExtractionReport report = extract("<body><input type=\"hidden\" name=\"id\" value=\"12345\"></body>");
    EXPECT_TRUE(report.sources.empty());
    EXPECT_EQ(fetcher_.totalFetches(), 0);
    EXPECT_FALSE(report.faulted);
}

TEST_F(ExtractionChainTest, EmbeddedScriptPlayerConfig)
{
    ExtractionReport report = extract(
        "<body><script>player.setup({file:\"https:\\/\\/cdn.example\\/s.mp4\",label:\"480p\"});</script></body>");
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.strategyName, "EmbeddedScriptRegex");
    EXPECT_EQ(report.sources[0].url(), "https://cdn.example/s.mp4");
    EXPECT_EQ(report.sources[0].qualityLabel(), "480p");
}

// Subtitle tracks and posters share the file:/label: shape but are not streams
TEST_F(ExtractionChainTest, ScriptFilesWithoutMediaExtensionAreIgnored)
{
    ExtractionReport report = extract(
        "<body><script>jwplayer('p').setup({"
        "image: 'https://cdn.example/poster.jpg',"
        "tracks:[{file: \"https://cdn.example/subs/en.vtt\", label: \"English\", kind: \"captions\"}],"
        "playlist:[{file: 'https://cdn.example/thumb.jpg', label: 'Poster'}]"
        "});</script></body>");
    EXPECT_TRUE(report.sources.empty());
    EXPECT_FALSE(report.faulted);

    report = extract(
        "<body><script>jwplayer('p').setup({"
        "tracks:[{file: \"https://cdn.example/subs/en.vtt\", label: \"English\"}],"
        "sources:[{file: \"https://cdn.example/v.mp4\", label: \"720p\"}]"
        "});</script></body>");
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.sources[0].url(), "https://cdn.example/v.mp4");
    EXPECT_EQ(report.sources[0].qualityLabel(), "720p");
}

// Untrusted tag URLs do not stop the chain
TEST_F(ExtractionChainTest, UntrustedTagFallsThroughToScripts)
{
    ExtractionReport report = extract(
        "<body><source src=\"https://evil.example/a.mp4\">"
        "<script>var src = 'https://cdn.example/b.m3u8';</script></body>");
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.strategyName, "EmbeddedScriptRegex");
    EXPECT_EQ(report.sources[0].url(), "https://cdn.example/b.m3u8");
}

TEST_F(ExtractionChainTest, IframeTargetIsFetchedAndScanned)
{
    fetcher_.respond("https://player.example/embed/9", "<body><video src=\"/v/i.mp4\"></video></body>");
    ExtractionReport report = extract("<body><iframe src=\"https://player.example/embed/9\"></iframe></body>");
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.strategyName, "IframeDelegation");
    EXPECT_EQ(report.sources[0].url(), "https://player.example/v/i.mp4");
    EXPECT_EQ(fetcher_.fetchCount("https://player.example/embed/9"), 1);
}

TEST_F(ExtractionChainTest, IframeSourceParameterNeedsNoFetch)
{
    ExtractionReport report = extract(
        "<body><iframe src=\"https://player.example/e.php?source=https%3A%2F%2Fcdn.example%2Fd.m3u8\"></iframe></body>");
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.sources[0].url(), "https://cdn.example/d.m3u8");
    EXPECT_EQ(fetcher_.totalFetches(), 0);
}

TEST_F(ExtractionChainTest, UntrustedIframeIsNeverFetched)
{
    ExtractionReport report = extract("<body><iframe src=\"https://evil.example/embed/1\"></iframe></body>");
    EXPECT_TRUE(report.sources.empty());
    EXPECT_EQ(fetcher_.totalFetches(), 0);
}

// Nested iframes are not followed past depth 1
TEST_F(ExtractionChainTest, IframeDepthIsCapped)
{
    fetcher_.respond("https://player.example/outer", "<body><iframe src=\"https://player.example/inner\"></iframe></body>");
    fetcher_.respond("https://player.example/inner", "<body><video src=\"https://cdn.example/deep.mp4\"></video></body>");
    ExtractionReport report = extract("<body><iframe src=\"https://player.example/outer\"></iframe></body>");
    EXPECT_TRUE(report.sources.empty());
    EXPECT_EQ(fetcher_.fetchCount("https://player.example/inner"), 0);
}

TEST_F(ExtractionChainTest, NothingFoundIsNotAFault)
{
    ExtractionReport report = extract("<body><p>Coming soon</p></body>");
    EXPECT_TRUE(report.sources.empty());
    EXPECT_FALSE(report.faulted);
    EXPECT_FALSE(report.raceTimedOut);
}

TEST(ExtractionChainOrderTest, StopsAtFirstStrategyWithTrustedCandidates)
{
    SecurityValidator validator({ "cdn.example" });
    int untrustedCalls = 0, trustedCalls = 0, laterCalls = 0;
    vector<unique_ptr<ExtractionStrategy>> strategies;
    strategies.push_back(unique_ptr<ExtractionStrategy>(new ScriptedStrategy("Untrusted", { "https://evil.example/a.mp4" }, &untrustedCalls)));
    strategies.push_back(unique_ptr<ExtractionStrategy>(new ScriptedStrategy("Trusted", { "https://cdn.example/b.mp4" }, &trustedCalls)));
    strategies.push_back(unique_ptr<ExtractionStrategy>(new ScriptedStrategy("Later", { "https://cdn.example/c.mp4" }, &laterCalls)));
    ExtractionStrategyChain chain(validator, std::move(strategies));

    ContentPageRef ref;
    ref.canonicalUrl = "https://cdn.example/page";
    ExtractionReport report = chain.extract("<p></p>", ref.canonicalUrl, ref);
    EXPECT_EQ(report.strategyName, "Trusted");
    EXPECT_EQ(untrustedCalls, 1);
    EXPECT_EQ(trustedCalls, 1);
    EXPECT_EQ(laterCalls, 0);
}

TEST(ExtractionChainOrderTest, FaultingStrategyIsSkipped)
{
    SecurityValidator validator({ "cdn.example" });
    int calls = 0;
    vector<unique_ptr<ExtractionStrategy>> strategies;
    strategies.push_back(unique_ptr<ExtractionStrategy>(new ThrowingStrategy()));
    strategies.push_back(unique_ptr<ExtractionStrategy>(new ScriptedStrategy("Fallback", { "/b.mp4" }, &calls)));
    ExtractionStrategyChain chain(validator, std::move(strategies));

    ContentPageRef ref;
    ref.canonicalUrl = "https://cdn.example/page";
    ExtractionReport report = chain.extract("<p></p>", ref.canonicalUrl, ref);
    ASSERT_EQ(report.sources.size(), 1u);
    EXPECT_EQ(report.sources[0].url(), "https://cdn.example/b.mp4");
    EXPECT_EQ(report.strategyName, "Fallback");
    EXPECT_EQ(calls, 1);
}

TEST(ExtractionChainOrderTest, FaultWithoutSuccessIsReported)
{
    SecurityValidator validator({ "cdn.example" });
    vector<unique_ptr<ExtractionStrategy>> strategies;
    strategies.push_back(unique_ptr<ExtractionStrategy>(new ThrowingStrategy()));
    ExtractionStrategyChain chain(validator, std::move(strategies));

    ContentPageRef ref;
    ref.canonicalUrl = "https://cdn.example/page";
    ExtractionReport report = chain.extract("<p></p>", ref.canonicalUrl, ref);
    EXPECT_TRUE(report.sources.empty());
    EXPECT_TRUE(report.faulted);
    EXPECT_NE(report.faultMessage.find("unexpected markup"), string::npos);
}
