#pragma once

#include <string>
#include <vector>
#include <set>
#include <algorithm>

#include "config.h"
#include "log_utils.h"
#include "video_types.h"
#include "http_utils.h"
#include "regex_matcher.h"
#include "security_validator.h"
#include "extraction_chain.h"
#include "hls_playlist.h"
#include "result_cache.h"

using namespace std;

// Quality descending (unknown last); equal quality goes to the lower mirror
// index, then to sources without one, then discovery order. Duplicate URLs
// keep their best-ranked occurrence.
inline vector<VideoSource> rankSources(const vector<VideoSource>& sources) {
    vector<VideoSource> sorted(sources);
    stable_sort(sorted.begin(), sorted.end(), [](const VideoSource& a, const VideoSource& b) {
        int qa = qualityRank(a.qualityLabel());
        int qb = qualityRank(b.qualityLabel());
        if (qa != qb) return qa > qb;
        if (a.hasMirrorIndex() != b.hasMirrorIndex()) return a.hasMirrorIndex();
        if (a.hasMirrorIndex()) return a.mirrorIndex() < b.mirrorIndex();
        return false;
    });
    vector<VideoSource> unique;
    set<string> seen;
    for (const auto& s : sorted) {
        if (seen.insert(s.url()).second) unique.push_back(s);
    }
    return unique;
}

// Single entry point: page reference in, ranked validated sources out.
// Construct one per process and share it by reference.
class ResolutionEngine {
public:
    ResolutionEngine(const ResolverConfig& config, HttpFetcher& fetcher, CacheClock clock = CacheClock())
        : config_(config),
          validator_(config_.trustedDomains),
          matcher_(config_.matchInputCap),
          fetcher_(fetcher),
          chain_(config_, fetcher_, validator_, matcher_),
          hls_(config_, fetcher_, validator_, matcher_),
          cache_(validator_, config_.cacheMaxEntries, clock) {}

    ResolutionEngine(const ResolutionEngine&) = delete;
    ResolutionEngine& operator=(const ResolutionEngine&) = delete;

    ResolutionResult resolve(const ContentPageRef& ref) {
        UrlVerdict verdict = validator_.validate(ref.canonicalUrl);
        if (!verdict.accepted) {
            return ResolutionResult::securityRejected(verdict.reason + ": " + ref.canonicalUrl);
        }
        ResolutionResult result = cache_.getOrResolve(verdict.url,
            [this, &ref](const string& pageUrl) { return resolveUncached(pageUrl, ref); },
            config_.cacheTtl);
        logInfo("resolve", ref.canonicalUrl + " -> " + result.describe());
        return result;
    }

    // Warms the cache for a page the caller expects to play soon; the result is discarded.
    void prime(const ContentPageRef& ref) {
        ResolutionResult result = resolve(ref);
        if (!result.isSuccess()) {
            logDebug("prime", "Nothing cached for " + ref.canonicalUrl + " (" + result.describe() + ")");
        }
    }

    void invalidate(const string& pageUrl) { cache_.invalidate(pageUrl); }
    void clearCache() { cache_.clear(); }
    string cacheStats() const { return cache_.stats(); }

    const ResolverConfig& config() const { return config_; }
    const SecurityValidator& validator() const { return validator_; }

private:
    ResolutionResult resolveUncached(const string& pageUrl, const ContentPageRef& ref) {
        FetchResult page = fetcher_.fetch(pageUrl, config_.pageMaxBytes, config_.pageTimeout);
        if (!page.ok) {
            return ResolutionResult::networkError(page.error.empty() ? "page fetch failed: " + pageUrl : page.error);
        }

        ExtractionReport report = chain_.extract(page.body, pageUrl, ref);
        if (report.sources.empty()) {
            if (report.faulted) {
                logError("resolve", "Extraction faulted on " + pageUrl + ", page format may have changed");
                return ResolutionResult::parseError(report.faultMessage);
            }
            if (report.raceTimedOut) {
                return ResolutionResult::networkError("mirror race timed out for " + pageUrl);
            }
            return ResolutionResult::noSourcesFound("no playable source found on " + pageUrl);
        }
        return ResolutionResult::success(rankSources(hls_.expand(report.sources)));
    }

    ResolverConfig config_;
    SecurityValidator validator_;
    TimeoutSafeMatcher matcher_;
    HttpFetcher& fetcher_;
    ExtractionStrategyChain chain_;
    HlsVariantExpander hls_;
    ResultCache cache_;
};
