#pragma once

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "config.h"
#include "log_utils.h"
#include "string_utils.h"
#include "url_utils.h"
#include "video_types.h"
#include "http_utils.h"
#include "html_parser.h"
#include "regex_matcher.h"
#include "mirror_api.h"
#include "mirror_race.h"
#include "security_validator.h"

using namespace std;
using json = nlohmann::json;

// What a strategy sees: the page it is scanning (the top-level page, or an
// iframe target at depth 1) and the caller's reference.
struct ExtractionContext {
    string pageUrl;
    const ContentPageRef* ref;
    const PageScan* scan;
    int depth;
};

struct StrategyResult {
    vector<CandidateSource> candidates;
    bool raceTimedOut = false;
};

class ExtractionStrategy {
public:
    virtual ~ExtractionStrategy() {}
    virtual string name() const = 0;
    virtual StrategyResult extract(const ExtractionContext& ctx) = 0;
};

struct ExtractionReport {
    vector<VideoSource> sources;   // validated, discovery order
    string strategyName;           // strategy that produced 'sources'
    bool raceTimedOut = false;
    bool faulted = false;
    string faultMessage;
};

// Resolves relative candidate URLs against the page they were found on.
inline void absolutizeCandidates(vector<CandidateSource>& candidates, const string& baseUrl) {
    for (auto& c : candidates) {
        string absolute = resolveUrl(baseUrl, c.url);
        if (!absolute.empty()) c.url = absolute;
    }
}

// --- 1. Explicit media elements ---

class StructuredTagStrategy : public ExtractionStrategy {
public:
    string name() const override { return "StructuredTag"; }

    StrategyResult extract(const ExtractionContext& ctx) override {
        StrategyResult result;
        set<string> seen;
        for (const auto& tag : ctx.scan->mediaTags) {
            CandidateSource c;
            c.url = resolveUrl(ctx.pageUrl, tag.url);
            if (c.url.empty()) c.url = tag.url;
            if (!seen.insert(c.url).second) continue;
            if (!tag.label.empty()) c.qualityLabel = tag.label;
            c.strategy = name();
            result.candidates.push_back(c);
        }
        return result;
    }
};

// --- 2. Numbered mirror API, raced ---

class NumberedMirrorApiStrategy : public ExtractionStrategy {
public:
    NumberedMirrorApiStrategy(const ResolverConfig& config, HttpFetcher& fetcher,
        const SecurityValidator& validator, const TimeoutSafeMatcher& matcher)
        : config_(config), fetcher_(fetcher), validator_(validator), matcher_(matcher) {}

    string name() const override { return "NumberedMirrorApi"; }

    StrategyResult extract(const ExtractionContext& ctx) override {
        StrategyResult result;
        string id = ctx.ref->internalId;
        if (id.empty() && config_.discoverInternalId) {
            for (const auto& hint : ctx.scan->idHints) {
                if (isNumericId(hint)) {
                    id = hint;
                    logDebug("NumberedMirrorApi", "Discovered internal id " + id + " on " + ctx.pageUrl);
                    break;
                }
            }
        }
        if (id.empty() || config_.maxMirrors <= 0) return result;

        vector<MirrorProbe> probes;
        for (const auto& probe : buildMirrorEndpoints(config_.mirrorEndpointTemplate, ctx.pageUrl, id,
                 ctx.ref->contentType, config_.maxMirrors)) {
            UrlVerdict verdict = validator_.validate(probe.derivedUrl);
            if (verdict.accepted) probes.push_back({ probe.serverIndex, verdict.url });
        }
        if (probes.empty()) {
            logWarn("NumberedMirrorApi", "No usable mirror endpoints for id " + id);
            return result;
        }

        const TimeoutSafeMatcher& matcher = matcher_;
        chrono::milliseconds matchTimeout = config_.matchTimeout;
        MirrorRaceCoordinator race(fetcher_, validator_, config_.mirrorMaxBytes);
        RaceOutcome outcome = race.race(probes,
            [&matcher, matchTimeout](const string& body, const MirrorProbe& probe) {
                return parseMirrorResponse(body, probe.serverIndex, matcher, matchTimeout);
            },
            config_.mirrorTimeout, config_.raceTimeout);

        result.raceTimedOut = outcome.status == RaceStatus::TimedOut;
        for (const auto& source : outcome.sources) {
            CandidateSource c;
            c.url = source.url();
            c.qualityLabel = source.qualityLabel();
            c.mirrorIndex = source.mirrorIndex();
            c.approxSizeBytes = source.approxSizeBytes();
            c.strategy = name();
            result.candidates.push_back(c);
        }
        return result;
    }

private:
    const ResolverConfig& config_;
    HttpFetcher& fetcher_;
    const SecurityValidator& validator_;
    const TimeoutSafeMatcher& matcher_;
};

// --- 3. Inline scripts ---

class EmbeddedScriptRegexStrategy : public ExtractionStrategy {
public:
    EmbeddedScriptRegexStrategy(const TimeoutSafeMatcher& matcher, chrono::milliseconds matchTimeout, size_t scriptSizeLimit)
        : matcher_(matcher), matchTimeout_(matchTimeout), scriptSizeLimit_(scriptSizeLimit) {}

    string name() const override { return "EmbeddedScriptRegex"; }

    StrategyResult extract(const ExtractionContext& ctx) override {
        StrategyResult result;
        for (size_t size : ctx.scan->skippedScriptSizes) {
            logWarn("EmbeddedScriptRegex", "Skipped script of " + to_string(size) + " bytes (limit " + to_string(scriptSizeLimit_) + ") on " + ctx.pageUrl);
        }

        set<string> seen;
        for (const auto& script : ctx.scan->scripts) {
            MatchOutcome players = matcher_.match(playerConfigPattern(), script, matchTimeout_);
            for (const auto& m : players.matches) {
                addCandidate(result, seen, ctx.pageUrl, m.groups[1], m.groups[2]);
            }
            MatchOutcome literals = matcher_.match(literalMediaUrlPattern(), script, matchTimeout_);
            for (const auto& m : literals.matches) {
                addCandidate(result, seen, ctx.pageUrl, m.groups[1], string());
            }
        }
        return result;
    }

private:
    void addCandidate(StrategyResult& result, set<string>& seen, const string& pageUrl,
        const string& rawUrl, const string& label) const {
        string url = unescapeJsSlashes(trimWhitespace(rawUrl));
        if (url.empty()) return;
        string absolute = resolveUrl(pageUrl, url);
        if (!absolute.empty()) url = absolute;
        // file: also names subtitle tracks and posters
        if (!hasMediaExtension(url)) {
            logDebug("EmbeddedScriptRegex", "Ignoring non-media file " + url);
            return;
        }
        if (!seen.insert(url).second) return;
        CandidateSource c;
        c.url = url;
        if (!label.empty()) c.qualityLabel = label;
        c.strategy = name();
        result.candidates.push_back(c);
    }

    const TimeoutSafeMatcher& matcher_;
    chrono::milliseconds matchTimeout_;
    size_t scriptSizeLimit_;
};

// --- 4. Nested player iframes ---

class IframeDelegationStrategy : public ExtractionStrategy {
public:
    IframeDelegationStrategy(const ResolverConfig& config, HttpFetcher& fetcher, const SecurityValidator& validator,
        ExtractionStrategy& tags, ExtractionStrategy& scripts)
        : config_(config), fetcher_(fetcher), validator_(validator), tags_(tags), scripts_(scripts) {}

    string name() const override { return "IframeDelegation"; }

    StrategyResult extract(const ExtractionContext& ctx) override {
        StrategyResult result;
        if (ctx.depth >= 1) return result;

        int visited = 0;
        for (const auto& src : ctx.scan->iframes) {
            if (visited >= config_.maxIframes) break;
            ++visited;
            string target = resolveUrl(ctx.pageUrl, src);
            if (target.empty()) continue;

            string direct = getQueryParam(target, "source");
            if (!direct.empty()) {
                string absolute = resolveUrl(target, direct);
                addDirect(result, absolute.empty() ? direct : absolute);
            }
            if (hasMediaExtension(target)) addDirect(result, target);
            if (hasAllowed(result.candidates)) return result;
            result.candidates.clear();

            UrlVerdict verdict = validator_.validate(target);
            if (!verdict.accepted) continue;

            FetchResult fetched = fetcher_.fetch(verdict.url, config_.pageMaxBytes, config_.pageTimeout);
            if (!fetched.ok) {
                logWarn("IframeDelegation", "Could not fetch iframe " + verdict.url + ": " + fetched.error);
                continue;
            }
            PageScan nested = scanHtmlDocument(fetched.body, config_.scriptSizeLimit);
            ExtractionContext child{ verdict.url, ctx.ref, &nested, ctx.depth + 1 };

            StrategyResult found = tags_.extract(child);
            if (!hasAllowed(found.candidates)) found = scripts_.extract(child);
            if (hasAllowed(found.candidates)) {
                for (auto& c : found.candidates) c.strategy = name();
                result.candidates = found.candidates;
                return result;
            }
        }
        return result;
    }

private:
    void addDirect(StrategyResult& result, const string& url) const {
        CandidateSource c;
        c.url = url;
        c.strategy = name();
        result.candidates.push_back(c);
    }

    bool hasAllowed(const vector<CandidateSource>& candidates) const {
        for (const auto& c : candidates) {
            if (validator_.isAllowed(c.url)) return true;
        }
        return false;
    }

    const ResolverConfig& config_;
    HttpFetcher& fetcher_;
    const SecurityValidator& validator_;
    ExtractionStrategy& tags_;
    ExtractionStrategy& scripts_;
};

// Runs the strategies in priority order and stops at the first one whose
// candidates survive the SecurityValidator.
class ExtractionStrategyChain {
public:
    ExtractionStrategyChain(const ResolverConfig& config, HttpFetcher& fetcher,
        const SecurityValidator& validator, const TimeoutSafeMatcher& matcher)
        : validator_(validator), scriptSizeLimit_(config.scriptSizeLimit) {
        unique_ptr<ExtractionStrategy> tags = make_unique<StructuredTagStrategy>();
        unique_ptr<ExtractionStrategy> scripts = make_unique<EmbeddedScriptRegexStrategy>(matcher, config.matchTimeout, config.scriptSizeLimit);
        unique_ptr<ExtractionStrategy> iframes = make_unique<IframeDelegationStrategy>(config, fetcher, validator, *tags, *scripts);
        strategies_.push_back(std::move(tags));
        strategies_.push_back(make_unique<NumberedMirrorApiStrategy>(config, fetcher, validator, matcher));
        strategies_.push_back(std::move(scripts));
        strategies_.push_back(std::move(iframes));
    }

    ExtractionStrategyChain(const SecurityValidator& validator, vector<unique_ptr<ExtractionStrategy>> strategies,
        size_t scriptSizeLimit = SCRIPT_SIZE_LIMIT)
        : validator_(validator), scriptSizeLimit_(scriptSizeLimit), strategies_(std::move(strategies)) {}

    vector<string> strategyNames() const {
        vector<string> names;
        for (const auto& s : strategies_) names.push_back(s->name());
        return names;
    }

    ExtractionReport extract(const string& pageBody, const string& pageUrl, const ContentPageRef& ref) {
        ExtractionReport report;
        PageScan scan;
        try {
            scan = scanHtmlDocument(pageBody, scriptSizeLimit_);
        }
        catch (const ExtractionError& e) {
            report.faulted = true;
            report.faultMessage = e.what();
            logError("ExtractionChain", string("HTML scan failed for ") + pageUrl + ": " + e.what());
            return report;
        }

        ExtractionContext ctx{ pageUrl, &ref, &scan, 0 };
        for (auto& strategy : strategies_) {
            StrategyResult result;
            try {
                result = strategy->extract(ctx);
            }
            catch (const runtime_error& e) {
                recordFault(report, strategy->name(), e.what());
                continue;
            }
            catch (const json::exception& e) {
                recordFault(report, strategy->name(), e.what());
                continue;
            }
            if (result.raceTimedOut) report.raceTimedOut = true;

            absolutizeCandidates(result.candidates, pageUrl);
            vector<VideoSource> accepted = validator_.admitAll(result.candidates, strategy->name());
            if (!accepted.empty()) {
                logInfo("ExtractionChain", strategy->name() + " found " + to_string(accepted.size()) + " source(s) on " + pageUrl);
                report.sources = accepted;
                report.strategyName = strategy->name();
                return report;
            }
            logDebug("ExtractionChain", strategy->name() + " found nothing on " + pageUrl);
        }
        return report;
    }

private:
    void recordFault(ExtractionReport& report, const string& strategy, const string& what) {
        if (!report.faulted) {
            report.faulted = true;
            report.faultMessage = strategy + ": " + what;
        }
        logError("ExtractionChain", strategy + " faulted, possible upstream format change: " + what);
    }

    const SecurityValidator& validator_;
    size_t scriptSizeLimit_;
    vector<unique_ptr<ExtractionStrategy>> strategies_;
};
