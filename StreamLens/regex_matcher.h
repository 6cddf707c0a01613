#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <future>
#include <atomic>
#include <cstddef>
#include <re2/re2.h>

#include "config.h"
#include "log_utils.h"

using namespace std;

// One match: groups[0] is the whole match, groups[i] the i-th capture
// (empty if that group did not participate).
struct RegexMatch {
    vector<string> groups;
};

struct MatchOutcome {
    vector<RegexMatch> matches;
    bool timedOut = false;
    bool inputTruncated = false;

    bool found() const { return !matches.empty(); }
};

// Runs RE2 scans over attacker-influenced HTML/JS. The input is cut to
// 'inputCap' before matching; the scan then runs on a worker under a wall-clock
// deadline. A scan that misses the deadline is reported as no-match and the
// worker is stopped and joined before match() returns.
class TimeoutSafeMatcher {
public:
    explicit TimeoutSafeMatcher(size_t inputCap = MATCH_INPUT_CAP, size_t maxMatches = MAX_MATCHES_PER_SCAN)
        : inputCap_(inputCap), maxMatches_(maxMatches) {}

    size_t inputCap() const { return inputCap_; }

    MatchOutcome match(const RE2& pattern, const string& input, chrono::milliseconds timeout) const {
        MatchOutcome outcome;
        if (!pattern.ok()) {
            logError("TimeoutSafeMatcher", "Invalid pattern: " + pattern.pattern() + " (" + pattern.error() + ")");
            return outcome;
        }
        re2::StringPiece text(input.data(), input.size());
        if (input.size() > inputCap_) {
            text = re2::StringPiece(input.data(), inputCap_);
            outcome.inputTruncated = true;
            logDebug("TimeoutSafeMatcher", "Input truncated from " + to_string(input.size()) + " to " + to_string(inputCap_) + " bytes");
        }

        const auto deadline = chrono::steady_clock::now() + timeout;
        atomic<bool> stop(false);
        size_t maxMatches = maxMatches_;
        auto fut = async(launch::async, [&pattern, text, deadline, maxMatches, &stop]() -> MatchOutcome {
            return scan(pattern, text, deadline, maxMatches, stop);
        });

        if (fut.wait_until(deadline) != future_status::ready) {
            stop.store(true);
            fut.wait();
            logWarn("TimeoutSafeMatcher", "Match exceeded " + to_string(timeout.count()) + "ms, treated as no-match: " + pattern.pattern());
            outcome.timedOut = true;
            return outcome;
        }
        MatchOutcome scanned = fut.get();
        if (scanned.timedOut) {
            logWarn("TimeoutSafeMatcher", "Match exceeded " + to_string(timeout.count()) + "ms, treated as no-match: " + pattern.pattern());
            outcome.timedOut = true;
            return outcome;
        }
        outcome.matches = std::move(scanned.matches);
        return outcome;
    }

private:
    static MatchOutcome scan(const RE2& pattern, re2::StringPiece text, chrono::steady_clock::time_point deadline,
        size_t maxMatches, const atomic<bool>& stop) {
        MatchOutcome outcome;
        const int ngroups = pattern.NumberOfCapturingGroups() + 1;
        vector<re2::StringPiece> groups(ngroups);
        size_t pos = 0;
        while (pos <= text.size() && outcome.matches.size() < maxMatches) {
            if (stop.load() || chrono::steady_clock::now() >= deadline) {
                outcome.timedOut = true;
                return outcome;
            }
            if (!pattern.Match(text, pos, text.size(), RE2::UNANCHORED, groups.data(), ngroups)) break;
            RegexMatch m;
            for (const auto& g : groups) {
                m.groups.push_back(g.data() ? string(g.data(), g.size()) : string());
            }
            outcome.matches.push_back(m);
            size_t end = (size_t)(groups[0].data() - text.data()) + groups[0].size();
            pos = groups[0].size() == 0 ? end + 1 : end;
        }
        return outcome;
    }

    size_t inputCap_;
    size_t maxMatches_;
};

// Pattern options shared by the extraction patterns: case-insensitive,
// bounded DFA memory, no logging from RE2 itself.
inline RE2::Options extractionPatternOptions() {
    RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);
    options.set_max_mem(8 << 20);
    return options;
}

// Absolute media URLs, with or without JSON-escaped slashes ("https:\/\/...").
inline const RE2& literalMediaUrlPattern() {
    static const RE2 pattern(R"re((https?:(?:\\?/){2}[^\s"'<>]+?\.(?:mp4|m3u8|webm|mkv)(?:\?[^\s"'<>]*)?))re", extractionPatternOptions());
    return pattern;
}

// Player configs: file: "...", label: "..." (also the JSON-quoted form).
inline const RE2& playerConfigPattern() {
    static const RE2 pattern(R"re(["']?file["']?\s*:\s*["']([^"']+)["'][^{}]{0,200}?["']?label["']?\s*:\s*["']([^"']*)["'])re", extractionPatternOptions());
    return pattern;
}
