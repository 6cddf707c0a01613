#pragma once

#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <re2/re2.h>

#include "config.h"
#include "log_utils.h"
#include "string_utils.h"
#include "url_utils.h"
#include "video_types.h"
#include "http_utils.h"
#include "regex_matcher.h"
#include "security_validator.h"

using namespace std;

// #EXT-X-STREAM-INF:<attributes> followed by the variant URI on the next
// non-blank line.
inline const RE2& hlsStreamInfPattern() {
    static const RE2 pattern(R"re(#EXT-X-STREAM-INF:([^\r\n]*)\r?\n(?:[ \t]*\r?\n)*[ \t]*([^#\s][^\r\n]*))re", extractionPatternOptions());
    return pattern;
}

inline const RE2& hlsResolutionAttribute() {
    static const RE2 pattern(R"re((?:^|,)\s*RESOLUTION=(\d{1,5})x(\d{1,5}))re", extractionPatternOptions());
    return pattern;
}

inline const RE2& hlsBandwidthAttribute() {
    static const RE2 pattern(R"re((?:^|,)\s*BANDWIDTH=(\d{1,12}))re", extractionPatternOptions());
    return pattern;
}

inline bool isHlsPlaylistUrl(const string& url) {
    string low = toLowerStr(url);
    size_t cut = low.find_first_of("?#");
    if (cut != string::npos) low = low.substr(0, cut);
    return endsWithStr(low, ".m3u8");
}

inline string hlsQualityFromHeight(int height) {
    if (height >= 2160) return "2160p";
    if (height >= 1440) return "1440p";
    if (height >= 1080) return "1080p";
    if (height >= 720) return "720p";
    if (height >= 480) return "480p";
    return "360p";
}

// Used only when a variant carries no RESOLUTION attribute.
inline string hlsQualityFromBandwidth(long long bitsPerSecond) {
    if (bitsPerSecond >= 2000000) return "1080p";
    if (bitsPerSecond >= 1000000) return "720p";
    if (bitsPerSecond >= 500000) return "480p";
    return "360p";
}

// Variant streams of an HLS master playlist, URIs resolved against the
// playlist URL. A media playlist (segments only) or a non-playlist body yields
// nothing.
inline vector<CandidateSource> parseHlsMasterPlaylist(const string& body, const string& playlistUrl,
    const TimeoutSafeMatcher& matcher, chrono::milliseconds timeout) {
    vector<CandidateSource> variants;
    if (body.find("#EXTM3U") == string::npos) return variants;

    MatchOutcome outcome = matcher.match(hlsStreamInfPattern(), body, timeout);
    set<string> seen;
    for (const auto& m : outcome.matches) {
        const string& attributes = m.groups[1];
        string uri = trimWhitespace(m.groups[2]);
        string url = resolveUrl(playlistUrl, uri);
        if (url.empty() || !seen.insert(url).second) continue;

        CandidateSource c;
        c.url = url;
        int width = 0;
        int height = 0;
        long long bandwidth = 0;
        if (RE2::PartialMatch(attributes, hlsResolutionAttribute(), &width, &height) && height > 0) {
            c.qualityLabel = hlsQualityFromHeight(height);
        }
        else if (RE2::PartialMatch(attributes, hlsBandwidthAttribute(), &bandwidth) && bandwidth > 0) {
            c.qualityLabel = hlsQualityFromBandwidth(bandwidth);
        }
        c.strategy = "HlsMasterPlaylist";
        variants.push_back(c);
    }
    return variants;
}

// Replaces HLS master playlists among resolved sources with their variant
// streams, each admitted through the SecurityValidator. When the playlist
// cannot be fetched or lists no admissible variant the master URL is kept.
class HlsVariantExpander {
public:
    HlsVariantExpander(const ResolverConfig& config, HttpFetcher& fetcher,
        const SecurityValidator& validator, const TimeoutSafeMatcher& matcher)
        : config_(config), fetcher_(fetcher), validator_(validator), matcher_(matcher) {}

    vector<VideoSource> expand(const vector<VideoSource>& sources) {
        vector<VideoSource> out;
        int fetched = 0;
        for (const auto& source : sources) {
            if (!config_.expandHlsVariants || fetched >= config_.maxHlsPlaylists || !isHlsPlaylistUrl(source.url())) {
                out.push_back(source);
                continue;
            }
            ++fetched;
            vector<VideoSource> variants = variantsOf(source);
            if (variants.empty()) {
                out.push_back(source);
            }
            else {
                out.insert(out.end(), variants.begin(), variants.end());
            }
        }
        return out;
    }

private:
    vector<VideoSource> variantsOf(const VideoSource& master) {
        FetchResult playlist = fetcher_.fetch(master.url(), config_.playlistMaxBytes, config_.pageTimeout);
        if (!playlist.ok) {
            logWarn("HlsVariantExpander", "Keeping master playlist " + master.url() + ": " + playlist.error);
            return vector<VideoSource>();
        }
        vector<CandidateSource> candidates = parseHlsMasterPlaylist(playlist.body, master.url(), matcher_, config_.matchTimeout);
        for (auto& c : candidates) {
            c.mirrorIndex = master.mirrorIndex();
            if (qualityRank(c.qualityLabel) < 0) c.qualityLabel = master.qualityLabel();
        }
        vector<VideoSource> admitted = validator_.admitAll(candidates, "HLS");
        if (!admitted.empty()) {
            logInfo("HlsVariantExpander", master.url() + " expanded to " + to_string(admitted.size()) + " variant(s)");
        }
        return admitted;
    }

    const ResolverConfig& config_;
    HttpFetcher& fetcher_;
    const SecurityValidator& validator_;
    const TimeoutSafeMatcher& matcher_;
};
