#pragma once

#include <string>
#include <vector>
#include <cctype>
#include <cstdlib>

#include "string_utils.h"

using namespace std;

enum class ContentType { Movie, Episode, Series };

inline string contentTypeName(ContentType type) {
    switch (type) {
    case ContentType::Movie: return "movie";
    case ContentType::Episode: return "episode";
    case ContentType::Series: return "series";
    }
    return "movie";
}

inline bool parseContentType(const string& name, ContentType& out) {
    string low = toLowerStr(name);
    if (low == "movie") { out = ContentType::Movie; return true; }
    if (low == "episode") { out = ContentType::Episode; return true; }
    if (low == "series" || low == "tvshow") { out = ContentType::Series; return true; }
    return false;
}

struct ContentPageRef {
    string canonicalUrl;
    ContentType contentType = ContentType::Movie;
    string internalId; // empty when the caller has none
};

static const char* const UNKNOWN_QUALITY = "unknown";

// Unvalidated output of an extraction strategy.
struct CandidateSource {
    string url;
    string qualityLabel = UNKNOWN_QUALITY;
    int mirrorIndex = -1;
    long long approxSizeBytes = -1;
    string strategy;
};

class SecurityValidator;

// A stream URL that has passed SecurityValidator. Only the validator can
// construct one; callers receive copies.
class VideoSource {
public:
    const string& url() const { return url_; }
    const string& qualityLabel() const { return qualityLabel_; }
    bool hasMirrorIndex() const { return mirrorIndex_ >= 0; }
    int mirrorIndex() const { return mirrorIndex_; }
    bool hasApproxSize() const { return approxSizeBytes_ >= 0; }
    long long approxSizeBytes() const { return approxSizeBytes_; }

    bool operator==(const VideoSource& other) const {
        return url_ == other.url_ && qualityLabel_ == other.qualityLabel_ &&
            mirrorIndex_ == other.mirrorIndex_ && approxSizeBytes_ == other.approxSizeBytes_;
    }
    bool operator!=(const VideoSource& other) const { return !(*this == other); }

private:
    friend class SecurityValidator;
    VideoSource(const string& url, const string& quality, int mirrorIndex, long long approxSizeBytes)
        : url_(url), qualityLabel_(quality), mirrorIndex_(mirrorIndex), approxSizeBytes_(approxSizeBytes) {}

    string url_;
    string qualityLabel_;
    int mirrorIndex_;
    long long approxSizeBytes_;
};

enum class ResolutionStatus { Success, NoSourcesFound, NetworkError, ParseError, SecurityRejected };

inline string resolutionStatusName(ResolutionStatus status) {
    switch (status) {
    case ResolutionStatus::Success: return "Success";
    case ResolutionStatus::NoSourcesFound: return "NoSourcesFound";
    case ResolutionStatus::NetworkError: return "NetworkError";
    case ResolutionStatus::ParseError: return "ParseError";
    case ResolutionStatus::SecurityRejected: return "SecurityRejected";
    }
    return "Unknown";
}

// Exactly one of these is produced per resolve() call. 'sources' is non-empty
// iff status == Success; 'message' carries the reason/cause otherwise.
struct ResolutionResult {
    ResolutionStatus status = ResolutionStatus::NoSourcesFound;
    vector<VideoSource> sources;
    string message;

    static ResolutionResult success(const vector<VideoSource>& sources) {
        ResolutionResult r;
        if (sources.empty()) {
            r.status = ResolutionStatus::NoSourcesFound;
            r.message = "empty source list";
            return r;
        }
        r.status = ResolutionStatus::Success;
        r.sources = sources;
        return r;
    }
    static ResolutionResult noSourcesFound(const string& reason) { return failure(ResolutionStatus::NoSourcesFound, reason); }
    static ResolutionResult networkError(const string& cause) { return failure(ResolutionStatus::NetworkError, cause); }
    static ResolutionResult parseError(const string& cause) { return failure(ResolutionStatus::ParseError, cause); }
    static ResolutionResult securityRejected(const string& reason) { return failure(ResolutionStatus::SecurityRejected, reason); }

    bool isSuccess() const { return status == ResolutionStatus::Success; }
    bool isRetryable() const { return status == ResolutionStatus::NetworkError || status == ResolutionStatus::ParseError; }

    string describe() const {
        if (isSuccess()) return "Success: " + to_string(sources.size()) + " source(s)";
        return resolutionStatusName(status) + ": " + message;
    }

private:
    static ResolutionResult failure(ResolutionStatus status, const string& message) {
        ResolutionResult r;
        r.status = status;
        r.message = message;
        return r;
    }
};

// --- Quality helpers ---

// "1080p" -> 1080, "4K" -> 2160, anything unrecognised -> -1 (sorts last).
inline int qualityRank(const string& label) {
    string low = toLowerStr(trimWhitespace(label));
    if (low.empty() || low == UNKNOWN_QUALITY) return -1;
    if (low == "4k" || low == "uhd") return 2160;
    if (low == "fhd") return 1080;
    if (low == "hd") return 720;
    if (low == "sd") return 480;
    size_t i = 0;
    while (i < low.size() && isdigit((unsigned char)low[i])) ++i;
    if (i == 0 || i > 4) return -1;
    string rest = low.substr(i);
    if (!rest.empty() && rest != "p") return -1;
    return atoi(low.substr(0, i).c_str());
}

inline string normalizeQualityLabel(const string& label) {
    int rank = qualityRank(label);
    if (rank < 0) return UNKNOWN_QUALITY;
    return to_string(rank) + "p";
}

// https://d1.host/series/x/01.1080.mp4 -> "1080p"
inline string detectQualityFromUrl(const string& url) {
    static const char* const heights[] = { "2160", "1440", "1080", "720", "480", "360", "240" };
    string low = toLowerStr(url);
    for (const char* h : heights) {
        string height(h);
        const char* separators[] = { ".", "-", "_", "/" };
        for (const char* before : separators) {
            for (const char* after : { ".", "p.", "p-", "p_", "p/", "-", "_", "/" }) {
                if (low.find(string(before) + height + after) != string::npos) {
                    return height + "p";
                }
            }
        }
    }
    return UNKNOWN_QUALITY;
}
