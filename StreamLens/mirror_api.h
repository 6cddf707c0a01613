#pragma once

#include <string>
#include <vector>
#include <set>
#include <cctype>
#include <nlohmann/json.hpp>
#include <re2/re2.h>

#include "log_utils.h"
#include "string_utils.h"
#include "url_utils.h"
#include "video_types.h"
#include "regex_matcher.h"

using namespace std;
using json = nlohmann::json;

// One mirror endpoint of a numbered-mirror API; lives only inside one race.
struct MirrorProbe {
    int serverIndex;
    string derivedUrl;
};

inline string mirrorContentTypeSegment(ContentType type) {
    return type == ContentType::Movie ? "movie" : "tv";
}

inline bool isNumericId(const string& id) {
    if (id.empty() || id.size() > 20) return false;
    for (char c : id) {
        if (!isdigit((unsigned char)c)) return false;
    }
    return true;
}

// Expands the endpoint template ({host}, {id}, {type}, {n}) for servers 1..maxMirrors.
inline vector<MirrorProbe> buildMirrorEndpoints(const string& endpointTemplate, const string& pageUrl,
    const string& internalId, ContentType type, int maxMirrors) {
    vector<MirrorProbe> probes;
    ParsedUrl page;
    if (!parseUrl(pageUrl, page) || page.host.empty()) return probes;
    string host = page.host;
    if (!page.port.empty()) host += ":" + page.port;

    string base = replaceAllStr(endpointTemplate, "{host}", host);
    base = replaceAllStr(base, "{id}", urlEncode(internalId));
    base = replaceAllStr(base, "{type}", mirrorContentTypeSegment(type));
    for (int n = 1; n <= maxMirrors; ++n) {
        probes.push_back({ n, replaceAllStr(base, "{n}", to_string(n)) });
    }
    return probes;
}

inline string jsonStringField(const json& obj, const vector<const char*>& keys) {
    for (const char* k : keys) {
        auto it = obj.find(k);
        if (it != obj.end() && it->is_string()) {
            string v = trimWhitespace(it->get<string>());
            if (!v.empty()) return v;
        }
        if (it != obj.end() && it->is_number_integer()) {
            return to_string(it->get<long long>());
        }
    }
    return string();
}

// Walks one JSON value looking for {url|file|src, quality|label|res} objects and
// embed_url players carrying the real stream in their 'source' query parameter.
inline void collectMirrorCandidates(const json& node, int serverIndex, int depth, vector<CandidateSource>& out) {
    if (depth > 4) return;
    if (node.is_array()) {
        for (const auto& item : node) collectMirrorCandidates(item, serverIndex, depth + 1, out);
        return;
    }
    if (!node.is_object()) return;

    string url = unescapeJsSlashes(jsonStringField(node, { "url", "file", "src", "link" }));
    string quality = jsonStringField(node, { "quality", "label", "res", "resolution" });
    string type = toLowerStr(jsonStringField(node, { "type" }));
    // A label alone is not enough: subtitle tracks carry one too.
    bool looksPlayable = hasMediaExtension(url) ||
        type == "mp4" || type == "hls" || type == "video" || type == "m3u8" ||
        type == "video/mp4" || type == "application/x-mpegurl" || type == "application/vnd.apple.mpegurl";
    if (!url.empty() && looksPlayable &&
        (startsWithNoCase(url, "http://") || startsWithNoCase(url, "https://") || startsWithNoCase(url, "//"))) {
        CandidateSource c;
        c.url = url;
        c.qualityLabel = quality.empty() ? UNKNOWN_QUALITY : quality;
        c.mirrorIndex = serverIndex;
        auto size = node.find("size");
        if (size != node.end() && size->is_number_unsigned()) c.approxSizeBytes = size->get<long long>();
        c.strategy = "NumberedMirrorApi";
        out.push_back(c);
    }

    string embed = jsonStringField(node, { "embed_url" });
    if (!embed.empty()) {
        string embedded = getQueryParam(unescapeJsSlashes(embed), "source");
        string target = !embedded.empty() ? embedded : unescapeJsSlashes(embed);
        if (hasMediaExtension(target)) {
            CandidateSource c;
            c.url = target;
            c.qualityLabel = detectQualityFromUrl(target);
            c.mirrorIndex = serverIndex;
            c.strategy = "NumberedMirrorApi";
            out.push_back(c);
        }
    }

    static const char* const containers[] = { "sources", "data", "qualities", "files", "streams" };
    for (const char* key : containers) {
        auto it = node.find(key);
        if (it != node.end() && (it->is_array() || it->is_object())) {
            collectMirrorCandidates(*it, serverIndex, depth + 1, out);
        }
    }
}

// Parses one mirror API response. Structured JSON is preferred; a body that is
// not JSON (or yields nothing) is scanned for literal media URLs instead.
inline vector<CandidateSource> parseMirrorResponse(const string& body, int serverIndex,
    const TimeoutSafeMatcher& matcher, chrono::milliseconds matchTimeout) {
    vector<CandidateSource> candidates;
    if (trimWhitespace(body).empty()) return candidates;

    try {
        json parsed = json::parse(body);
        collectMirrorCandidates(parsed, serverIndex, 0, candidates);
    }
    catch (const json::exception& e) {
        logDebug("parseMirrorResponse", "Server " + to_string(serverIndex) + " returned non-JSON body: " + e.what());
    }
    if (!candidates.empty()) return candidates;

    MatchOutcome outcome = matcher.match(literalMediaUrlPattern(), body, matchTimeout);
    set<string> seen;
    for (const auto& m : outcome.matches) {
        string url = unescapeJsSlashes(m.groups[1]);
        if (!seen.insert(url).second) continue;
        CandidateSource c;
        c.url = url;
        c.qualityLabel = detectQualityFromUrl(url);
        c.mirrorIndex = serverIndex;
        c.strategy = "NumberedMirrorApi";
        candidates.push_back(c);
    }
    return candidates;
}
