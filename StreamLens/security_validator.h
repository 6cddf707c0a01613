#pragma once

#include <string>
#include <vector>

#include "log_utils.h"
#include "string_utils.h"
#include "url_utils.h"
#include "video_types.h"

using namespace std;

struct UrlVerdict {
    bool accepted = false;
    string url;     // canonical https URL when accepted
    string reason;  // why it was rejected otherwise
};

// Trust policy for every URL the engine touches: only http/https, only hosts
// in the trusted-domain set (exact or subdomain), http is upgraded to https.
class SecurityValidator {
public:
    explicit SecurityValidator(const vector<string>& trustedDomains) {
        for (const auto& d : trustedDomains) {
            string domain = toLowerStr(trimWhitespace(d));
            while (!domain.empty() && domain.back() == '.') domain.pop_back();
            if (domain.compare(0, 2, "*.") == 0) domain = domain.substr(2);
            if (!domain.empty()) trustedDomains_.push_back(domain);
        }
    }

    const vector<string>& trustedDomains() const { return trustedDomains_; }

    bool isTrustedHost(const string& host) const {
        string h = toLowerStr(host);
        while (!h.empty() && h.back() == '.') h.pop_back();
        if (h.empty()) return false;
        for (const auto& d : trustedDomains_) {
            if (h == d) return true;
            if (h.size() > d.size() && endsWithStr(h, d) && h[h.size() - d.size() - 1] == '.') return true;
        }
        return false;
    }

    UrlVerdict validate(const string& url) const {
        UrlVerdict verdict;
        string trimmed = trimWhitespace(url);
        if (trimmed.empty()) return reject(verdict, url, "empty URL");
        if (!startsWithNoCase(trimmed, "http://") && !startsWithNoCase(trimmed, "https://")) {
            return reject(verdict, url, "scheme not allowed");
        }
        ParsedUrl parsed;
        if (!parseUrl(trimmed, parsed)) return reject(verdict, url, "malformed URL");
        if (parsed.scheme != "http" && parsed.scheme != "https") return reject(verdict, url, "scheme not allowed");
        if (!parsed.user.empty() || !parsed.password.empty()) return reject(verdict, url, "embedded credentials");
        if (parsed.host.empty()) return reject(verdict, url, "missing host");
        if (!isTrustedHost(parsed.host)) return reject(verdict, url, "untrusted host " + parsed.host);

        if (parsed.scheme == "http") {
            if (parsed.port == "80") parsed.port.clear();
            parsed.scheme = "https";
            logDebug("SecurityValidator", "Upgraded to https: " + trimmed);
        }
        if (parsed.port == "443") parsed.port.clear();
        verdict.accepted = true;
        verdict.url = buildUrl(parsed);
        return verdict;
    }

    bool isAllowed(const string& url) const { return validate(url).accepted; }

    // Cache key: the canonical URL without a trailing slash on non-root paths,
    // so that http/https, host casing and "/x" vs "/x/" collide.
    bool cacheKey(const string& url, string& key, string& reason) const {
        UrlVerdict verdict = validate(url);
        if (!verdict.accepted) {
            reason = verdict.reason;
            return false;
        }
        key = verdict.url;
        size_t queryPos = key.find('?');
        string base = key.substr(0, queryPos);
        string query = queryPos == string::npos ? string() : key.substr(queryPos);
        size_t pathStart = base.find('/', base.find("://") + 3);
        while (pathStart != string::npos && base.size() > pathStart + 1 && base.back() == '/') {
            base.pop_back();
        }
        key = base + query;
        return true;
    }

    // Turns an extracted candidate into a VideoSource, or explains why not.
    bool admit(const CandidateSource& candidate, VideoSource& out, string& reason) const {
        UrlVerdict verdict = validate(candidate.url);
        if (!verdict.accepted) {
            reason = verdict.reason;
            return false;
        }
        string quality = normalizeQualityLabel(candidate.qualityLabel);
        if (quality == UNKNOWN_QUALITY) quality = detectQualityFromUrl(verdict.url);
        out = VideoSource(verdict.url, quality, candidate.mirrorIndex, candidate.approxSizeBytes);
        return true;
    }

    vector<VideoSource> admitAll(const vector<CandidateSource>& candidates, const string& context) const {
        vector<VideoSource> accepted;
        for (const auto& c : candidates) {
            VideoSource source("", UNKNOWN_QUALITY, -1, -1);
            string reason;
            if (admit(c, source, reason)) {
                accepted.push_back(source);
            }
            else {
                logWarn("SecurityValidator", "[" + context + "] dropped candidate " + c.url + ": " + reason);
            }
        }
        return accepted;
    }

private:
    UrlVerdict& reject(UrlVerdict& verdict, const string& url, const string& reason) const {
        verdict.accepted = false;
        verdict.reason = reason;
        logWarn("SecurityValidator", "Rejected " + url + ": " + reason);
        return verdict;
    }

    vector<string> trustedDomains_;
};
