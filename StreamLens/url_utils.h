#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>

#include "string_utils.h"

using namespace std;

struct ParsedUrl {
    string scheme;
    string user;
    string password;
    string host;
    string port;
    string path;
    string query;
    string fragment;
};

// Copies one CURLU part into 'out'; a missing part leaves 'out' empty.
inline void copyUrlPart(CURLU* h, CURLUPart part, string& out) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, 0) == CURLUE_OK && value) {
        out = value;
    }
    if (value) curl_free(value);
}

// Parses an absolute URL with libcurl's URL API. Unknown schemes are still
// parsed so that callers can reject them explicitly.
inline bool parseUrl(const string& url, ParsedUrl& out) {
    CURLU* h = curl_url();
    if (!h) return false;
    CURLUcode rc = curl_url_set(h, CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        curl_url_cleanup(h);
        return false;
    }
    out = ParsedUrl();
    copyUrlPart(h, CURLUPART_SCHEME, out.scheme);
    copyUrlPart(h, CURLUPART_USER, out.user);
    copyUrlPart(h, CURLUPART_PASSWORD, out.password);
    copyUrlPart(h, CURLUPART_HOST, out.host);
    copyUrlPart(h, CURLUPART_PORT, out.port);
    copyUrlPart(h, CURLUPART_PATH, out.path);
    copyUrlPart(h, CURLUPART_QUERY, out.query);
    copyUrlPart(h, CURLUPART_FRAGMENT, out.fragment);
    curl_url_cleanup(h);
    out.scheme = toLowerStr(out.scheme);
    out.host = toLowerStr(out.host);
    return true;
}

inline string buildUrl(const ParsedUrl& u) {
    string url = u.scheme + "://" + u.host;
    if (!u.port.empty()) url += ":" + u.port;
    url += u.path.empty() ? "/" : u.path;
    if (!u.query.empty()) url += "?" + u.query;
    return url;
}

// Resolves 'ref' (absolute, scheme-relative or path-relative) against 'base'.
// Returns an empty string when either side cannot be parsed.
inline string resolveUrl(const string& base, const string& ref) {
    string trimmed = trimWhitespace(ref);
    if (trimmed.empty()) return string();
    CURLU* h = curl_url();
    if (!h) return string();
    string resolved;
    if (curl_url_set(h, CURLUPART_URL, base.c_str(), CURLU_NON_SUPPORT_SCHEME) == CURLUE_OK &&
        curl_url_set(h, CURLUPART_URL, trimmed.c_str(), CURLU_NON_SUPPORT_SCHEME) == CURLUE_OK) {
        char* full = nullptr;
        if (curl_url_get(h, CURLUPART_URL, &full, 0) == CURLUE_OK && full) {
            resolved = full;
        }
        if (full) curl_free(full);
    }
    curl_url_cleanup(h);
    return resolved;
}

// Value of 'name' in the query string of 'url', percent-decoded.
inline string getQueryParam(const string& url, const string& name) {
    size_t q = url.find('?');
    if (q == string::npos) return string();
    size_t end = url.find('#', q);
    string query = url.substr(q + 1, end == string::npos ? string::npos : end - q - 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        string pair = query.substr(pos, amp == string::npos ? string::npos : amp - pos);
        size_t eq = pair.find('=');
        string key = pair.substr(0, eq);
        if (key == name) {
            return eq == string::npos ? string() : urlDecode(pair.substr(eq + 1));
        }
        if (amp == string::npos) break;
        pos = amp + 1;
    }
    return string();
}

inline bool hasMediaExtension(const string& url) {
    static const vector<string> extensions = { ".mp4", ".m3u8", ".webm", ".mkv", ".mpd" };
    string low = toLowerStr(url);
    size_t cut = low.find_first_of("?#");
    if (cut != string::npos) low = low.substr(0, cut);
    for (const auto& ext : extensions) {
        if (endsWithStr(low, ext)) return true;
    }
    return false;
}
