#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <fstream>
#include <sstream>
#include <cstddef>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

// Timeouts and limits
static const long CURL_CONNECT_TIMEOUT_MS = 5000L;
static const long PAGE_FETCH_TIMEOUT_MS = 15000L;
static const long MIRROR_PROBE_TIMEOUT_MS = 8000L;
static const long MIRROR_RACE_TIMEOUT_MS = 10000L;
static const long MATCH_TIMEOUT_MS = 2000L;
static const size_t PAGE_MAX_BYTES = 10 * 1024 * 1024;
static const size_t MIRROR_MAX_BYTES = 5 * 1024 * 1024;
static const size_t MATCH_INPUT_CAP = 1024 * 1024;
static const size_t SCRIPT_SIZE_LIMIT = 1024 * 1024;
static const size_t MAX_MATCHES_PER_SCAN = 256;
static const int MAX_MIRRORS = 5;
static const int MAX_IFRAMES = 3;
static const int MAX_REDIRECTS = 5;
static const size_t HLS_PLAYLIST_MAX_BYTES = 256 * 1024;
static const int MAX_HLS_PLAYLISTS = 3;
static const long CACHE_TTL_MS = 5 * 60 * 1000L;
static const size_t CACHE_MAX_ENTRIES = 100;
static const char* const DEFAULT_USER_AGENT = "Mozilla/5.0 (compatible; StreamLens/1.0)";
static const char* const DEFAULT_MIRROR_ENDPOINT_TEMPLATE = "https://{host}/wp-json/dooplayer/v2/{id}/{type}/{n}";

struct ResolverConfig {
    vector<string> trustedDomains;
    chrono::milliseconds connectTimeout{ CURL_CONNECT_TIMEOUT_MS };
    chrono::milliseconds pageTimeout{ PAGE_FETCH_TIMEOUT_MS };
    chrono::milliseconds mirrorTimeout{ MIRROR_PROBE_TIMEOUT_MS };
    chrono::milliseconds raceTimeout{ MIRROR_RACE_TIMEOUT_MS };
    chrono::milliseconds matchTimeout{ MATCH_TIMEOUT_MS };
    chrono::milliseconds cacheTtl{ CACHE_TTL_MS };
    size_t pageMaxBytes = PAGE_MAX_BYTES;
    size_t mirrorMaxBytes = MIRROR_MAX_BYTES;
    size_t matchInputCap = MATCH_INPUT_CAP;
    size_t scriptSizeLimit = SCRIPT_SIZE_LIMIT;
    size_t cacheMaxEntries = CACHE_MAX_ENTRIES;
    size_t playlistMaxBytes = HLS_PLAYLIST_MAX_BYTES;
    int maxMirrors = MAX_MIRRORS;
    int maxIframes = MAX_IFRAMES;
    int maxHlsPlaylists = MAX_HLS_PLAYLISTS;
    bool discoverInternalId = true;
    bool expandHlsVariants = true;
    string mirrorEndpointTemplate = DEFAULT_MIRROR_ENDPOINT_TEMPLATE;
    string userAgent = DEFAULT_USER_AGENT;
};

inline bool readConfigMillis(const json& j, const char* key, chrono::milliseconds& out, string& error) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_number_integer() || v.get<long long>() < 0) {
        error = string("'") + key + "' must be a non-negative integer (milliseconds)";
        return false;
    }
    out = chrono::milliseconds(v.get<long long>());
    return true;
}

inline bool readConfigSize(const json& j, const char* key, size_t& out, string& error) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_number_unsigned()) {
        error = string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = v.get<size_t>();
    return true;
}

inline bool readConfigInt(const json& j, const char* key, int& out, string& error) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_number_integer() || v.get<long long>() < 0 || v.get<long long>() > 64) {
        error = string("'") + key + "' must be an integer between 0 and 64";
        return false;
    }
    out = v.get<int>();
    return true;
}

inline bool readConfigString(const json& j, const char* key, string& out, string& error) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_string()) {
        error = string("'") + key + "' must be a string";
        return false;
    }
    out = v.get<string>();
    return true;
}

inline bool readConfigBool(const json& j, const char* key, bool& out, string& error) {
    if (!j.contains(key)) return true;
    const json& v = j[key];
    if (!v.is_boolean()) {
        error = string("'") + key + "' must be a boolean";
        return false;
    }
    out = v.get<bool>();
    return true;
}

// Overlays values from a parsed JSON object onto 'config'. Unknown keys are ignored.
inline bool applyResolverConfig(const json& j, ResolverConfig& config, string& error) {
    if (!j.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }
    if (j.contains("trusted_domains")) {
        const json& domains = j["trusted_domains"];
        if (!domains.is_array()) {
            error = "'trusted_domains' must be an array of strings";
            return false;
        }
        vector<string> parsed;
        for (const auto& d : domains) {
            if (!d.is_string()) {
                error = "'trusted_domains' must be an array of strings";
                return false;
            }
            parsed.push_back(d.get<string>());
        }
        config.trustedDomains = parsed;
    }
    if (!readConfigBool(j, "discover_internal_id", config.discoverInternalId, error) ||
        !readConfigBool(j, "expand_hls_variants", config.expandHlsVariants, error)) {
        return false;
    }
    return readConfigMillis(j, "connect_timeout_ms", config.connectTimeout, error) &&
        readConfigMillis(j, "page_timeout_ms", config.pageTimeout, error) &&
        readConfigMillis(j, "mirror_timeout_ms", config.mirrorTimeout, error) &&
        readConfigMillis(j, "race_timeout_ms", config.raceTimeout, error) &&
        readConfigMillis(j, "match_timeout_ms", config.matchTimeout, error) &&
        readConfigMillis(j, "cache_ttl_ms", config.cacheTtl, error) &&
        readConfigSize(j, "page_max_bytes", config.pageMaxBytes, error) &&
        readConfigSize(j, "mirror_max_bytes", config.mirrorMaxBytes, error) &&
        readConfigSize(j, "match_input_cap", config.matchInputCap, error) &&
        readConfigSize(j, "script_size_limit", config.scriptSizeLimit, error) &&
        readConfigSize(j, "cache_max_entries", config.cacheMaxEntries, error) &&
        readConfigSize(j, "playlist_max_bytes", config.playlistMaxBytes, error) &&
        readConfigInt(j, "max_mirrors", config.maxMirrors, error) &&
        readConfigInt(j, "max_iframes", config.maxIframes, error) &&
        readConfigInt(j, "max_hls_playlists", config.maxHlsPlaylists, error) &&
        readConfigString(j, "mirror_endpoint_template", config.mirrorEndpointTemplate, error) &&
        readConfigString(j, "user_agent", config.userAgent, error);
}

inline bool loadResolverConfig(const string& path, ResolverConfig& config, string& error) {
    ifstream in(path);
    if (!in) {
        error = "cannot open config file: " + path;
        return false;
    }
    stringstream ss;
    ss << in.rdbuf();
    json j;
    try {
        j = json::parse(ss.str());
    }
    catch (const json::parse_error& e) {
        error = string("invalid JSON in ") + path + ": " + e.what();
        return false;
    }
    return applyResolverConfig(j, config, error);
}
