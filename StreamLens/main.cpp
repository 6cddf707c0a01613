#include <iostream>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

// Project headers
#include "config.h"
#include "log_utils.h"
#include "http_utils.h"
#include "video_types.h"
#include "security_validator.h"
#include "resolution_engine.h"

using namespace std;
using json = nlohmann::json;

static const int EXIT_OK = 0;
static const int EXIT_USAGE = 1;
static const int EXIT_NO_SOURCES = 2;
static const int EXIT_RETRYABLE = 3;
static const int EXIT_REJECTED = 4;

static void printUsage(const char* argv0) {
    cerr << "Usage: " << argv0 << " <page-url> [--type movie|episode|series] [--id N] [--config file.json]\n";
}

static json resultToJson(const ResolutionResult& result) {
    json out;
    out["status"] = resolutionStatusName(result.status);
    if (!result.message.empty()) out["message"] = result.message;
    json sources = json::array();
    for (const auto& s : result.sources) {
        json item;
        item["url"] = s.url();
        item["quality"] = s.qualityLabel();
        if (s.hasMirrorIndex()) item["mirror"] = s.mirrorIndex();
        if (s.hasApproxSize()) item["size"] = s.approxSizeBytes();
        sources.push_back(item);
    }
    out["sources"] = sources;
    out["retryable"] = result.isRetryable();
    return out;
}

static int exitCodeFor(const ResolutionResult& result) {
    switch (result.status) {
    case ResolutionStatus::Success: return EXIT_OK;
    case ResolutionStatus::NoSourcesFound: return EXIT_NO_SOURCES;
    case ResolutionStatus::NetworkError:
    case ResolutionStatus::ParseError: return EXIT_RETRYABLE;
    case ResolutionStatus::SecurityRejected: return EXIT_REJECTED;
    }
    return EXIT_RETRYABLE;
}

// ------------------ MAIN ------------------
int main(int argc, char** argv) {
    ContentPageRef ref;
    string configPath;
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if ((arg == "--type" || arg == "--id" || arg == "--config") && i + 1 >= argc) {
            cerr << "[ERROR] " << arg << " needs a value\n";
            printUsage(argv[0]);
            return EXIT_USAGE;
        }
        if (arg == "--type") {
            if (!parseContentType(argv[++i], ref.contentType)) {
                cerr << "[ERROR] Unknown content type: " << argv[i] << "\n";
                return EXIT_USAGE;
            }
        }
        else if (arg == "--id") {
            ref.internalId = argv[++i];
        }
        else if (arg == "--config") {
            configPath = argv[++i];
        }
        else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        else if (ref.canonicalUrl.empty() && !arg.empty() && arg[0] != '-') {
            ref.canonicalUrl = arg;
        }
        else {
            cerr << "[ERROR] Unexpected argument: " << arg << "\n";
            printUsage(argv[0]);
            return EXIT_USAGE;
        }
    }

    if (ref.canonicalUrl.empty()) {
        cerr << "Enter page URL (one line)\n> ";
        getline(cin, ref.canonicalUrl);
        ref.canonicalUrl = trimWhitespace(ref.canonicalUrl);
        if (ref.canonicalUrl.empty()) {
            cerr << "No URL provided. Exiting.\n";
            return EXIT_USAGE;
        }
    }

    ResolverConfig config;
    if (!configPath.empty()) {
        string error;
        if (!loadResolverConfig(configPath, config, error)) {
            cerr << "[ERROR] " << error << "\n";
            return EXIT_USAGE;
        }
    }
    if (config.trustedDomains.empty()) {
        // Without a configured list, trust the page's own host.
        ParsedUrl page;
        if (parseUrl(ref.canonicalUrl, page) && !page.host.empty()) {
            config.trustedDomains.push_back(page.host);
            logWarn("main", "No trusted_domains configured; trusting only " + page.host);
        }
    }

    CurlGlobal curl;
    if (!curl.ok()) {
        cerr << "[ERROR] curl_global_init failed\n";
        return EXIT_RETRYABLE;
    }

    SecurityValidator redirectPolicy(config.trustedDomains);
    CurlFetcher fetcher(config.userAgent, config.connectTimeout,
        [&redirectPolicy](const string& location) { return redirectPolicy.isAllowed(location); });
    ResolutionEngine engine(config, fetcher);

    logInfo("main", "Resolving " + ref.canonicalUrl + " (" + contentTypeName(ref.contentType) +
        (ref.internalId.empty() ? string() : ", id " + ref.internalId) + ")");
    ResolutionResult result = engine.resolve(ref);
    logDebug("main", "Cache: " + engine.cacheStats());

    cout << resultToJson(result).dump(2) << "\n";
    return exitCodeFor(result);
}
