#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <curl/curl.h>

#include "config.h"
#include "log_utils.h"
#include "cancel_token.h"

using namespace std;

struct FetchResult {
    bool ok = false;
    string body;
    bool truncated = false;   // body was cut at maxBytes
    bool cancelled = false;   // aborted through the CancelToken
    bool timedOut = false;
    long httpStatus = 0;
    string error;
};

// One bounded HTTP GET. Implementations never retry.
class HttpFetcher {
public:
    virtual ~HttpFetcher() {}
    virtual FetchResult fetch(const string& url, size_t maxBytes, chrono::milliseconds timeout,
        CancelToken* cancel = nullptr) = 0;
};

struct CurlBuffer {
    string data;
    size_t maxBytes;
    bool truncated;
};

// Appends up to the byte cap, then returns a short count so that libcurl
// aborts the transfer. The caller treats that abort as truncation.
inline size_t boundedWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    if (!userp) return 0;
    CurlBuffer* buf = static_cast<CurlBuffer*>(userp);
    size_t room = buf->data.size() < buf->maxBytes ? buf->maxBytes - buf->data.size() : 0;
    if (realsize > room) {
        buf->data.append(static_cast<char*>(contents), room);
        buf->truncated = true;
        return room;
    }
    buf->data.append(static_cast<char*>(contents), realsize);
    return realsize;
}

// Must be called once per process before any CurlFetcher is used from threads.
class CurlGlobal {
public:
    CurlGlobal() { ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK; }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
    bool ok() const { return ok_; }
private:
    bool ok_;
};

// libcurl implementation. Each transfer runs on its own multi handle so that a
// cancellation wakes curl_multi_poll() immediately and the easy handle (and
// its connection) is torn down at once instead of running to its timeout.
// Redirects are followed manually so every hop goes through 'redirectPolicy'.
class CurlFetcher : public HttpFetcher {
public:
    typedef function<bool(const string&)> RedirectPolicy;

    CurlFetcher(const string& userAgent, chrono::milliseconds connectTimeout, RedirectPolicy redirectPolicy)
        : userAgent_(userAgent), connectTimeout_(connectTimeout), redirectPolicy_(std::move(redirectPolicy)) {}

    FetchResult fetch(const string& url, size_t maxBytes, chrono::milliseconds timeout,
        CancelToken* cancel = nullptr) override {
        FetchResult result;
        const auto deadline = chrono::steady_clock::now() + timeout;
        string current = url;
        for (int hop = 0; hop <= MAX_REDIRECTS; ++hop) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timedOut = true;
                result.error = "timeout before request to " + current;
                return result;
            }
            string location;
            result = transfer(current, maxBytes, remaining, cancel, location);
            if (!result.ok || location.empty()) return result;

            if (redirectPolicy_ && !redirectPolicy_(location)) {
                FetchResult rejected;
                rejected.httpStatus = result.httpStatus;
                rejected.error = "redirect to disallowed URL: " + location;
                logWarn("fetchPage", rejected.error);
                return rejected;
            }
            logDebug("fetchPage", "Redirect " + current + " -> " + location);
            current = location;
        }
        FetchResult tooMany;
        tooMany.error = "too many redirects for " + url;
        return tooMany;
    }

private:
    FetchResult transfer(const string& url, size_t maxBytes, chrono::milliseconds timeout,
        CancelToken* cancel, string& location) {
        FetchResult result;
        CURL* curl = curl_easy_init();
        if (!curl) {
            result.error = "curl_easy_init failed";
            logError("fetchPage", result.error);
            return result;
        }
        CURLM* multi = curl_multi_init();
        if (!multi) {
            curl_easy_cleanup(curl);
            result.error = "curl_multi_init failed";
            logError("fetchPage", result.error);
            return result;
        }

        CurlBuffer buf{ string(), maxBytes, false };
        long connectMs = (long)min(connectTimeout_, timeout).count();
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, boundedWriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buf);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connectMs);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeout.count());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
        curl_multi_add_handle(multi, curl);

        int wakeId = -1;
        if (cancel) {
            wakeId = cancel->addCallback([multi]() { curl_multi_wakeup(multi); });
        }

        CURLcode res = CURLE_OK;
        bool done = false;
        int running = 1;
        while (!done) {
            if (cancel && cancel->isCancelled()) {
                result.cancelled = true;
                break;
            }
            CURLMcode mc = curl_multi_perform(multi, &running);
            if (mc != CURLM_OK) {
                result.error = string("curl_multi_perform: ") + curl_multi_strerror(mc);
                break;
            }
            int queued = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
                if (msg->msg == CURLMSG_DONE) {
                    res = msg->data.result;
                    done = true;
                }
            }
            if (done || running == 0) {
                done = true;
                break;
            }
            mc = curl_multi_poll(multi, nullptr, 0, 1000, nullptr);
            if (mc != CURLM_OK) {
                result.error = string("curl_multi_poll: ") + curl_multi_strerror(mc);
                break;
            }
        }

        if (cancel) cancel->removeCallback(wakeId);

        if (done) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.httpStatus);
            if (res == CURLE_OK || (res == CURLE_WRITE_ERROR && buf.truncated)) {
                if (result.httpStatus >= 400) {
                    result.error = "HTTP " + to_string(result.httpStatus) + " for " + url;
                    logWarn("fetchPage", result.error);
                }
                else {
                    result.ok = true;
                    result.truncated = buf.truncated;
                    result.body = std::move(buf.data);
                    if (result.truncated) {
                        logWarn("fetchPage", "Response truncated at " + to_string(maxBytes) + " bytes: " + url);
                    }
                    if (result.httpStatus >= 300 && result.httpStatus < 400) {
                        char* redirect = nullptr;
                        curl_easy_getinfo(curl, CURLINFO_REDIRECT_URL, &redirect);
                        if (redirect) location = redirect;
                    }
                }
            }
            else {
                result.timedOut = (res == CURLE_OPERATION_TIMEDOUT);
                result.error = string("cURL error for ") + url + " : " + curl_easy_strerror(res);
                logWarn("fetchPage", result.error);
            }
        }
        else if (result.cancelled) {
            result.error = "cancelled: " + url;
            logDebug("fetchPage", result.error);
        }

        curl_multi_remove_handle(multi, curl);
        curl_easy_cleanup(curl);
        curl_multi_cleanup(multi);
        return result;
    }

    string userAgent_;
    chrono::milliseconds connectTimeout_;
    RedirectPolicy redirectPolicy_;
};
