#pragma once

#include <map>
#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <chrono>
#include <algorithm>

#include "http_utils.h"
#include "cancel_token.h"

using namespace std;

// Scripted HttpFetcher for tests: per-URL body or error, optional latency,
// and a switch for endpoints that keep running after being cancelled.
class FakeFetcher : public HttpFetcher {
public:
    struct Script {
        string body;
        bool fail = false;
        string error;
        chrono::milliseconds delay{ 0 };
        bool ignoreCancel = false;
    };

    void respond(const string& url, const string& body, chrono::milliseconds delay = chrono::milliseconds(0)) {
        lock_guard<mutex> lock(mutex_);
        Script s;
        s.body = body;
        s.delay = delay;
        scripts_[url] = s;
    }

    void fail(const string& url, const string& error, chrono::milliseconds delay = chrono::milliseconds(0)) {
        lock_guard<mutex> lock(mutex_);
        Script s;
        s.fail = true;
        s.error = error;
        s.delay = delay;
        scripts_[url] = s;
    }

    void ignoreCancel(const string& url) {
        lock_guard<mutex> lock(mutex_);
        scripts_[url].ignoreCancel = true;
    }

    int fetchCount(const string& url) const {
        lock_guard<mutex> lock(mutex_);
        auto it = counts_.find(url);
        return it == counts_.end() ? 0 : it->second;
    }

    int totalFetches() const {
        lock_guard<mutex> lock(mutex_);
        return (int)requested_.size();
    }

    int cancelledCount() const {
        lock_guard<mutex> lock(mutex_);
        return cancelled_;
    }

    int completedCount() const {
        lock_guard<mutex> lock(mutex_);
        return completed_;
    }

    vector<string> requested() const {
        lock_guard<mutex> lock(mutex_);
        return requested_;
    }

    FetchResult fetch(const string& url, size_t maxBytes, chrono::milliseconds timeout,
        CancelToken* cancel = nullptr) override {
        Script script;
        bool known = false;
        {
            lock_guard<mutex> lock(mutex_);
            requested_.push_back(url);
            ++counts_[url];
            auto it = scripts_.find(url);
            if (it != scripts_.end()) {
                script = it->second;
                known = true;
            }
        }

        FetchResult result;
        if (!known) {
            result.httpStatus = 404;
            result.error = "HTTP 404 for " + url;
            return result;
        }

        chrono::milliseconds wait = min(script.delay, timeout);
        if (wait.count() > 0) {
            if (cancel && !script.ignoreCancel) {
                if (cancel->waitFor(wait)) {
                    lock_guard<mutex> lock(mutex_);
                    ++cancelled_;
                    result.cancelled = true;
                    result.error = "cancelled: " + url;
                    return result;
                }
            }
            else {
                this_thread::sleep_for(wait);
            }
        }
        if (script.delay > timeout) {
            result.timedOut = true;
            result.error = "timeout for " + url;
            return result;
        }

        {
            lock_guard<mutex> lock(mutex_);
            ++completed_;
        }
        if (script.fail) {
            result.error = script.error;
            return result;
        }
        result.ok = true;
        result.httpStatus = 200;
        result.body = script.body;
        if (result.body.size() > maxBytes) {
            result.body.resize(maxBytes);
            result.truncated = true;
        }
        return result;
    }

private:
    mutable mutex mutex_;
    map<string, Script> scripts_;
    map<string, int> counts_;
    vector<string> requested_;
    int cancelled_ = 0;
    int completed_ = 0;
};
