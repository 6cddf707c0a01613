#pragma once

#include <string>
#include <vector>
#include <map>
#include <list>
#include <mutex>
#include <future>
#include <memory>
#include <chrono>
#include <functional>
#include <exception>

#include "config.h"
#include "log_utils.h"
#include "video_types.h"
#include "security_validator.h"

using namespace std;

typedef function<chrono::steady_clock::time_point()> CacheClock;
typedef function<ResolutionResult(const string& canonicalUrl)> PageResolver;

struct CacheStats {
    size_t entries = 0;
    size_t hits = 0;
    size_t misses = 0;
    size_t coalesced = 0;
    size_t evictions = 0;
    size_t invalidations = 0;
};

// In-memory TTL cache of successful resolutions, keyed by the validator's
// cache key. Concurrent callers for one key share a single resolver run.
// Only non-empty successes are stored; invalidate() also detaches any
// resolution in flight for the key so that its result is never stored.
class ResultCache {
public:
    explicit ResultCache(const SecurityValidator& validator, size_t maxEntries = CACHE_MAX_ENTRIES,
        CacheClock clock = CacheClock())
        : validator_(validator), maxEntries_(maxEntries), clock_(clock) {
        if (!clock_) clock_ = []() { return chrono::steady_clock::now(); };
    }

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    ResolutionResult getOrResolve(const string& pageUrl, const PageResolver& resolver, chrono::milliseconds ttl) {
        UrlVerdict verdict = validator_.validate(pageUrl);
        string key, reason;
        if (!verdict.accepted || !validator_.cacheKey(verdict.url, key, reason)) {
            return ResolutionResult::securityRejected(verdict.accepted ? reason : verdict.reason);
        }

        shared_ptr<promise<ResolutionResult>> owner;
        shared_future<ResolutionResult> pending;
        {
            lock_guard<mutex> lock(mutex_);
            auto now = clock_();
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                if (now < it->second.expiresAt) {
                    ++stats_.hits;
                    lru_.splice(lru_.begin(), lru_, it->second.lruPos);
                    logDebug("ResultCache", "Hit for " + key);
                    return ResolutionResult::success(it->second.sources);
                }
                logDebug("ResultCache", "Expired entry for " + key);
                eraseEntry(it);
            }

            auto flight = inFlight_.find(key);
            if (flight != inFlight_.end()) {
                ++stats_.coalesced;
                pending = flight->second.result;
            }
            else {
                ++stats_.misses;
                owner = make_shared<promise<ResolutionResult>>();
                inFlight_[key] = InFlight{ owner, owner->get_future().share() };
            }
        }

        if (!owner) {
            logDebug("ResultCache", "Joining in-flight resolution for " + key);
            return pending.get();
        }

        ResolutionResult result;
        try {
            result = resolver(verdict.url);
        }
        catch (...) {
            // Waiters see the same exception; the caller gets it rethrown.
            finishFlight(key, owner);
            owner->set_exception(current_exception());
            throw;
        }

        {
            lock_guard<mutex> lock(mutex_);
            bool current = finishFlightLocked(key, owner);
            if (result.isSuccess() && !result.sources.empty()) {
                if (current) {
                    store(key, result.sources, ttl);
                }
                else {
                    logInfo("ResultCache", "Discarding result for " + key + " invalidated while in flight");
                }
            }
        }
        owner->set_value(result);
        return result;
    }

    void invalidate(const string& pageUrl) {
        string key, reason;
        if (!validator_.cacheKey(pageUrl, key, reason)) return;
        lock_guard<mutex> lock(mutex_);
        ++stats_.invalidations;
        auto it = entries_.find(key);
        if (it != entries_.end()) eraseEntry(it);
        inFlight_.erase(key);
        logDebug("ResultCache", "Invalidated " + key);
    }

    void clear() {
        lock_guard<mutex> lock(mutex_);
        entries_.clear();
        lru_.clear();
        inFlight_.clear();
    }

    size_t size() const {
        lock_guard<mutex> lock(mutex_);
        return entries_.size();
    }

    CacheStats counters() const {
        lock_guard<mutex> lock(mutex_);
        CacheStats s = stats_;
        s.entries = entries_.size();
        return s;
    }

    string stats() const {
        CacheStats s = counters();
        return "entries=" + to_string(s.entries) + "/" + to_string(maxEntries_) +
            " hits=" + to_string(s.hits) + " misses=" + to_string(s.misses) +
            " coalesced=" + to_string(s.coalesced) + " evictions=" + to_string(s.evictions) +
            " invalidations=" + to_string(s.invalidations);
    }

private:
    struct Entry {
        vector<VideoSource> sources;
        chrono::steady_clock::time_point fetchedAt;
        chrono::steady_clock::time_point expiresAt;
        list<string>::iterator lruPos;
    };

    struct InFlight {
        shared_ptr<promise<ResolutionResult>> owner;
        shared_future<ResolutionResult> result;
    };

    void finishFlight(const string& key, const shared_ptr<promise<ResolutionResult>>& owner) {
        lock_guard<mutex> lock(mutex_);
        finishFlightLocked(key, owner);
    }

    // True if 'owner' was still the registered resolution for 'key'.
    bool finishFlightLocked(const string& key, const shared_ptr<promise<ResolutionResult>>& owner) {
        auto it = inFlight_.find(key);
        if (it == inFlight_.end() || it->second.owner != owner) return false;
        inFlight_.erase(it);
        return true;
    }

    void store(const string& key, const vector<VideoSource>& sources, chrono::milliseconds ttl) {
        if (maxEntries_ == 0 || ttl.count() <= 0) return;
        auto now = clock_();
        auto existing = entries_.find(key);
        if (existing != entries_.end()) eraseEntry(existing);
        if (entries_.size() >= maxEntries_) {
            for (auto it = entries_.begin(); it != entries_.end();) {
                if (now >= it->second.expiresAt) {
                    lru_.erase(it->second.lruPos);
                    it = entries_.erase(it);
                    ++stats_.evictions;
                }
                else {
                    ++it;
                }
            }
        }
        while (entries_.size() >= maxEntries_ && !lru_.empty()) {
            string victim = lru_.back();
            logDebug("ResultCache", "Evicting least recently used " + victim);
            eraseEntry(entries_.find(victim));
            ++stats_.evictions;
        }
        lru_.push_front(key);
        Entry entry;
        entry.sources = sources;
        entry.fetchedAt = now;
        entry.expiresAt = now + ttl;
        entry.lruPos = lru_.begin();
        entries_[key] = entry;
        logDebug("ResultCache", "Stored " + to_string(sources.size()) + " source(s) for " + key);
    }

    void eraseEntry(map<string, Entry>::iterator it) {
        lru_.erase(it->second.lruPos);
        entries_.erase(it);
    }

    const SecurityValidator& validator_;
    size_t maxEntries_;
    CacheClock clock_;
    mutable mutex mutex_;
    map<string, Entry> entries_;
    list<string> lru_;
    map<string, InFlight> inFlight_;
    CacheStats stats_;
};
