#pragma once

#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <chrono>
#include <functional>
#include <condition_variable>
#include <exception>
#include <system_error>

#include "log_utils.h"
#include "http_utils.h"
#include "cancel_token.h"
#include "mirror_api.h"
#include "security_validator.h"
#include "url_utils.h"
#include "video_types.h"

using namespace std;

enum class RaceStatus { Won, AllEmpty, TimedOut };

struct RaceOutcome {
    RaceStatus status = RaceStatus::AllEmpty;
    vector<VideoSource> sources;
    int winnerIndex = -1;
    int probesFinished = 0;
    int lateResultsDiscarded = 0;
};

typedef function<vector<CandidateSource>(const string& body, const MirrorProbe& probe)> MirrorResponseParser;

// First-wins race over a fixed set of mirror endpoints. Every probe runs on a
// thread owned by race(); the first probe whose parsed response survives the
// SecurityValidator wins, the shared CancelToken aborts the others, and all
// threads are joined before race() returns. Once the race is closed (winner
// chosen or deadline passed) any result still arriving is dropped.
class MirrorRaceCoordinator {
public:
    MirrorRaceCoordinator(HttpFetcher& fetcher, const SecurityValidator& validator, size_t maxBytes)
        : fetcher_(fetcher), validator_(validator), maxBytes_(maxBytes) {}

    RaceOutcome race(const vector<MirrorProbe>& endpoints, const MirrorResponseParser& parser,
        chrono::milliseconds perEndpointTimeout, chrono::milliseconds overallTimeout) {
        RaceOutcome outcome;
        if (endpoints.empty()) return outcome;

        RaceState state;
        const auto deadline = chrono::steady_clock::now() + overallTimeout;
        vector<thread> workers;
        workers.reserve(endpoints.size());
        try {
            for (const auto& probe : endpoints) {
                workers.emplace_back([this, &state, &parser, probe, perEndpointTimeout]() {
                    runProbe(state, parser, probe, perEndpointTimeout);
                });
            }
        }
        catch (const system_error& e) {
            logError("MirrorRace", string("Failed to start probe thread: ") + e.what());
            state.cancel.cancel();
            for (auto& t : workers) t.join();
            throw;
        }

        {
            unique_lock<mutex> lock(state.guard);
            const size_t total = workers.size();
            state.cv.wait_until(lock, deadline, [&state, total]() {
                return state.winnerIndex >= 0 || state.finished == total;
            });
            state.closed = true;
            outcome.winnerIndex = state.winnerIndex;
            outcome.sources = state.winningSources;
            if (state.winnerIndex >= 0) {
                outcome.status = RaceStatus::Won;
            }
            else if (state.finished == total) {
                outcome.status = RaceStatus::AllEmpty;
            }
            else {
                outcome.status = RaceStatus::TimedOut;
            }
        }

        state.cancel.cancel();
        for (auto& t : workers) t.join();

        outcome.probesFinished = (int)state.finished;
        outcome.lateResultsDiscarded = state.discarded;
        if (outcome.status == RaceStatus::Won) {
            logInfo("MirrorRace", "Server " + to_string(outcome.winnerIndex) + " won with " + to_string(outcome.sources.size()) + " source(s)");
        }
        else if (outcome.status == RaceStatus::TimedOut) {
            logWarn("MirrorRace", "No mirror answered within " + to_string(overallTimeout.count()) + "ms");
        }
        else {
            logInfo("MirrorRace", "All " + to_string(endpoints.size()) + " mirrors returned no usable sources");
        }
        return outcome;
    }

private:
    struct RaceState {
        mutex guard;
        condition_variable cv;
        CancelToken cancel;
        bool closed = false;
        int winnerIndex = -1;
        vector<VideoSource> winningSources;
        size_t finished = 0;
        int discarded = 0;
    };

    void runProbe(RaceState& state, const MirrorResponseParser& parser, const MirrorProbe& probe,
        chrono::milliseconds timeout) {
        vector<VideoSource> accepted;
        try {
            FetchResult fetched = fetcher_.fetch(probe.derivedUrl, maxBytes_, timeout, &state.cancel);
            if (fetched.ok) {
                vector<CandidateSource> candidates = parser(fetched.body, probe);
                for (auto& c : candidates) {
                    string absolute = resolveUrl(probe.derivedUrl, c.url);
                    if (!absolute.empty()) c.url = absolute;
                }
                accepted = validator_.admitAll(candidates, "mirror " + to_string(probe.serverIndex));
            }
            else if (!fetched.cancelled) {
                logDebug("MirrorRace", "Server " + to_string(probe.serverIndex) + " failed: " + fetched.error);
            }
        }
        catch (const exception& e) {
            logError("MirrorRace", "Server " + to_string(probe.serverIndex) + " probe faulted: " + e.what());
            accepted.clear();
        }

        bool won = false;
        {
            lock_guard<mutex> lock(state.guard);
            ++state.finished;
            if (!accepted.empty()) {
                if (state.closed || state.winnerIndex >= 0) {
                    ++state.discarded;
                    logDebug("MirrorRace", "Discarding late result from server " + to_string(probe.serverIndex));
                }
                else {
                    state.winnerIndex = probe.serverIndex;
                    state.winningSources = accepted;
                    won = true;
                }
            }
        }
        state.cv.notify_all();
        if (won) state.cancel.cancel();
    }

    HttpFetcher& fetcher_;
    const SecurityValidator& validator_;
    size_t maxBytes_;
};
