#pragma once

#include <map>
#include <mutex>
#include <chrono>
#include <atomic>
#include <functional>
#include <condition_variable>

using namespace std;

// Shared cancellation signal for one race (or any group of fetches).
// cancel() is idempotent; callbacks run once, on the cancelling thread.
// removeCallback() returns only after any running callback has finished,
// so a fetcher may free the resource its callback touches right afterwards.
class CancelToken {
public:
    CancelToken() : cancelled_(false), nextId_(0) {}
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    bool isCancelled() const { return cancelled_.load(); }

    void cancel() {
        lock_guard<mutex> lock(mutex_);
        if (cancelled_.exchange(true)) return;
        cv_.notify_all();
        for (auto& cb : callbacks_) {
            cb.second();
        }
        callbacks_.clear();
    }

    // Blocks for at most 'duration'; returns true if cancelled meanwhile.
    bool waitFor(chrono::milliseconds duration) const {
        unique_lock<mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

    // Registers a wake-up hook. If already cancelled the hook runs immediately
    // and -1 is returned.
    int addCallback(function<void()> cb) {
        unique_lock<mutex> lock(mutex_);
        if (cancelled_.load()) {
            lock.unlock();
            cb();
            return -1;
        }
        int id = nextId_++;
        callbacks_[id] = std::move(cb);
        return id;
    }

    void removeCallback(int id) {
        if (id < 0) return;
        lock_guard<mutex> lock(mutex_);
        callbacks_.erase(id);
    }

private:
    atomic<bool> cancelled_;
    mutable mutex mutex_;
    mutable condition_variable cv_;
    map<int, function<void()>> callbacks_;
    int nextId_;
};
