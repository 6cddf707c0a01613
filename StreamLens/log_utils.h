#pragma once

#include <string>
#include <mutex>
#include <functional>
#include <iostream>
#include <cstdlib>

using namespace std;

// Every line is written as "[tag] message" under one mutex so that mirror
// probe threads never interleave their output.
// Everything goes to stderr; stdout is reserved for the CLI's JSON output.
// Debug lines are emitted only when STREAMLENS_DEBUG is set.

enum class LogLevel { Debug, Info, Warn, Error };

typedef function<void(LogLevel, const string&)> LogSink;

inline mutex& logMutex() {
    static mutex m;
    return m;
}

inline LogSink& logSinkSlot() {
    static LogSink sink;
    return sink;
}

// Test-only: receives every emitted line (in addition to the console).
// Pass nullptr to clear.
inline void setLogSink(LogSink sink) {
    lock_guard<mutex> lock(logMutex());
    logSinkSlot() = std::move(sink);
}

inline void logLine(LogLevel level, const string& tag, const string& message) {
    if (level == LogLevel::Debug && getenv("STREAMLENS_DEBUG") == nullptr) return;
    string line = "[" + tag + "] " + message;
    lock_guard<mutex> lock(logMutex());
    if (logSinkSlot()) {
        logSinkSlot()(level, line);
    }
    cerr << line << '\n';
    cerr.flush();
}

inline void logDebug(const string& tag, const string& message) { logLine(LogLevel::Debug, tag, message); }
inline void logInfo(const string& tag, const string& message) { logLine(LogLevel::Info, tag, message); }
inline void logWarn(const string& tag, const string& message) { logLine(LogLevel::Warn, tag, message); }
inline void logError(const string& tag, const string& message) { logLine(LogLevel::Error, tag, message); }
