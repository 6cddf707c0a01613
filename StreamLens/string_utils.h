#pragma once

#include <string>
#include <vector>
#include <cctype>
#include <cstdio>
#include <algorithm>

using namespace std;

inline string toLowerStr(const string& s) {
    string r(s);
    transform(r.begin(), r.end(), r.begin(), [](unsigned char c) { return (char)tolower(c); });
    return r;
}

inline string trimWhitespace(const string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == string::npos) return string();
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline bool startsWithNoCase(const string& s, const string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (tolower((unsigned char)s[i]) != tolower((unsigned char)prefix[i])) return false;
    }
    return true;
}

inline bool endsWithStr(const string& s, const string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline string replaceAllStr(string s, const string& from, const string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

// "https:\/\/cdn.example\/a.mp4" as found inside JSON or JS string literals.
inline string unescapeJsSlashes(const string& s) {
    return replaceAllStr(s, "\\/", "/");
}

inline string urlEncode(const string& str) {
    string encoded;
    char hex[8];
    for (unsigned char c : str) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back((char)c);
        }
        else {
            snprintf(hex, sizeof(hex), "%%%02X", c);
            encoded += hex;
        }
    }
    return encoded;
}

inline int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Malformed escapes are copied through unchanged.
inline string urlDecode(const string& str) {
    string decoded;
    decoded.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '%' && i + 2 < str.size()) {
            int hi = hexDigitValue(str[i + 1]);
            int lo = hexDigitValue(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back((char)(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        if (c == '+') {
            decoded.push_back(' ');
            continue;
        }
        decoded.push_back(c);
    }
    return decoded;
}
