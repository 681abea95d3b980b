#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Milliseconds since the epoch.
int64_t now_ms();

// Whole-string decimal parse; fallback on junk, trailing text or overflow.
int safe_stoi(const std::string& s, int fallback = 0);

// Base64 encode (standard alphabet, with padding).
std::string base64_encode(const std::string& input);

// Expand a leading "~" to the local home directory.
std::string expand_path(const std::string& path);

// "rwxr-xr-x" from the low nine permission bits.
std::string format_permissions(uint32_t mode);

// Split on any whitespace, dropping empty fields.
std::vector<std::string> split_ws(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
