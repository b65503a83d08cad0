#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Split a command line on runs of whitespace.
std::vector<std::string> split_words(const std::string& line);

// Split on a single delimiter, keeping empty fields.
std::vector<std::string> split(const std::string& s, char delimiter);

std::string to_lower(std::string s);

// "1.50 MB" style sizes: B/KB/MB/GB/TB, two decimals above bytes.
std::string format_bytes(uint64_t bytes);

// "drwxr-xr-x" from POSIX st_mode bits.
std::string format_mode(uint32_t mode);

// "Jan 02 15:04" in local time.
std::string format_mtime(std::time_t t);

// Expand a leading "~" or "~/" against $HOME. Other forms are returned as-is.
std::string expand_home(const std::string& path);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);
