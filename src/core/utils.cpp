#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <sstream>

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream iss(line);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes) / 1024.0;
    int unit = 0;
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        unit++;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}

std::string format_mode(uint32_t mode) {
    std::string s(10, '-');
    if (S_ISDIR(mode)) s[0] = 'd';
    else if (S_ISLNK(mode)) s[0] = 'l';
    else if (S_ISCHR(mode)) s[0] = 'c';
    else if (S_ISBLK(mode)) s[0] = 'b';
    else if (S_ISFIFO(mode)) s[0] = 'p';
    else if (S_ISSOCK(mode)) s[0] = 's';

    const char* rwx = "rwxrwxrwx";
    for (int i = 0; i < 9; i++) {
        if (mode & (1u << (8 - i))) s[i + 1] = rwx[i];
    }
    return s;
}

std::string format_mtime(std::time_t t) {
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%b %d %H:%M", &tm_buf);
    return std::string(buf);
}

std::string expand_home(const std::string& path) {
    if (path == "~") {
        return platform::home_dir().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}
