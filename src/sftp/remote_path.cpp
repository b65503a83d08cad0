#include "remote_path.hpp"
#include <vector>

std::string clean_remote_path(const std::string& path) {
    if (path.empty()) return ".";

    bool absolute = path[0] == '/';
    std::vector<std::string> parts;

    size_t i = 0;
    while (i <= path.size()) {
        size_t next = path.find('/', i);
        if (next == std::string::npos) next = path.size();
        std::string seg = path.substr(i, next - i);
        i = next + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back("..");
            }
            continue;
        }
        parts.push_back(seg);
    }

    std::string out = absolute ? "/" : "";
    for (size_t k = 0; k < parts.size(); k++) {
        if (k > 0) out += "/";
        out += parts[k];
    }
    if (out.empty()) return ".";
    return out;
}

std::string join_remote_path(const std::string& base, const std::string& rel) {
    if (rel.empty()) return clean_remote_path(base);
    if (rel[0] == '/') return clean_remote_path(rel);
    if (base.empty()) return clean_remote_path(rel);
    return clean_remote_path(base + "/" + rel);
}

std::string remote_basename(const std::string& path) {
    std::string p = clean_remote_path(path);
    if (p == "/") return "/";
    auto pos = p.rfind('/');
    if (pos == std::string::npos) return p;
    return p.substr(pos + 1);
}

std::string remote_dirname(const std::string& path) {
    std::string p = clean_remote_path(path);
    auto pos = p.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}
