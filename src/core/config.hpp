#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load hosts from an explicit file, or merge ~/.sshm.yaml and
    // ~/.sshw.yaml (in that order) when path is empty.
    static Result<Config> load(const std::string& path = "",
                               StatusCallback warn = nullptr);

    // Parse and validate a single YAML document (top-level list of hosts).
    static Result<std::vector<HostConfig>> parse(const std::string& yaml_text);

    // Hosts from one file on disk.
    static Result<std::vector<HostConfig>> load_file(const fs::path& path);

    const std::vector<HostConfig>& hosts() const { return hosts_; }
    bool empty() const { return hosts_.empty(); }

    // "group/leaf" lookup through children. nullptr if any segment misses.
    const HostConfig* find_host(const std::string& path) const;

    // Entries shown at a group path; top level for an empty path.
    const std::vector<HostConfig>* hosts_at_path(const std::vector<std::string>& path) const;

    Config() = default;
    explicit Config(std::vector<HostConfig> hosts) : hosts_(std::move(hosts)) {}

private:
    std::vector<HostConfig> hosts_;
};

// Validate one host (recursing into jump and children) and normalise it:
// default port, "~" in keypath.
Result<void> validate_host(HostConfig& host);

std::vector<fs::path> default_config_paths();
