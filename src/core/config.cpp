#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static std::vector<HostConfig> parse_host_list(const YAML::Node& node);

static HostConfig parse_host(const YAML::Node& node) {
    HostConfig h;
    h.name = node["name"].as<std::string>("");
    h.host = node["host"].as<std::string>("");
    h.user = node["user"].as<std::string>("");
    h.port = node["port"].as<int>(0);

    if (node["password"] && node["password"].IsScalar()) {
        h.password = node["password"].as<std::string>();
    }
    if (node["keypath"] && node["keypath"].IsScalar()) {
        h.key_path = node["keypath"].as<std::string>();
    }
    if (node["jump"]) {
        h.jump = parse_host_list(node["jump"]);
    }
    if (node["children"]) {
        h.children = parse_host_list(node["children"]);
    }
    if (node["callback-shells"] && node["callback-shells"].IsSequence()) {
        for (const auto& s : node["callback-shells"]) {
            h.callback_shells.push_back(s.as<std::string>());
        }
    }
    return h;
}

static std::vector<HostConfig> parse_host_list(const YAML::Node& node) {
    std::vector<HostConfig> hosts;
    if (!node.IsSequence()) {
        throw YAML::Exception(node.Mark(), "expected a list of hosts");
    }
    for (const auto& entry : node) {
        if (!entry.IsMap()) {
            throw YAML::Exception(entry.Mark(), "host entry must be a mapping");
        }
        hosts.push_back(parse_host(entry));
    }
    return hosts;
}

Result<void> validate_host(HostConfig& host) {
    std::vector<std::string> errs;

    if (host.name.empty()) {
        errs.push_back("name is required");
    }

    // Groups are containers only
    if (!host.is_group()) {
        if (host.host.empty()) errs.push_back("host is required");
        if (host.user.empty()) errs.push_back("user is required");
    }

    if (host.port == 0) {
        host.port = DEFAULT_SSH_PORT;
    }

    if (host.key_path && !host.key_path->empty()) {
        host.key_path = expand_home(*host.key_path);
    }

    if (!errs.empty()) {
        std::string joined;
        for (size_t i = 0; i < errs.size(); i++) {
            if (i > 0) joined += ", ";
            joined += errs[i];
        }
        return Result<void>::Err("host validation errors: " + joined,
                                 ErrorCode::VALIDATION_ERROR);
    }

    for (size_t i = 0; i < host.jump.size(); i++) {
        auto r = validate_host(host.jump[i]);
        if (r.is_err()) {
            return Result<void>::Err(
                fmt::format("jump #{} ({}): {}", i, host.jump[i].name, r.error),
                ErrorCode::VALIDATION_ERROR);
        }
    }
    for (size_t i = 0; i < host.children.size(); i++) {
        auto r = validate_host(host.children[i]);
        if (r.is_err()) {
            return Result<void>::Err(
                fmt::format("child #{} ({}): {}", i, host.children[i].name, r.error),
                ErrorCode::VALIDATION_ERROR);
        }
    }
    return Result<void>::Ok();
}

Result<std::vector<HostConfig>> Config::parse(const std::string& yaml_text) {
    std::vector<HostConfig> hosts;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<std::vector<HostConfig>>::Ok({});
        }
        hosts = parse_host_list(root);
    } catch (const YAML::Exception& e) {
        return Result<std::vector<HostConfig>>::Err(
            std::string("parse yaml: ") + e.what(), ErrorCode::PARSE_ERROR);
    }

    for (size_t i = 0; i < hosts.size(); i++) {
        auto r = validate_host(hosts[i]);
        if (r.is_err()) {
            return Result<std::vector<HostConfig>>::Err(
                fmt::format("validate host #{} ({}): {}", i, hosts[i].name, r.error),
                ErrorCode::VALIDATION_ERROR);
        }
    }
    return Result<std::vector<HostConfig>>::Ok(std::move(hosts));
}

Result<std::vector<HostConfig>> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<HostConfig>>::Err(
            "read config file " + path.string() + ": cannot open", ErrorCode::IO);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

std::vector<fs::path> default_config_paths() {
    std::vector<fs::path> paths;
    for (const char* name : CONFIG_FILE_NAMES) {
        paths.push_back(platform::home_dir() / name);
    }
    return paths;
}

Result<Config> Config::load(const std::string& path, StatusCallback warn) {
    if (!path.empty()) {
        fs::path expanded = expand_home(path);
        if (!fs::exists(expanded)) {
            return Result<Config>::Err("config file not found: " + expanded.string(),
                                       ErrorCode::NO_CONFIG_FOUND);
        }
        auto r = load_file(expanded);
        if (r.is_err()) {
            return Result<Config>::Err(r.error, r.code);
        }
        return Result<Config>::Ok(Config(std::move(r.value)));
    }

    std::vector<HostConfig> all;
    int loaded = 0;
    std::string tried;

    for (const auto& p : default_config_paths()) {
        if (!tried.empty()) tried += ", ";
        tried += p.string();

        if (!fs::exists(p)) continue;

        auto r = load_file(p);
        if (r.is_err()) {
            if (warn) warn(fmt::format("failed to load {}: {}", p.string(), r.error));
            continue;
        }
        for (auto& h : r.value) all.push_back(std::move(h));
        loaded++;
    }

    if (loaded == 0) {
        return Result<Config>::Err("no config files found (tried: " + tried + ")",
                                   ErrorCode::NO_CONFIG_FOUND);
    }
    return Result<Config>::Ok(Config(std::move(all)));
}

const HostConfig* Config::find_host(const std::string& path) const {
    if (path.empty()) return nullptr;

    const std::vector<HostConfig>* level = &hosts_;
    auto segments = split(path, '/');
    for (size_t i = 0; i < segments.size(); i++) {
        const HostConfig* found = nullptr;
        for (const auto& h : *level) {
            if (h.name == segments[i]) {
                found = &h;
                break;
            }
        }
        if (!found) return nullptr;
        if (i + 1 == segments.size()) return found;
        level = &found->children;
    }
    return nullptr;
}

const std::vector<HostConfig>* Config::hosts_at_path(const std::vector<std::string>& path) const {
    const std::vector<HostConfig>* level = &hosts_;
    for (const auto& segment : path) {
        const HostConfig* found = nullptr;
        for (const auto& h : *level) {
            if (h.name == segment) {
                found = &h;
                break;
            }
        }
        if (!found) return nullptr;
        level = &found->children;
    }
    return level;
}
