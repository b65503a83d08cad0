#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include "line_reader.hpp"

enum class SessionMode { SSH, SFTP };

// "ssh" / "sftp", case-insensitive.
Result<SessionMode> parse_mode(const std::string& text);
const char* mode_name(SessionMode mode);

struct HostSelection {
    bool quit = false;
    const HostConfig* host = nullptr;
    SessionMode mode = SessionMode::SSH;
};

// Entries whose name or host contains query, case-insensitively. An empty
// query keeps everything.
std::vector<const HostConfig*> filter_hosts(const std::vector<HostConfig>& hosts,
                                            const std::string& query);

// Numbered host menu over the config tree. Numbers enter groups or pick a
// leaf, ".." goes up, "/text" filters the current level, "q" quits.
class HostPicker {
public:
    HostPicker(const Config& config, LineReader& reader, std::ostream& out = std::cout);

    Result<HostSelection> run();

private:
    const Config& config_;
    LineReader& reader_;
    std::ostream& out_;
    std::vector<std::string> path_;
    std::string filter_;

    void show(const std::vector<const HostConfig*>& entries) const;
};
