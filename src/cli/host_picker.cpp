#include "host_picker.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

Result<SessionMode> parse_mode(const std::string& text) {
    std::string m = to_lower(text);
    trim(m);
    if (m == "ssh") return Result<SessionMode>::Ok(SessionMode::SSH);
    if (m == "sftp") return Result<SessionMode>::Ok(SessionMode::SFTP);
    return Result<SessionMode>::Err("unknown mode: " + text);
}

const char* mode_name(SessionMode mode) {
    return mode == SessionMode::SFTP ? "sftp" : "ssh";
}

std::vector<const HostConfig*> filter_hosts(const std::vector<HostConfig>& hosts,
                                            const std::string& query) {
    std::string q = to_lower(query);
    std::vector<const HostConfig*> out;
    for (const auto& h : hosts) {
        if (q.empty() || to_lower(h.name).find(q) != std::string::npos
            || to_lower(h.host).find(q) != std::string::npos) {
            out.push_back(&h);
        }
    }
    return out;
}

HostPicker::HostPicker(const Config& config, LineReader& reader, std::ostream& out)
    : config_(config), reader_(reader), out_(out) {}

void HostPicker::show(const std::vector<const HostConfig*>& entries) const {
    std::string title = "Hosts";
    for (const auto& p : path_) title += " / " + p;
    if (!filter_.empty()) title += "  " + theme::dim("(filter: " + filter_ + ")");
    out_ << theme::section(title);

    if (entries.empty()) {
        out_ << theme::dim("    no matching hosts") << "\n";
    }
    for (size_t i = 0; i < entries.size(); i++) {
        const HostConfig* h = entries[i];
        std::string detail = h->is_group()
            ? fmt::format("({} hosts)", h->children.size())
            : fmt::format("{}@{}", h->user, h->address());
        if (!h->jump.empty()) detail += fmt::format("  via {} jump", h->jump.size());
        std::string name = h->is_group() ? h->name + "/" : h->name;
        out_ << fmt::format("  {:>3}) ", i + 1) << theme::bold(fmt::format("{:<24}", name))
             << theme::dim(detail) << "\n";
    }
    out_ << "\n" << theme::dim("    number to select, .. to go up, /text to filter, q to quit") << "\n"
         << std::flush;
}

Result<HostSelection> HostPicker::run() {
    HostSelection quit;
    quit.quit = true;

    bool redraw = true;
    for (;;) {
        const auto* level = config_.hosts_at_path(path_);
        if (!level) {
            // config changed under a stale path; start over
            path_.clear();
            level = &config_.hosts();
        }
        auto entries = filter_hosts(*level, filter_);
        if (redraw) show(entries);
        redraw = false;

        auto line = reader_.read_line("select> ");
        if (!line) return Result<HostSelection>::Ok(quit);

        std::string input = *line;
        trim(input);
        if (input.empty()) {
            redraw = true;
            continue;
        }
        if (input == "q" || input == "quit" || input == "exit") {
            return Result<HostSelection>::Ok(quit);
        }
        if (input == "..") {
            if (path_.empty()) {
                out_ << theme::info("Already at the top level.");
            } else {
                path_.pop_back();
                filter_.clear();
                redraw = true;
            }
            continue;
        }
        if (input[0] == '/') {
            filter_ = input.substr(1);
            trim(filter_);
            redraw = true;
            continue;
        }

        int choice = safe_stoi(input, 0);
        if (choice < 1 || static_cast<size_t>(choice) > entries.size()) {
            out_ << theme::fail("Invalid selection: " + input);
            continue;
        }

        const HostConfig* picked = entries[choice - 1];
        if (picked->is_group()) {
            path_.push_back(picked->name);
            filter_.clear();
            redraw = true;
            continue;
        }

        for (;;) {
            auto answer = reader_.read_line(fmt::format("Connect to {} with [ssh/sftp] (ssh): ", picked->name));
            if (!answer) return Result<HostSelection>::Ok(quit);
            std::string a = *answer;
            trim(a);
            if (a.empty()) a = "ssh";
            auto mode = parse_mode(a);
            if (mode.is_err()) {
                out_ << theme::fail(mode.error);
                continue;
            }
            HostSelection sel;
            sel.host = picked;
            sel.mode = mode.value;
            return Result<HostSelection>::Ok(sel);
        }
    }
}
