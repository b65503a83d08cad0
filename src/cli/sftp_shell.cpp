#include "sftp_shell.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <future>
#include <mutex>
#include <thread>
#include <poll.h>

SftpShell::SftpShell(RemoteFs& remote, PathState& paths, std::string user, std::string host,
                     TransferProgress* progress, std::ostream& out, std::ostream& err)
    : remote_(remote), paths_(paths), user_(std::move(user)), host_(std::move(host)),
      progress_(progress), out_(out), err_(err) {
    add_command("help", [](SftpShell& sh, const Args&) {
        sh.print_help();
        return Result<void>::Ok();
    }, "", "Show this help message");
    commands_["?"] = commands_["help"];

    auto leave = [](SftpShell& sh, const Args&) {
        sh.request_exit();
        return Result<void>::Ok();
    };
    add_command("exit", leave, "", "Exit SFTP shell");
    add_command("quit", leave, "", "Exit SFTP shell (alias)");
    add_command("bye", leave, "", "Exit SFTP shell (alias)");

    register_navigation_commands(*this);
    register_transfer_commands(*this);
}

void SftpShell::add_command(const std::string& name, CommandHandler handler,
                            const std::string& args_help, const std::string& help) {
    commands_[name] = {std::move(handler), nullptr, args_help, help};
}

void SftpShell::add_transfer_command(const std::string& name, TransferHandler handler,
                                     const std::string& args_help, const std::string& help) {
    commands_[name] = {nullptr, std::move(handler), args_help, help};
}

std::string SftpShell::prompt() const {
    return theme::rl_esc(theme::color::BOLD_GREEN)
         + fmt::format("sftp {}@{}:{}>", user_, host_, paths_.remote_cwd())
         + theme::rl_esc(theme::color::RESET) + " ";
}

TransferEngine SftpShell::engine() {
    return TransferEngine(remote_, progress_, [this](const std::string& msg) {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << msg << "\n" << std::flush;
    });
}

Result<void> SftpShell::run(LineReader& reader) {
    out_ << "SFTP shell started. Type 'help' for commands.\n";
    out_ << "Press Ctrl+C to interrupt file transfers.\n" << std::flush;

    sigint_ = std::make_unique<platform::SignalPipe>(SIGINT);
    if (!sigint_->valid()) {
        sshm_log("sftp shell: SIGINT pipe unavailable, transfers are not interruptible");
    }

    exit_requested_ = false;
    while (!exit_requested_) {
        auto line = reader.read_line(prompt());
        if (!line) {
            out_ << "\n";
            break;
        }
        if (!execute_line(*line)) break;
    }

    sigint_.reset();
    return Result<void>::Ok();
}

bool SftpShell::execute_line(const std::string& line) {
    auto words = split_words(line);
    if (words.empty()) return true;

    std::string name = to_lower(words[0]);
    Args args(words.begin() + 1, words.end());

    auto it = commands_.find(name);
    if (it == commands_.end()) {
        err_ << "Error: unknown command: " << name << "\n" << std::flush;
        return true;
    }

    const Command& cmd = it->second;
    Result<void> result = cmd.transfer ? run_transfer(cmd.transfer, args)
                                       : cmd.handler(*this, args);
    report(result);
    return !exit_requested_;
}

void SftpShell::report(const Result<void>& result) {
    if (result.is_ok()) return;
    if (result.code == ErrorCode::CANCELLED) {
        err_ << "Transfer cancelled.\n" << std::flush;
    } else {
        err_ << "Error: " << result.error << "\n" << std::flush;
    }
}

Result<void> SftpShell::run_transfer(const TransferHandler& handler, const Args& args) {
    CancelToken cancel;
    std::promise<Result<void>> done;
    auto finished = done.get_future();

    // The worker writes one byte here when it is done, so the wait below
    // sleeps on both this and the SIGINT pipe.
    int done_pipe[2] = {-1, -1};
    if (!platform::make_pipe(done_pipe)) {
        sshm_log("sftp shell: done pipe unavailable, transfer is not interruptible");
    }

    int sig_fd = sigint_ && sigint_->valid() ? sigint_->fd() : -1;
    if (sig_fd >= 0) sigint_->drain();   // stale presses from the prompt

    int done_write = done_pipe[1];
    std::thread worker([&, done_write] {
        done.set_value(handler(*this, args, cancel));
        if (done_write >= 0) {
            char b = 1;
            if (!platform::write_all(done_write, &b, 1)) {
                sshm_log("sftp shell: done pipe write failed");
            }
        }
    });

    bool interrupted = false;
    if (sig_fd < 0 || done_pipe[0] < 0) {
        finished.wait();
    } else {
        for (;;) {
            struct pollfd fds[2];
            fds[0] = {done_pipe[0], POLLIN, 0};
            fds[1] = {sig_fd, POLLIN, 0};
            int rc = ::poll(fds, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) continue;
                sshm_log(fmt::format("sftp shell: poll: {}", std::strerror(errno)));
                finished.wait();
                break;
            }
            if (fds[0].revents) break;
            if (fds[1].revents & POLLIN) {
                sigint_->drain();
                {
                    std::lock_guard<std::mutex> lock(out_mutex_);
                    out_ << "\n^C\nTransfer cancelled.\n" << std::flush;
                }
                cancel.cancel();
                interrupted = true;
                break;
            }
        }
    }

    // Wait for the cancelled transfer to unwind before the next prompt
    worker.join();
    platform::close_fd(done_pipe[0]);
    platform::close_fd(done_pipe[1]);

    Result<void> result = finished.get();
    if (interrupted && result.code == ErrorCode::CANCELLED) return Result<void>::Ok();
    return result;
}

// ── Help ────────────────────────────────────────────────────

static constexpr int CMD_WIDTH = 10;
static constexpr int ARGS_WIDTH = 20;
static constexpr int DESC_WIDTH = 35;

static std::string repeat(const std::string& s, int n) {
    std::string out;
    for (int i = 0; i < n; i++) out += s;
    return out;
}

static std::string table_line(const char* left, const char* mid, const char* right) {
    const std::string h = "\xe2\x94\x80";   // ─
    return fmt::format("  {}{}{}{}{}{}{}\n", left, repeat(h, CMD_WIDTH + 2), mid,
                       repeat(h, ARGS_WIDTH + 2), mid, repeat(h, DESC_WIDTH + 2), right);
}

static std::string table_row(const std::string& c1, const std::string& c2, const std::string& c3,
                             const std::string& color1, const std::string& color23) {
    const std::string& r = theme::color::RESET;
    return fmt::format("  \xe2\x94\x82 {}{:<{}}{} \xe2\x94\x82 {}{:<{}}{} \xe2\x94\x82 {}{:<{}}{} \xe2\x94\x82\n",
                       color1, c1, CMD_WIDTH, r, color23, c2, ARGS_WIDTH, r,
                       color23, c3, DESC_WIDTH, r);
}

void SftpShell::print_help() {
    static const std::vector<std::string> order = {
        "cd", "lcd", "pwd", "lpwd", "ls", "lls", "get", "put",
        "mkdir", "lmkdir", "help", "exit", "quit", "bye",
    };

    out_ << table_line("\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90");
    out_ << table_row("COMMAND", "ARGUMENTS", "DESCRIPTION", theme::color::GRAY, theme::color::GRAY);
    out_ << table_line("\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4");
    for (const auto& name : order) {
        auto it = commands_.find(name);
        if (it == commands_.end()) continue;
        out_ << table_row(name, it->second.args_help, it->second.help, theme::color::GREEN, "");
    }
    out_ << table_line("\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98");
    out_ << std::flush;
}
