#pragma once

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "line_reader.hpp"
#include <managers/path_state.hpp>
#include <managers/transfer_engine.hpp>
#include <platform/terminal.hpp>
#include <sftp/remote_fs.hpp>

class SftpShell;

// Forward declarations for command registration
void register_navigation_commands(SftpShell& shell);
void register_transfer_commands(SftpShell& shell);

// Interactive file-transfer shell over one RemoteFs. Runs in cooked mode.
// Ordinary commands run inline; transfer commands run on a worker thread
// that Ctrl+C cancels.
class SftpShell {
public:
    using Args = std::vector<std::string>;
    using CommandHandler = std::function<Result<void>(SftpShell&, const Args&)>;
    using TransferHandler = std::function<Result<void>(SftpShell&, const Args&, const CancelToken&)>;

    SftpShell(RemoteFs& remote, PathState& paths, std::string user, std::string host,
              TransferProgress* progress = nullptr,
              std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& args_help, const std::string& help);
    void add_transfer_command(const std::string& name, TransferHandler handler,
                              const std::string& args_help, const std::string& help);

    // Read-eval loop until exit or end of input. Ctrl+C is caught for the
    // duration and only cancels transfers.
    Result<void> run(LineReader& reader);

    // Run one line. Returns false when the shell should exit.
    bool execute_line(const std::string& line);

    void request_exit() { exit_requested_ = true; }
    bool exit_requested() const { return exit_requested_; }

    std::string prompt() const;
    void print_help();

    RemoteFs& remote() { return remote_; }
    PathState& paths() { return paths_; }
    std::ostream& out() { return out_; }

    // Engine reporting progress to this shell's bar and messages to out().
    TransferEngine engine();

private:
    struct Command {
        CommandHandler handler;
        TransferHandler transfer;
        std::string args_help;
        std::string help;
    };

    RemoteFs& remote_;
    PathState& paths_;
    std::string user_;
    std::string host_;
    TransferProgress* progress_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex out_mutex_;   // main thread and transfer worker both write out_
    std::map<std::string, Command> commands_;
    std::unique_ptr<platform::SignalPipe> sigint_;
    bool exit_requested_ = false;

    Result<void> run_transfer(const TransferHandler& handler, const Args& args);
    void report(const Result<void>& result);
};
