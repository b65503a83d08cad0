#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <unistd.h>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "terminal_manager.hpp"

enum class SessionState {
    CREATED,
    PTY_REQUESTED,
    SHELL_STARTED,
    RUNNING,
    TERMINATING,
};

struct CoordinatorOptions {
    int input_fd = STDIN_FILENO;
    int output_fd = STDOUT_FILENO;
    int error_fd = STDERR_FILENO;
    std::string term_type = DEFAULT_TERM_TYPE;
    std::chrono::milliseconds input_drain_timeout{INPUT_DRAIN_TIMEOUT_MS};
    std::chrono::milliseconds session_grace{SESSION_GRACE_MS};
};

// Runs one interactive remote shell on the local terminal.
//
// Ordering matters: the stdin copier and the completion watcher start
// before raw mode is entered, so a remote shell that exits at once cannot
// race the mode switch. When the remote side finishes first the terminal is
// restored before stdin forwarding is shut down; when local input ends
// first the session gets a short grace period and is then force-closed.
// The terminal is restored on every return path. The remote exit status is
// not an error.
class SessionCoordinator {
public:
    explicit SessionCoordinator(TerminalManager& terminal, CoordinatorOptions options = {});

    Result<void> run(std::shared_ptr<RemoteSession> session);

    SessionState state() const { return state_.load(); }

    // Exit status of the last remote shell, -1 if unknown.
    int exit_status() const { return exit_status_; }

private:
    TerminalManager& terminal_;
    CoordinatorOptions options_;
    std::atomic<SessionState> state_{SessionState::CREATED};
    int exit_status_ = -1;
};
