#pragma once

#include <optional>
#include <termios.h>
#include <signal.h>
#include <core/types.hpp>

namespace platform {

struct TerminalSize {
    int width;
    int height;
};

// Saved line discipline of a terminal.
struct TerminalState {
    struct termios attrs;
};

// The controlling terminal, as seen by the mode manager. Abstract so the
// raw/cooked state machine can run against a fake in tests.
class TerminalDevice {
public:
    virtual ~TerminalDevice() = default;

    virtual Result<TerminalState> get_state() = 0;
    virtual Result<void> set_state(const TerminalState& state) = 0;

    // Switch to cfmakeraw discipline (no echo, no line editing, no signals).
    virtual Result<void> make_raw() = 0;

    // Current window size, or nullopt when it cannot be queried.
    virtual std::optional<TerminalSize> size() = 0;
};

// termios-backed terminal on a file descriptor (stdin by default).
class PosixTerminal : public TerminalDevice {
public:
    explicit PosixTerminal(int fd = 0, int size_fd = 1);

    Result<TerminalState> get_state() override;
    Result<void> set_state(const TerminalState& state) override;
    Result<void> make_raw() override;
    std::optional<TerminalSize> size() override;

private:
    int fd_;
    int size_fd_;
};

// Read end of a process-wide self-pipe that receives one byte per SIGWINCH.
// The handler is installed on first use and kept for the process lifetime.
// Returns -1 where resize notifications are unavailable.
int resize_signal_fd();

// Self-pipe for a POSIX signal while the object is alive: the handler writes
// one byte, readers poll fd(). The previous disposition is restored on
// destruction. One instance per signal at a time.
class SignalPipe {
public:
    explicit SignalPipe(int signo);
    ~SignalPipe();

    SignalPipe(const SignalPipe&) = delete;
    SignalPipe& operator=(const SignalPipe&) = delete;

    int fd() const { return read_fd_; }
    bool valid() const { return read_fd_ >= 0; }

    // Discard pending notifications.
    void drain();

private:
    int signo_;
    int read_fd_ = -1;
    int write_fd_ = -1;
    struct sigaction old_action_;
    bool installed_ = false;
};

} // namespace platform
