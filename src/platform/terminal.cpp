#include "terminal.hpp"
#include "platform.hpp"
#include <sys/ioctl.h>
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── PosixTerminal ────────────────────────────────────────────

PosixTerminal::PosixTerminal(int fd, int size_fd) : fd_(fd), size_fd_(size_fd) {}

Result<TerminalState> PosixTerminal::get_state() {
    TerminalState state;
    if (tcgetattr(fd_, &state.attrs) != 0) {
        return Result<TerminalState>::Err(
            "get terminal attributes: " + std::string(strerror(errno)), ErrorCode::TERMINAL);
    }
    return Result<TerminalState>::Ok(state);
}

Result<void> PosixTerminal::set_state(const TerminalState& state) {
    if (tcsetattr(fd_, TCSANOW, &state.attrs) != 0) {
        return Result<void>::Err(
            "set terminal attributes: " + std::string(strerror(errno)), ErrorCode::TERMINAL);
    }
    return Result<void>::Ok();
}

Result<void> PosixTerminal::make_raw() {
    struct termios raw;
    if (tcgetattr(fd_, &raw) != 0) {
        return Result<void>::Err(
            "get terminal attributes: " + std::string(strerror(errno)), ErrorCode::TERMINAL);
    }
    cfmakeraw(&raw);
    if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
        return Result<void>::Err(
            "enter raw mode: " + std::string(strerror(errno)), ErrorCode::TERMINAL);
    }
    return Result<void>::Ok();
}

std::optional<TerminalSize> PosixTerminal::size() {
    struct winsize ws;
    if (ioctl(size_fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        return TerminalSize{ws.ws_col, ws.ws_row};
    }
    if (ioctl(fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        return TerminalSize{ws.ws_col, ws.ws_row};
    }
    return std::nullopt;
}

// ── Signal self-pipes ────────────────────────────────────────

// Write ends indexed by signal number, read by the async handlers.
static volatile sig_atomic_t g_signal_write_fds[NSIG];
static bool g_signal_fds_init = false;

static void init_signal_fds() {
    if (g_signal_fds_init) return;
    for (int i = 0; i < NSIG; i++) g_signal_write_fds[i] = -1;
    g_signal_fds_init = true;
}

static void signal_pipe_handler(int signo) {
    int saved_errno = errno;
    int fd = g_signal_write_fds[signo];
    if (fd >= 0) {
        char b = 1;
        ssize_t ignored = ::write(fd, &b, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

int resize_signal_fd() {
#ifdef SIGWINCH
    static int read_fd = [] {
        init_signal_fds();
        int fds[2];
        if (!make_pipe(fds)) return -1;
        g_signal_write_fds[SIGWINCH] = fds[1];

        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = signal_pipe_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;
        if (sigaction(SIGWINCH, &sa, nullptr) != 0) {
            g_signal_write_fds[SIGWINCH] = -1;
            close(fds[0]);
            close(fds[1]);
            return -1;
        }
        return fds[0];
    }();
    return read_fd;
#else
    return -1;
#endif
}

SignalPipe::SignalPipe(int signo) : signo_(signo) {
    init_signal_fds();
    std::memset(&old_action_, 0, sizeof(old_action_));

    int fds[2];
    if (!make_pipe(fds)) return;
    read_fd_ = fds[0];
    write_fd_ = fds[1];
    g_signal_write_fds[signo_] = write_fd_;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_pipe_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    installed_ = sigaction(signo_, &sa, &old_action_) == 0;
}

SignalPipe::~SignalPipe() {
    if (installed_) {
        sigaction(signo_, &old_action_, nullptr);
    }
    g_signal_write_fds[signo_] = -1;
    close_fd(read_fd_);
    close_fd(write_fd_);
}

void SignalPipe::drain() {
    if (read_fd_ >= 0) drain_fd(read_fd_);
}

} // namespace platform
