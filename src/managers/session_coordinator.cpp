#include "session_coordinator.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

namespace {

// Completion signals shared with the worker threads. Either side may
// outlive the coordinator's stack frame, so it lives on the heap.
struct Latch {
    std::mutex mutex;
    std::condition_variable cv;
    bool session_done = false;
    bool input_done = false;
    int exit_status = -1;
    std::string session_error;

    void mark_session(int status, const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            session_done = true;
            exit_status = status;
            session_error = error;
        }
        cv.notify_all();
    }

    void mark_input() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            input_done = true;
        }
        cv.notify_all();
    }

    template <typename Pred>
    bool wait_for(std::chrono::milliseconds timeout, Pred pred) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, pred);
    }

    template <typename Pred>
    void wait(Pred pred) {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, pred);
    }
};

// Copies local input to the session until EOF, an error, or stop(). The
// wake pipe lets stop() break a poll on the input descriptor.
class InputPump {
public:
    InputPump(int input_fd, std::shared_ptr<RemoteSession> session, std::shared_ptr<Latch> latch)
        : input_fd_(input_fd), session_(std::move(session)), latch_(std::move(latch)) {
        if (!platform::make_pipe(wake_)) {
            sshm_log("input pump: wake pipe unavailable");
        }
    }

    ~InputPump() {
        platform::close_fd(wake_[0]);
        platform::close_fd(wake_[1]);
    }

    void stop() {
        stopped_ = true;
        if (wake_[1] >= 0) {
            char b = 1;
            if (!platform::write_all(wake_[1], &b, 1)) {
                sshm_log("input pump: wake write failed");
            }
        }
    }

    void run() {
        char buf[SSH_READ_BUF_SIZE];
        while (!stopped_) {
            struct pollfd fds[2];
            fds[0] = {input_fd_, POLLIN, 0};
            fds[1] = {wake_[0], POLLIN, 0};
            int nfds = wake_[0] >= 0 ? 2 : 1;
            int ret = poll(fds, nfds, -1);
            if (ret < 0) {
                if (errno == EINTR) continue;
                sshm_log("input pump poll failed");
                break;
            }
            if (stopped_ || (nfds == 2 && fds[1].revents)) break;
            if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t n = ::read(input_fd_, buf, sizeof(buf));
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
            if (n <= 0) break;

            auto w = session_->write_input(buf, static_cast<size_t>(n));
            if (w.is_err()) {
                sshm_log("stdin forward: " + w.error);
                break;
            }
        }

        auto r = session_->close_input();
        if (r.is_err()) sshm_log(r.error);
        latch_->mark_input();
    }

private:
    int input_fd_;
    std::shared_ptr<RemoteSession> session_;
    std::shared_ptr<Latch> latch_;
    int wake_[2] = {-1, -1};
    std::atomic<bool> stopped_{false};
};

// Runs a cleanup once when the scope unwinds.
class OnExit {
public:
    explicit OnExit(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~OnExit() { fn_(); }

    OnExit(const OnExit&) = delete;
    OnExit& operator=(const OnExit&) = delete;

private:
    std::function<void()> fn_;
};

} // namespace

SessionCoordinator::SessionCoordinator(TerminalManager& terminal, CoordinatorOptions options)
    : terminal_(terminal), options_(std::move(options)) {}

Result<void> SessionCoordinator::run(std::shared_ptr<RemoteSession> session) {
    state_ = SessionState::CREATED;
    exit_status_ = -1;

    auto size = terminal_.size();
    auto pty = session->request_pty(options_.term_type, size.width, size.height);
    if (pty.is_err()) {
        auto c = session->close();
        if (c.is_err()) sshm_log(c.error);
        return Result<void>::Err("request pty: " + pty.error, pty.code);
    }
    state_ = SessionState::PTY_REQUESTED;

    session->set_output(options_.output_fd, options_.error_fd);

    auto shell = session->start_shell();
    if (shell.is_err()) {
        auto c = session->close();
        if (c.is_err()) sshm_log(c.error);
        return Result<void>::Err("start shell: " + shell.error, shell.code);
    }
    state_ = SessionState::SHELL_STARTED;

    // Both workers start before raw mode.
    auto latch = std::make_shared<Latch>();
    auto pump = std::make_shared<InputPump>(options_.input_fd, session, latch);
    std::thread input_thread([pump] { pump->run(); });
    std::thread watcher([session, latch] {
        auto r = session->wait();
        latch->mark_session(r.is_ok() ? r.value : -1, r.is_ok() ? "" : r.error);
    });

    // Join the watcher (it always finishes once the session is closed);
    // the stdin copier gets a bounded wait and is detached if still blocked.
    bool workers_finished = false;
    auto finish_workers = [&] {
        if (workers_finished) return;
        workers_finished = true;
        pump->stop();
        if (!latch->wait_for(options_.input_drain_timeout, [&] { return latch->input_done; })) {
            sshm_log("stdin copier still running; detaching");
        }
        bool input_done;
        {
            std::lock_guard<std::mutex> lock(latch->mutex);
            input_done = latch->input_done;
        }
        if (input_done) input_thread.join();
        else input_thread.detach();
        watcher.join();
    };

    // A throw past this point must not leave joinable threads behind
    OnExit unwind([&] {
        if (workers_finished) return;
        auto c = session->close();
        if (c.is_err()) sshm_log(c.error);
        finish_workers();
    });

    RawModeScope raw(terminal_, session);
    if (!raw.entered()) {
        auto c = session->close();
        if (c.is_err()) sshm_log(c.error);
        finish_workers();
        state_ = SessionState::TERMINATING;
        return Result<void>::Err("enter raw mode: " + raw.result().error, raw.result().code);
    }
    state_ = SessionState::RUNNING;

    latch->wait([&] { return latch->session_done || latch->input_done; });

    bool session_first;
    {
        std::lock_guard<std::mutex> lock(latch->mutex);
        session_first = latch->session_done;
    }
    state_ = SessionState::TERMINATING;

    Result<void> restored = Result<void>::Ok();
    if (session_first) {
        // Restore first: it is what unblocks a pending terminal read
        restored = terminal_.restore();
        auto c = session->close_input();
        if (c.is_err()) sshm_log(c.error);
        finish_workers();
    } else {
        if (!latch->wait_for(options_.session_grace, [&] { return latch->session_done; })) {
            sshm_log("remote shell still running after stdin EOF; closing");
            auto c = session->close();
            if (c.is_err()) sshm_log(c.error);
        }
        latch->wait([&] { return latch->session_done; });
        restored = terminal_.restore();
        finish_workers();
    }

    auto closed = session->close();
    if (closed.is_err()) sshm_log(closed.error);

    {
        std::lock_guard<std::mutex> lock(latch->mutex);
        exit_status_ = latch->exit_status;
        if (!latch->session_error.empty()) {
            sshm_log("session ended with error: " + latch->session_error);
        }
    }

    if (restored.is_err()) {
        return Result<void>::Err(restored.error, ErrorCode::RESTORE_FAILED);
    }
    return Result<void>::Ok();
}
