#include "shell_channel.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <cstring>

ShellChannel::ShellChannel(SshIo io, LIBSSH2_CHANNEL* ch)
    : io_(std::move(io)), ch_(ch) {}

ShellChannel::~ShellChannel() {
    closing_ = true;
    if (output_thread_.joinable()) output_thread_.join();

    std::lock_guard<std::mutex> lock(*io_.mutex);
    if (ch_ && io_.is_alive()) {
        libssh2_channel_free(ch_);
    }
    ch_ = nullptr;
}

Result<void> ShellChannel::request_pty(const std::string& term, int width, int height) {
    int rc = ssh_retry(io_, [&] {
        return libssh2_channel_request_pty_ex(ch_, term.c_str(),
                                              static_cast<unsigned int>(term.size()),
                                              nullptr, 0, width, height, 0, 0);
    });
    if (rc != 0) {
        return Result<void>::Err(ssh_error(io_, "request pty"), ErrorCode::PROTOCOL);
    }
    return Result<void>::Ok();
}

void ShellChannel::set_output(int out_fd, int err_fd) {
    out_fd_ = out_fd;
    err_fd_ = err_fd;
}

Result<void> ShellChannel::start_shell() {
    int rc = ssh_retry(io_, [&] { return libssh2_channel_shell(ch_); });
    if (rc != 0) {
        return Result<void>::Err(ssh_error(io_, "start shell"), ErrorCode::PROTOCOL);
    }
    output_thread_ = std::thread(&ShellChannel::pump_output, this);
    return Result<void>::Ok();
}

Result<void> ShellChannel::write_input(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        if (closing_) {
            return Result<void>::Err("write stdin: session closed", ErrorCode::IO);
        }
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_.mutex);
            if (!io_.is_alive()) {
                return Result<void>::Err("write stdin: connection closed", ErrorCode::IO);
            }
            w = libssh2_channel_write(ch_, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            wait_socket(io_);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(ssh_error(io_, "write stdin"), ErrorCode::IO);
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

Result<void> ShellChannel::close_input() {
    if (closing_ || eof_sent_.exchange(true)) return Result<void>::Ok();
    int rc = ssh_retry(io_, [&] { return libssh2_channel_send_eof(ch_); }, 2);
    if (rc != 0) {
        return Result<void>::Err(ssh_error(io_, "close stdin"), ErrorCode::IO);
    }
    return Result<void>::Ok();
}

Result<int> ShellChannel::wait() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    if (!output_thread_.joinable() && !done_) {
        return Result<int>::Err("wait: shell not started", ErrorCode::PROTOCOL);
    }
    done_cv_.wait(lock, [this] { return done_; });
    if (!error_.empty()) {
        return Result<int>::Err(error_, ErrorCode::PROTOCOL);
    }
    return Result<int>::Ok(exit_status_);
}

Result<void> ShellChannel::close() {
    if (closing_.exchange(true)) return Result<void>::Ok();

    int rc = ssh_retry(io_, [&] { return libssh2_channel_close(ch_); }, 2);

    // The output thread notices closing_ within one poll slice
    if (!output_thread_.joinable()) finish(-1, "");

    if (rc != 0 && rc != LIBSSH2_ERROR_SOCKET_DISCONNECT) {
        return Result<void>::Err(ssh_error(io_, "close session"), ErrorCode::PROTOCOL);
    }
    return Result<void>::Ok();
}

Result<void> ShellChannel::window_change(int width, int height) {
    if (closing_) return Result<void>::Ok();
    int rc = ssh_retry(io_, [&] {
        return libssh2_channel_request_pty_size(ch_, width, height);
    }, 1);
    if (rc != 0) {
        return Result<void>::Err(ssh_error(io_, "window change"), ErrorCode::PROTOCOL);
    }
    return Result<void>::Ok();
}

void ShellChannel::finish(int status, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        if (done_) return;
        done_ = true;
        exit_status_ = status;
        error_ = error;
    }
    done_cv_.notify_all();
}

void ShellChannel::pump_output() {
    char buf[SSH_READ_BUF_SIZE];
    std::string error;

    while (!closing_) {
        bool progressed = false;
        bool eof = false;

        for (int stream : {0, SSH_EXTENDED_DATA_STDERR}) {
            ssize_t n;
            {
                std::lock_guard<std::mutex> lock(*io_.mutex);
                if (!io_.is_alive()) {
                    error = "connection closed";
                    break;
                }
                n = libssh2_channel_read_ex(ch_, stream, buf, sizeof(buf));
            }
            if (n > 0) {
                int fd = stream == 0 ? out_fd_ : err_fd_;
                if (!platform::write_all(fd, buf, static_cast<size_t>(n))) {
                    sshm_log(fmt::format("shell output write to fd {} failed", fd));
                }
                progressed = true;
            } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                error = ssh_error(io_, "read shell output");
                break;
            }
        }
        if (!error.empty()) break;

        {
            std::lock_guard<std::mutex> lock(*io_.mutex);
            if (io_.is_alive()) eof = libssh2_channel_eof(ch_) != 0;
        }
        if (eof && !progressed) break;
        if (!progressed) wait_socket(io_);
    }

    int status = -1;
    if (error.empty()) {
        std::lock_guard<std::mutex> lock(*io_.mutex);
        if (io_.is_alive()) status = libssh2_channel_get_exit_status(ch_);
    }
    if (!error.empty() && closing_) error.clear();
    sshm_log(fmt::format("shell finished status={} {}", status, error));
    finish(status, error);
}
