#include "tunnel.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

// Stop reading a side once this much is queued for the other.
static constexpr size_t MAX_PENDING = 1024 * 1024;

Result<std::unique_ptr<TunnelStream>> TunnelStream::open(const SshIo& outer,
                                                         const std::string& host, int port) {
    LIBSSH2_CHANNEL* ch = ssh_retry_ptr<LIBSSH2_CHANNEL>(outer, [&] {
        return libssh2_channel_direct_tcpip_ex(outer.session, host.c_str(), port,
                                               "127.0.0.1", 22);
    });
    if (!ch) {
        return Result<std::unique_ptr<TunnelStream>>::Err(
            ssh_error(outer, fmt::format("dial through proxy to {}:{}", host, port)),
            ErrorCode::CONNECTION);
    }

    socket_t sv[2];
    auto pair = platform::make_socketpair(sv);
    if (pair.is_err()) {
        std::lock_guard<std::mutex> lock(*outer.mutex);
        if (outer.is_alive()) libssh2_channel_free(ch);
        return Result<std::unique_ptr<TunnelStream>>::Err(pair.error, pair.code);
    }

    std::unique_ptr<TunnelStream> stream(new TunnelStream(outer, ch, sv[0], sv[1]));
    stream->thread_ = std::thread([s = stream.get()] { s->pump(); });
    sshm_log(fmt::format("tunnel to {}:{} open", host, port));
    return Result<std::unique_ptr<TunnelStream>>::Ok(std::move(stream));
}

TunnelStream::TunnelStream(SshIo outer, LIBSSH2_CHANNEL* channel,
                           socket_t pump_fd, socket_t local_fd)
    : outer_(std::move(outer)), channel_(channel), pump_fd_(pump_fd), local_fd_(local_fd) {}

TunnelStream::~TunnelStream() {
    close();
}

void TunnelStream::close() {
    stop_ = true;
    if (thread_.joinable()) thread_.join();

    if (channel_) {
        std::lock_guard<std::mutex> lock(*outer_.mutex);
        if (outer_.is_alive()) {
            libssh2_channel_close(channel_);
            libssh2_channel_free(channel_);
        }
        channel_ = nullptr;
    }
    if (pump_fd_ != SSHM_INVALID_SOCKET) {
        platform::close_socket(pump_fd_);
        pump_fd_ = SSHM_INVALID_SOCKET;
    }
    if (local_fd_ != SSHM_INVALID_SOCKET) {
        platform::close_socket(local_fd_);
        local_fd_ = SSHM_INVALID_SOCKET;
    }
}

void TunnelStream::pump() {
    char buf[SSH_READ_BUF_SIZE];
    std::string to_local;
    std::string to_remote;
    bool remote_eof = false;
    bool local_eof = false;
    bool local_shut = false;
    bool eof_sent = false;

    while (!stop_.load()) {
        struct pollfd fds[2];
        fds[0] = {outer_.sock, POLLIN, 0};
        fds[1] = {pump_fd_, POLLIN, 0};
        if (!to_remote.empty()) fds[0].events |= POLLOUT;
        if (!to_local.empty()) fds[1].events |= POLLOUT;
        poll(fds, 2, SOCKET_WAIT_SLICE_MS);

        // channel -> local. Read every pass: another thread may already have
        // pulled this channel's data off the outer socket.
        if (!remote_eof && to_local.size() < MAX_PENDING) {
            for (;;) {
                ssize_t n;
                bool eof = false;
                {
                    std::lock_guard<std::mutex> lock(*outer_.mutex);
                    if (!outer_.is_alive()) return;
                    n = libssh2_channel_read(channel_, buf, sizeof(buf));
                    if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) eof = libssh2_channel_eof(channel_) != 0;
                }
                if (n > 0) {
                    to_local.append(buf, static_cast<size_t>(n));
                    if (to_local.size() >= MAX_PENDING) break;
                    continue;
                }
                if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                    sshm_log(fmt::format("tunnel read failed ({})", n));
                    remote_eof = true;
                }
                if (eof) remote_eof = true;
                break;
            }
        }

        if (!to_local.empty()) {
            ssize_t w = ::write(pump_fd_, to_local.data(), to_local.size());
            if (w > 0) {
                to_local.erase(0, static_cast<size_t>(w));
            } else if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                return;
            }
        }
        if (remote_eof && to_local.empty() && !local_shut) {
            shutdown(pump_fd_, SHUT_WR);
            local_shut = true;
        }

        // local -> channel
        if (!local_eof && to_remote.size() < MAX_PENDING) {
            ssize_t n = ::read(pump_fd_, buf, sizeof(buf));
            if (n > 0) {
                to_remote.append(buf, static_cast<size_t>(n));
            } else if (n == 0) {
                local_eof = true;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                local_eof = true;
            }
        }

        if (!to_remote.empty()) {
            ssize_t w;
            {
                std::lock_guard<std::mutex> lock(*outer_.mutex);
                if (!outer_.is_alive()) return;
                w = libssh2_channel_write(channel_, to_remote.data(), to_remote.size());
            }
            if (w > 0) {
                to_remote.erase(0, static_cast<size_t>(w));
            } else if (w < 0 && w != LIBSSH2_ERROR_EAGAIN) {
                sshm_log(fmt::format("tunnel write failed ({})", w));
                return;
            }
        }
        if (local_eof && to_remote.empty() && !eof_sent) {
            std::lock_guard<std::mutex> lock(*outer_.mutex);
            if (!outer_.is_alive()) return;
            int rc = libssh2_channel_send_eof(channel_);
            if (rc != LIBSSH2_ERROR_EAGAIN) eof_sent = true;
        }

        if (local_shut && eof_sent) return;
    }
}
