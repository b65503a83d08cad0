#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <libssh2.h>
#include <core/constants.hpp>
#include <platform/socket_util.hpp>

// What every libssh2 call needs: the session, the socket it runs on and the
// mutex that serialises access to the session across threads. `alive` is
// cleared (under the mutex) just before the session is freed; channels and
// SFTP handles that outlive their transport check it before each call.
struct SshIo {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = SSHM_INVALID_SOCKET;
    std::shared_ptr<std::mutex> mutex;
    std::shared_ptr<std::atomic<bool>> alive;

    bool is_alive() const { return alive && alive->load(); }
};

// Block until the socket is ready in the direction libssh2 is waiting for,
// or timeout_ms elapses.
inline void wait_socket(const SshIo& io, int timeout_ms = SOCKET_WAIT_SLICE_MS) {
    int dir = 0;
    {
        std::lock_guard<std::mutex> lock(*io.mutex);
        if (io.is_alive()) dir = libssh2_session_block_directions(io.session);
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(io.sock, events, timeout_ms);
}

// Run an int-returning libssh2 call until it stops returning EAGAIN. The
// mutex is held only for each attempt, never while waiting.
template <typename Fn>
int ssh_retry(const SshIo& io, Fn fn, int timeout_secs = CONNECT_TIMEOUT_SECS) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    for (;;) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(*io.mutex);
            if (!io.is_alive()) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (std::chrono::steady_clock::now() > deadline) return LIBSSH2_ERROR_TIMEOUT;
        wait_socket(io);
    }
}

// Same for calls that return a handle and report EAGAIN through
// libssh2_session_last_errno.
template <typename T, typename Fn>
T* ssh_retry_ptr(const SshIo& io, Fn fn, int timeout_secs = CONNECT_TIMEOUT_SECS) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    for (;;) {
        T* handle;
        int err;
        {
            std::lock_guard<std::mutex> lock(*io.mutex);
            if (!io.is_alive()) return nullptr;
            handle = fn();
            err = handle ? 0 : libssh2_session_last_errno(io.session);
        }
        if (handle) return handle;
        if (err != LIBSSH2_ERROR_EAGAIN) return nullptr;
        if (std::chrono::steady_clock::now() > deadline) return nullptr;
        wait_socket(io);
    }
}

// Last libssh2 error message for the session, prefixed with what failed.
inline std::string ssh_error(const SshIo& io, const std::string& what) {
    char* msg = nullptr;
    int len = 0;
    int code;
    {
        std::lock_guard<std::mutex> lock(*io.mutex);
        if (!io.is_alive()) return what + ": connection closed";
        code = libssh2_session_last_error(io.session, &msg, &len, 0);
        if (msg && len > 0) {
            return what + ": " + std::string(msg, static_cast<size_t>(len));
        }
    }
    return what + ": libssh2 error " + std::to_string(code);
}
