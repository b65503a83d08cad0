#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>

class RemoteFs;

// Anything that accepts terminal window-size updates.
class ResizeTarget {
public:
    virtual ~ResizeTarget() = default;
    virtual Result<void> window_change(int width, int height) = 0;
};

// One remote shell execution context opened over a transport.
class RemoteSession : public ResizeTarget {
public:
    virtual Result<void> request_pty(const std::string& term, int width, int height) = 0;

    // Remote stdout/stderr are written straight to these descriptors.
    virtual void set_output(int out_fd, int err_fd) = 0;

    virtual Result<void> start_shell() = 0;

    // Forward bytes to the remote stdin. Blocks until all are accepted.
    virtual Result<void> write_input(const char* data, size_t len) = 0;

    // Send EOF on the remote stdin. Idempotent.
    virtual Result<void> close_input() = 0;

    // Block until the remote side has finished. Returns the exit status.
    virtual Result<int> wait() = 0;

    // Force the session closed; a pending wait() returns afterwards.
    virtual Result<void> close() = 0;
};

// A local descriptor bridged to host:port on the far side of a transport.
class ForwardedStream {
public:
    virtual ~ForwardedStream() = default;
    virtual int fd() const = 0;
    virtual void close() = 0;
};

// An authenticated connection to one host.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::shared_ptr<RemoteSession>> open_session() = 0;
    virtual Result<std::unique_ptr<RemoteFs>> open_sftp() = 0;

    // Port-forwarded dial through this transport.
    virtual Result<std::unique_ptr<ForwardedStream>> dial(const std::string& host, int port) = 0;

    // Idempotent; only the first call does work.
    virtual Result<void> close() = 0;
    virtual bool is_active() const = 0;
    virtual const std::string& name() const = 0;
};

// Opens a transport to one host, directly (via == nullptr) or tunnelled
// through an already-open transport.
class Dialer {
public:
    virtual ~Dialer() = default;
    virtual Result<std::unique_ptr<Transport>> dial(const HostConfig& host, Transport* via,
                                                    StatusCallback callback) = 0;
};
