#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <core/types.hpp>
#include "ssh_io.hpp"
#include "transport.hpp"

// direct-tcpip channel on an outer session, bridged to a local socketpair.
// The inner SSH session runs on fd(); a pump thread shuttles bytes between
// the other end of the pair and the channel.
class TunnelStream : public ForwardedStream {
public:
    static Result<std::unique_ptr<TunnelStream>> open(const SshIo& outer,
                                                      const std::string& host, int port);
    ~TunnelStream() override;

    int fd() const override { return local_fd_; }

    // Stop the pump, close the channel and both socket ends. Idempotent.
    void close() override;

    TunnelStream(const TunnelStream&) = delete;
    TunnelStream& operator=(const TunnelStream&) = delete;

private:
    TunnelStream(SshIo outer, LIBSSH2_CHANNEL* channel, socket_t pump_fd, socket_t local_fd);

    void pump();

    SshIo outer_;
    LIBSSH2_CHANNEL* channel_;
    socket_t pump_fd_;
    socket_t local_fd_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};
