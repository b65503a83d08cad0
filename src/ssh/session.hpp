#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "ssh_io.hpp"
#include "transport.hpp"

// One authenticated libssh2 session. The socket is either a direct TCP
// connection or the local end of a TunnelStream through the previous hop.
class SshTransport : public Transport {
public:
    explicit SshTransport(HostConfig host);
    ~SshTransport() override;

    // Handshake and authenticate over a connected socket. The transport takes
    // ownership of sock, or of stream when the socket belongs to one.
    Result<void> establish(socket_t sock, std::unique_ptr<ForwardedStream> stream,
                           StatusCallback callback = nullptr);

    Result<std::shared_ptr<RemoteSession>> open_session() override;
    Result<std::unique_ptr<RemoteFs>> open_sftp() override;
    Result<std::unique_ptr<ForwardedStream>> dial(const std::string& host, int port) override;

    Result<void> close() override;
    bool is_active() const override;
    const std::string& name() const override { return host_.name; }

    const SshIo& io() const { return io_; }

    SshTransport(const SshTransport&) = delete;
    SshTransport& operator=(const SshTransport&) = delete;

private:
    HostConfig host_;
    SshIo io_;
    std::unique_ptr<ForwardedStream> stream_;
    std::atomic<bool> active_{false};

    void teardown();
};
