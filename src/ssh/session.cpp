#include "session.hpp"
#include "auth.hpp"
#include "shell_channel.hpp"
#include "tunnel.hpp"
#include <sftp/sftp_client.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <mutex>

static Result<void> init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) {
        return Result<void>::Err("failed to initialize libssh2", ErrorCode::CONNECTION);
    }
    return Result<void>::Ok();
}

static std::string hex_fingerprint(const char* hash, size_t len) {
    std::string out;
    for (size_t i = 0; i < len; i++) {
        if (i > 0) out += ":";
        out += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
    }
    return out;
}

SshTransport::SshTransport(HostConfig host) : host_(std::move(host)) {
    io_.mutex = std::make_shared<std::mutex>();
    io_.alive = std::make_shared<std::atomic<bool>>(false);
}

SshTransport::~SshTransport() {
    teardown();
}

Result<void> SshTransport::establish(socket_t sock, std::unique_ptr<ForwardedStream> stream,
                                     StatusCallback callback) {
    io_.sock = sock;
    stream_ = std::move(stream);

    auto init = init_libssh2();
    if (init.is_err()) {
        teardown();
        return init;
    }

    io_.session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!io_.session) {
        teardown();
        return Result<void>::Err("failed to create SSH session", ErrorCode::CONNECTION);
    }
    io_.alive->store(true);
    libssh2_session_set_blocking(io_.session, 0);

    if (callback) callback("SSH handshake with " + host_.address() + "...");

    int rc = ssh_retry(io_, [&] { return libssh2_session_handshake(io_.session, io_.sock); });
    if (rc != 0) {
        std::string err = ssh_error(io_, "ssh handshake with " + host_.address());
        teardown();
        return Result<void>::Err(err, ErrorCode::CONNECTION);
    }

    // Host keys are accepted without verification; the fingerprint is only logged.
    const char* hash = libssh2_hostkey_hash(io_.session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash) {
        sshm_log(fmt::format("{} host key SHA256 {}", host_.name, hex_fingerprint(hash, 32)));
    }

    libssh2_keepalive_config(io_.session, 1, SSH_KEEPALIVE_SECS);

    auto auth = authenticate(io_, host_, callback);
    if (auth.is_err()) {
        teardown();
        return auth;
    }

    active_ = true;
    sshm_log(fmt::format("{} ({}@{}) connected", host_.name, host_.user, host_.address()));
    return Result<void>::Ok();
}

Result<std::shared_ptr<RemoteSession>> SshTransport::open_session() {
    if (!active_) {
        return Result<std::shared_ptr<RemoteSession>>::Err(
            "open session on " + host_.name + ": not connected", ErrorCode::CONNECTION);
    }
    LIBSSH2_CHANNEL* ch = ssh_retry_ptr<LIBSSH2_CHANNEL>(io_, [&] {
        return libssh2_channel_open_session(io_.session);
    });
    if (!ch) {
        return Result<std::shared_ptr<RemoteSession>>::Err(
            ssh_error(io_, "open session on " + host_.name), ErrorCode::PROTOCOL);
    }
    return Result<std::shared_ptr<RemoteSession>>::Ok(std::make_shared<ShellChannel>(io_, ch));
}

Result<std::unique_ptr<RemoteFs>> SshTransport::open_sftp() {
    if (!active_) {
        return Result<std::unique_ptr<RemoteFs>>::Err(
            "open sftp on " + host_.name + ": not connected", ErrorCode::CONNECTION);
    }
    LIBSSH2_SFTP* sftp = ssh_retry_ptr<LIBSSH2_SFTP>(io_, [&] {
        return libssh2_sftp_init(io_.session);
    });
    if (!sftp) {
        return Result<std::unique_ptr<RemoteFs>>::Err(
            ssh_error(io_, "open sftp on " + host_.name), ErrorCode::PROTOCOL);
    }
    return Result<std::unique_ptr<RemoteFs>>::Ok(std::make_unique<SftpClient>(io_, sftp));
}

Result<std::unique_ptr<ForwardedStream>> SshTransport::dial(const std::string& host, int port) {
    if (!active_) {
        return Result<std::unique_ptr<ForwardedStream>>::Err(
            "dial through " + host_.name + ": not connected", ErrorCode::CONNECTION);
    }
    auto r = TunnelStream::open(io_, host, port);
    if (r.is_err()) {
        return Result<std::unique_ptr<ForwardedStream>>::Err(r.error, r.code);
    }
    return Result<std::unique_ptr<ForwardedStream>>::Ok(std::move(r.value));
}

Result<void> SshTransport::close() {
    if (!active_.exchange(false)) {
        teardown();
        return Result<void>::Ok();
    }

    int rc = ssh_retry(io_, [&] {
        return libssh2_session_disconnect(io_.session, "Normal disconnection");
    }, 2);

    teardown();

    if (rc != 0 && rc != LIBSSH2_ERROR_SOCKET_DISCONNECT && rc != LIBSSH2_ERROR_SOCKET_SEND) {
        return Result<void>::Err(fmt::format("close {}: disconnect failed ({})", host_.name, rc),
                                 ErrorCode::CONNECTION);
    }
    return Result<void>::Ok();
}

// Free the session, then the socket (or the tunnel carrying it). Channels
// handed out earlier see alive == false and stop touching the session.
void SshTransport::teardown() {
    active_ = false;

    if (io_.session) {
        std::lock_guard<std::mutex> lock(*io_.mutex);
        io_.alive->store(false);
        // Non-blocking free may ask to be called again
        for (int i = 0; i < 20; i++) {
            if (libssh2_session_free(io_.session) != LIBSSH2_ERROR_EAGAIN) break;
            platform::poll_socket(io_.sock, POLLIN | POLLOUT, SOCKET_WAIT_SLICE_MS);
        }
        io_.session = nullptr;
    }

    if (stream_) {
        stream_->close();
        stream_.reset();
    } else if (io_.sock != SSHM_INVALID_SOCKET) {
        platform::close_socket(io_.sock);
    }
    io_.sock = SSHM_INVALID_SOCKET;
}

bool SshTransport::is_active() const {
    return active_;
}
