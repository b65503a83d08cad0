#include "socket_util.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

static void enable_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

// Non-blocking connect to one resolved address, waiting up to timeout_ms.
static Result<socket_t> connect_addr(const struct addrinfo* ai, int timeout_ms) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        return Result<socket_t>::Err("socket: " + std::string(strerror(errno)),
                                     ErrorCode::CONNECTION);
    }
    fcntl(sock, F_SETFD, FD_CLOEXEC);
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        close_socket(sock);
        return Result<socket_t>::Err(strerror(err), ErrorCode::CONNECTION);
    }

    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(sock);
            return Result<socket_t>::Err("connection timed out", ErrorCode::CONNECTION);
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err(strerror(sock_err), ErrorCode::CONNECTION);
        }
    }

    enable_keepalive(sock);
    return Result<socket_t>::Ok(sock);
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs) {
    std::string addr = fmt::format("{}:{}", host, port);

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<socket_t>::Err(
            fmt::format("dial {}: {}", addr, gai_strerror(gai)), ErrorCode::CONNECTION);
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        auto r = connect_addr(ai, timeout_secs * 1000);
        if (r.is_ok()) {
            freeaddrinfo(res);
            return r;
        }
        last_error = r.error;
    }
    freeaddrinfo(res);
    return Result<socket_t>::Err(fmt::format("dial {}: {}", addr, last_error),
                                 ErrorCode::CONNECTION);
}

Result<void> make_socketpair(socket_t out[2]) {
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, out) != 0) {
        return Result<void>::Err("socketpair: " + std::string(strerror(errno)),
                                 ErrorCode::CONNECTION);
    }
    for (int i = 0; i < 2; i++) {
        fcntl(out[i], F_SETFD, FD_CLOEXEC);
        set_nonblocking(out[i]);
    }
    return Result<void>::Ok();
}

void close_socket(socket_t sock) {
    if (sock >= 0) close(sock);
}

} // namespace platform
