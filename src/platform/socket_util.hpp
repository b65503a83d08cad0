#pragma once

// Socket helpers for the SSH transport.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define SSHM_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host (IPv4 or IPv6) and connect with a timeout. The returned
// socket is non-blocking with TCP keepalive enabled.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs);

// Connected AF_UNIX stream pair, used to bridge tunnelled channels.
Result<void> make_socketpair(socket_t out[2]);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
