#include "connection_factory.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <platform/socket_util.hpp>

Result<std::unique_ptr<Transport>> ConnectionFactory::dial(const HostConfig& host, Transport* via,
                                                           StatusCallback callback) {
    using R = Result<std::unique_ptr<Transport>>;

    auto transport = std::make_unique<SshTransport>(host);

    if (!via) {
        if (callback) callback("Connecting to " + host.address() + "...");
        auto sock = platform::connect_tcp(host.host, host.port, CONNECT_TIMEOUT_SECS);
        if (sock.is_err()) {
            return R::Err(sock.error, sock.code);
        }
        auto r = transport->establish(sock.value, nullptr, callback);
        if (r.is_err()) {
            return R::Err("ssh conn to " + host.name + ": " + r.error, r.code);
        }
    } else {
        if (callback) callback("Tunnelling to " + host.address() + " via " + via->name() + "...");
        auto stream = via->dial(host.host, host.port);
        if (stream.is_err()) {
            return R::Err(stream.error, stream.code);
        }
        socket_t fd = stream.value->fd();
        auto r = transport->establish(fd, std::move(stream.value), callback);
        if (r.is_err()) {
            return R::Err("ssh conn to " + host.name + ": " + r.error, r.code);
        }
    }

    return R::Ok(std::move(transport));
}
