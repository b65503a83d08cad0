#pragma once

#include <memory>
#include <core/types.hpp>
#include "transport.hpp"

// Dialer backed by libssh2. Without `via` it connects TCP directly; with
// `via` it opens a direct-tcpip channel through that transport and runs the
// new session over it.
class ConnectionFactory : public Dialer {
public:
    ConnectionFactory() = default;

    Result<std::unique_ptr<Transport>> dial(const HostConfig& host, Transport* via,
                                            StatusCallback callback) override;
};
