#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "transport.hpp"

// Which hop broke and why. index is 0-based; messages print it 1-based.
struct HopFailure {
    size_t index;
    std::string name;
    std::string cause;
};

// Ordered chain of transports: [0] is dialled from this machine, [i+1] is
// tunnelled through [i], the last one is the target. Closing runs target
// first so no tunnel is torn down while it still carries traffic.
class JumpChain {
public:
    JumpChain(std::vector<HostConfig> hops, Dialer& dialer);
    ~JumpChain();

    // The host's jump list followed by the host itself.
    static std::vector<HostConfig> route_for(const HostConfig& target);

    // Dial every hop in order. On failure the hops already open are closed in
    // reverse and the error is HOP_FAILED "hop <n> (<name>): <cause>".
    Result<void> connect(StatusCallback callback = nullptr);

    // Close all hops, target first. Every hop is attempted; errors are joined.
    Result<void> close();

    bool is_connected() const;
    size_t size() const;

    std::shared_ptr<Transport> target() const;
    Result<std::shared_ptr<RemoteSession>> open_session();
    Result<std::unique_ptr<RemoteFs>> open_sftp();

    const std::optional<HopFailure>& last_failure() const { return failure_; }

    JumpChain(const JumpChain&) = delete;
    JumpChain& operator=(const JumpChain&) = delete;

private:
    std::vector<HostConfig> hops_;
    Dialer& dialer_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Transport>> transports_;
    std::optional<HopFailure> failure_;

    static std::vector<std::string> close_reverse(std::vector<std::shared_ptr<Transport>>& list);
};
