#include "jump_chain.hpp"
#include <sftp/remote_fs.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

JumpChain::JumpChain(std::vector<HostConfig> hops, Dialer& dialer)
    : hops_(std::move(hops)), dialer_(dialer) {}

JumpChain::~JumpChain() {
    auto r = close();
    if (r.is_err()) sshm_log("chain close on destroy: " + r.error);
}

std::vector<HostConfig> JumpChain::route_for(const HostConfig& target) {
    std::vector<HostConfig> route = target.jump;
    HostConfig last = target;
    last.jump.clear();
    route.push_back(std::move(last));
    return route;
}

std::vector<std::string> JumpChain::close_reverse(std::vector<std::shared_ptr<Transport>>& list) {
    std::vector<std::string> errors;
    for (size_t i = list.size(); i-- > 0;) {
        auto r = list[i]->close();
        if (r.is_err()) {
            errors.push_back(fmt::format("hop {} ({}): {}", i + 1, list[i]->name(), r.error));
        }
    }
    list.clear();
    return errors;
}

Result<void> JumpChain::connect(StatusCallback callback) {
    if (hops_.empty()) {
        return Result<void>::Err("no hosts to connect to", ErrorCode::HOP_FAILED);
    }
    if (is_connected()) {
        return Result<void>::Ok();
    }

    // Built outside the lock; published once complete.
    std::vector<std::shared_ptr<Transport>> opened;
    for (size_t i = 0; i < hops_.size(); i++) {
        Transport* via = opened.empty() ? nullptr : opened.back().get();
        auto r = dialer_.dial(hops_[i], via, callback);
        if (r.is_err()) {
            for (const auto& e : close_reverse(opened)) {
                sshm_log("close after failed connect: " + e);
            }
            HopFailure failure{i, hops_[i].name, r.error};
            {
                std::lock_guard<std::mutex> lock(mutex_);
                failure_ = failure;
            }
            sshm_log(fmt::format("hop {} ({}) failed: {}", i + 1, failure.name, failure.cause));
            return Result<void>::Err(
                fmt::format("hop {} ({}): {}", i + 1, failure.name, failure.cause),
                ErrorCode::HOP_FAILED);
        }
        opened.push_back(std::shared_ptr<Transport>(std::move(r.value)));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    transports_ = std::move(opened);
    failure_.reset();
    return Result<void>::Ok();
}

Result<void> JumpChain::close() {
    std::vector<std::shared_ptr<Transport>> list;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        list.swap(transports_);
    }

    auto errors = close_reverse(list);
    if (errors.empty()) return Result<void>::Ok();

    std::string joined;
    for (size_t i = 0; i < errors.size(); i++) {
        if (i > 0) joined += "; ";
        joined += errors[i];
    }
    return Result<void>::Err(joined, ErrorCode::CONNECTION);
}

bool JumpChain::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !transports_.empty() && transports_.back()->is_active();
}

size_t JumpChain::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transports_.size();
}

std::shared_ptr<Transport> JumpChain::target() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (transports_.empty()) return nullptr;
    return transports_.back();
}

Result<std::shared_ptr<RemoteSession>> JumpChain::open_session() {
    auto t = target();
    if (!t) {
        return Result<std::shared_ptr<RemoteSession>>::Err("not connected", ErrorCode::CONNECTION);
    }
    return t->open_session();
}

Result<std::unique_ptr<RemoteFs>> JumpChain::open_sftp() {
    auto t = target();
    if (!t) {
        return Result<std::unique_ptr<RemoteFs>>::Err("not connected", ErrorCode::CONNECTION);
    }
    return t->open_sftp();
}
