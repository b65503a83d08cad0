#include "resize_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <future>
#include <thread>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

struct ResizeForwarder::State {
    std::shared_ptr<ResizeTarget> target;
    std::shared_ptr<std::atomic<bool>> active;
    SizeProvider size;
    int stop_pipe[2] = {-1, -1};
    std::atomic<bool> stopped{false};

    ~State() {
        platform::close_fd(stop_pipe[0]);
        platform::close_fd(stop_pipe[1]);
    }
};

ResizeForwarder::ResizeForwarder(std::shared_ptr<ResizeTarget> target,
                                 std::shared_ptr<std::atomic<bool>> active,
                                 SizeProvider size)
    : state_(std::make_shared<State>()) {
    state_->target = std::move(target);
    state_->active = std::move(active);
    state_->size = std::move(size);
    if (!platform::make_pipe(state_->stop_pipe)) {
        sshm_log("resize forwarder: stop pipe unavailable");
    }
}

ResizeForwarder::~ResizeForwarder() {
    stop();
}

void ResizeForwarder::start() {
    std::thread(&ResizeForwarder::watch, state_).detach();
}

void ResizeForwarder::stop() {
    if (state_->stopped.exchange(true)) return;
    if (state_->stop_pipe[1] >= 0) {
        char b = 1;
        if (!platform::write_all(state_->stop_pipe[1], &b, 1)) {
            sshm_log("resize forwarder: stop write failed");
        }
    }
}

bool ResizeForwarder::forward_now() {
    return forward(state_);
}

bool ResizeForwarder::forward(const std::shared_ptr<State>& state) {
    if (state->stopped || !state->active->load()) return false;

    auto dims = state->size();
    if (!dims) return false;

    auto done = std::make_shared<std::promise<bool>>();
    auto result = done->get_future();
    std::thread([target = state->target, done, w = dims->width, h = dims->height] {
        auto r = target->window_change(w, h);
        if (r.is_err()) sshm_log("window change: " + r.error);
        done->set_value(r.is_ok());
    }).detach();

    if (result.wait_for(std::chrono::milliseconds(RESIZE_FORWARD_TIMEOUT_MS)) !=
        std::future_status::ready) {
        sshm_log(fmt::format("window change to {}x{} abandoned", dims->width, dims->height));
        return false;
    }
    return result.get();
}

void ResizeForwarder::watch(std::shared_ptr<State> state) {
    forward(state);

    int sig_fd = platform::resize_signal_fd();
    if (sig_fd < 0 || state->stop_pipe[0] < 0) return;

    while (!state->stopped) {
        struct pollfd fds[2];
        fds[0] = {state->stop_pipe[0], POLLIN, 0};
        fds[1] = {sig_fd, POLLIN, 0};
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            sshm_log(fmt::format("resize forwarder: poll: {}", std::strerror(errno)));
            return;
        }
        if (fds[0].revents || state->stopped) return;
        if (fds[1].revents & POLLIN) {
            platform::drain_fd(sig_fd);
            forward(state);
        }
    }
}
