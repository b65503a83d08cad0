#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <platform/terminal.hpp>
#include <ssh/transport.hpp>

// Relays SIGWINCH to a remote session while raw mode is held.
//
// The watcher thread is detached and owns its state through a shared_ptr,
// so stop() only signals it and never waits. Each forward runs on its own
// short-lived thread and is abandoned after RESIZE_FORWARD_TIMEOUT_MS;
// window_change can stall indefinitely while a session is closing.
class ResizeForwarder {
public:
    using SizeProvider = std::function<std::optional<platform::TerminalSize>()>;

    // `active` is owned by the mode manager and cleared before restore; the
    // forwarder drops any event that arrives after it goes false.
    ResizeForwarder(std::shared_ptr<ResizeTarget> target,
                    std::shared_ptr<std::atomic<bool>> active,
                    SizeProvider size);
    ~ResizeForwarder();

    // Send the current size once, then follow resize notifications. Without
    // SIGWINCH support only the initial size is sent.
    void start();

    // Ask the watcher to exit. Returns immediately.
    void stop();

    // Forward the current size now, bounded by the timeout. Returns false if
    // nothing was sent or the call was abandoned.
    bool forward_now();

    ResizeForwarder(const ResizeForwarder&) = delete;
    ResizeForwarder& operator=(const ResizeForwarder&) = delete;

private:
    struct State;
    std::shared_ptr<State> state_;

    static bool forward(const std::shared_ptr<State>& state);
    static void watch(std::shared_ptr<State> state);
};
