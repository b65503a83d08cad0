#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <core/types.hpp>
#include <platform/terminal.hpp>
#include <ssh/transport.hpp>

class ResizeForwarder;

enum class TerminalMode {
    COOKED,
    RAW,
};

// Sole owner of the controlling terminal's line discipline. One instance is
// created at startup and passed to whatever needs raw mode.
//
// The original attributes are captured the first time raw mode is entered
// and reused for every later restore, so repeated enter/restore cycles
// always land on the state the process started with.
class TerminalManager {
public:
    explicit TerminalManager(std::shared_ptr<platform::TerminalDevice> device);
    ~TerminalManager();

    // Bind `session` and switch to raw mode. Fails with ALREADY_RAW, leaving
    // the current binding untouched, if a session is already bound.
    Result<void> enter_raw(std::shared_ptr<ResizeTarget> session);

    // Back to the original attributes. No-op when not raw. A failure is a
    // warning for the caller: the manager is cooked afterwards either way.
    Result<void> restore();

    bool in_raw() const;
    TerminalMode mode() const;

    // Current window size, 80x24 when unknown.
    platform::TerminalSize size() const;

    TerminalManager(const TerminalManager&) = delete;
    TerminalManager& operator=(const TerminalManager&) = delete;

private:
    std::shared_ptr<platform::TerminalDevice> device_;

    mutable std::mutex mutex_;
    bool raw_ = false;
    std::shared_ptr<ResizeTarget> session_;
    std::optional<platform::TerminalState> original_;
    std::shared_ptr<std::atomic<bool>> active_;
    std::unique_ptr<ResizeForwarder> forwarder_;
};

// Scoped raw mode: restores on every exit path, including exceptions.
class RawModeScope {
public:
    RawModeScope(TerminalManager& terminal, std::shared_ptr<ResizeTarget> session);
    ~RawModeScope();

    const Result<void>& result() const { return result_; }
    bool entered() const { return result_.is_ok(); }

    RawModeScope(const RawModeScope&) = delete;
    RawModeScope& operator=(const RawModeScope&) = delete;

private:
    TerminalManager& terminal_;
    Result<void> result_;
};
