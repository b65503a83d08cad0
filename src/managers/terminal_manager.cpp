#include "terminal_manager.hpp"
#include "resize_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>

TerminalManager::TerminalManager(std::shared_ptr<platform::TerminalDevice> device)
    : device_(std::move(device)) {}

TerminalManager::~TerminalManager() {
    auto r = restore();
    if (r.is_err()) sshm_log("restore on shutdown: " + r.error);
}

Result<void> TerminalManager::enter_raw(std::shared_ptr<ResizeTarget> session) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (raw_) {
        return Result<void>::Err("terminal already in raw mode", ErrorCode::ALREADY_RAW);
    }

    if (!original_) {
        auto state = device_->get_state();
        if (state.is_err()) return Result<void>::Err(state.error, ErrorCode::TERMINAL);
        original_ = state.value;
    }

    auto r = device_->make_raw();
    if (r.is_err()) {
        // Partial changes must not leak
        auto undo = device_->set_state(*original_);
        if (undo.is_err()) sshm_log("undo failed raw switch: " + undo.error);
        return Result<void>::Err(r.error, ErrorCode::TERMINAL);
    }

    raw_ = true;
    session_ = session;
    active_ = std::make_shared<std::atomic<bool>>(true);

    std::shared_ptr<platform::TerminalDevice> device = device_;
    forwarder_ = std::make_unique<ResizeForwarder>(session, active_, [device] {
        return device->size();
    });
    forwarder_->start();
    return Result<void>::Ok();
}

Result<void> TerminalManager::restore() {
    std::unique_ptr<ResizeForwarder> forwarder;
    platform::TerminalState original;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!raw_) return Result<void>::Ok();

        // Resize events racing with this see "not raw" from here on
        raw_ = false;
        session_.reset();
        if (active_) active_->store(false);
        active_.reset();
        forwarder = std::move(forwarder_);
        original = *original_;
    }

    if (forwarder) forwarder->stop();

    auto r = device_->set_state(original);
    if (r.is_err()) {
        return Result<void>::Err("restore terminal: " + r.error, ErrorCode::RESTORE_FAILED);
    }
    return Result<void>::Ok();
}

bool TerminalManager::in_raw() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return raw_;
}

TerminalMode TerminalManager::mode() const {
    return in_raw() ? TerminalMode::RAW : TerminalMode::COOKED;
}

platform::TerminalSize TerminalManager::size() const {
    auto s = device_->size();
    if (s) return *s;
    return {DEFAULT_TERM_WIDTH, DEFAULT_TERM_HEIGHT};
}

// ── RawModeScope ─────────────────────────────────────────────

RawModeScope::RawModeScope(TerminalManager& terminal, std::shared_ptr<ResizeTarget> session)
    : terminal_(terminal), result_(terminal.enter_raw(std::move(session))) {}

RawModeScope::~RawModeScope() {
    if (!result_.is_ok()) return;
    auto r = terminal_.restore();
    if (r.is_err()) sshm_log("scoped restore: " + r.error);
}
