#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/types.hpp>
#include "ssh_io.hpp"
#include "transport.hpp"

// Interactive shell on one libssh2 channel. After start_shell() an output
// thread copies remote stdout/stderr to the configured descriptors until the
// channel reaches EOF or is closed; wait() blocks on that thread's finish.
// All libssh2 calls hold the transport's io mutex only briefly.
class ShellChannel : public RemoteSession {
public:
    ShellChannel(SshIo io, LIBSSH2_CHANNEL* ch);
    ~ShellChannel() override;

    Result<void> request_pty(const std::string& term, int width, int height) override;
    void set_output(int out_fd, int err_fd) override;
    Result<void> start_shell() override;
    Result<void> write_input(const char* data, size_t len) override;
    Result<void> close_input() override;
    Result<int> wait() override;
    Result<void> close() override;
    Result<void> window_change(int width, int height) override;

    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

private:
    SshIo io_;
    LIBSSH2_CHANNEL* ch_;
    int out_fd_ = 1;
    int err_fd_ = 2;

    std::thread output_thread_;
    std::atomic<bool> closing_{false};
    std::atomic<bool> eof_sent_{false};   // stdin EOF goes out once

    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    bool done_ = false;
    int exit_status_ = -1;
    std::string error_;

    void pump_output();
    void finish(int status, const std::string& error);
};
