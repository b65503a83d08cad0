#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <core/config.hpp>
#include <managers/session_coordinator.hpp>
#include <managers/terminal_manager.hpp>
#include <ssh/jump_chain.hpp>
#include "host_picker.hpp"

struct CliOptions {
    std::string config_path;            // empty: ~/.sshm.yaml + ~/.sshw.yaml
    std::string host_path;              // "group/leaf"; empty: interactive picker
    std::optional<SessionMode> mode;    // with host_path; ssh when unset
    CoordinatorOptions session;         // descriptors and timings for ssh mode
};

// Whole-program flow: load hosts, pick one, connect through its jump
// chain, then run an interactive shell or the SFTP shell.
class SshmCLI {
public:
    SshmCLI(CliOptions options, TerminalManager& terminal);

    // Process exit code.
    int run();

    // Interactive shell on an opened session. Failing to restore the
    // terminal afterwards is only a warning; failing to enter raw mode is
    // an error.
    Result<void> run_shell(std::shared_ptr<RemoteSession> session, std::ostream& err = std::cerr);

private:
    CliOptions options_;
    TerminalManager& terminal_;

    Result<HostSelection> select(const Config& config);
    Result<void> connect_and_run(const HostConfig& host, SessionMode mode);
    Result<void> run_ssh(JumpChain& chain);
    Result<void> run_sftp(JumpChain& chain, const HostConfig& host);
};
