#include "sshm_cli.hpp"
#include "progress_bar.hpp"
#include "sftp_shell.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <managers/path_state.hpp>
#include <managers/session_coordinator.hpp>
#include <ssh/connection_factory.hpp>
#include <fmt/format.h>

SshmCLI::SshmCLI(CliOptions options, TerminalManager& terminal)
    : options_(std::move(options)), terminal_(terminal) {}

int SshmCLI::run() {
    auto config = Config::load(options_.config_path, [](const std::string& msg) {
        std::cerr << theme::yellow("Warning: " + msg) << "\n";
    });
    if (config.is_err()) {
        std::cerr << "Error loading config: " << config.error << "\n";
        std::cerr << "Create ~/.sshm.yaml with your host configurations.\n";
        return 1;
    }
    if (config.value.empty()) {
        std::cerr << "No hosts found in config\n";
        return 1;
    }

    auto selection = select(config.value);

    // The picker may leave the cursor hidden or colours set
    std::cout << theme::TERMINAL_RESET << std::flush;

    if (selection.is_err()) {
        std::cerr << selection.error << "\n";
        return 1;
    }
    if (selection.value.quit || !selection.value.host) return 0;

    auto result = connect_and_run(*selection.value.host, selection.value.mode);
    if (result.is_err()) {
        std::cerr << "Connection error: " << result.error << "\n";
        return 1;
    }
    return 0;
}

Result<HostSelection> SshmCLI::select(const Config& config) {
    if (!options_.host_path.empty()) {
        const HostConfig* host = config.find_host(options_.host_path);
        if (!host) {
            return Result<HostSelection>::Err("Host not found: " + options_.host_path,
                                              ErrorCode::NOT_FOUND);
        }
        if (host->is_group()) {
            return Result<HostSelection>::Err(options_.host_path + " is a group; pick a host inside it",
                                              ErrorCode::NOT_FOUND);
        }
        HostSelection sel;
        sel.host = host;
        sel.mode = options_.mode.value_or(SessionMode::SSH);
        return Result<HostSelection>::Ok(sel);
    }

    std::cout << theme::banner();
    ReadlineReader reader;
    HostPicker picker(config, reader);
    auto picked = picker.run();
    if (picked.is_err()) {
        return Result<HostSelection>::Err("Host selection error: " + picked.error, picked.code);
    }
    return picked;
}

Result<void> SshmCLI::connect_and_run(const HostConfig& host, SessionMode mode) {
    ConnectionFactory factory;
    JumpChain chain(JumpChain::route_for(host), factory);

    auto connected = chain.connect([](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n" << std::flush;
    });
    if (connected.is_err()) return connected;

    sshm_log(fmt::format("{} session to {} through {} hop(s)", mode_name(mode), host.name,
                         chain.size() - 1));

    Result<void> result = mode == SessionMode::SFTP ? run_sftp(chain, host) : run_ssh(chain);

    auto closed = chain.close();
    if (closed.is_err()) sshm_log("close chain: " + closed.error);
    return result;
}

Result<void> SshmCLI::run_ssh(JumpChain& chain) {
    auto session = chain.open_session();
    if (session.is_err()) return Result<void>::Err("create session: " + session.error, session.code);

    auto result = run_shell(session.value);
    std::cout << "\n" << std::flush;
    return result;
}

Result<void> SshmCLI::run_shell(std::shared_ptr<RemoteSession> session, std::ostream& err) {
    SessionCoordinator coordinator(terminal_, options_.session);
    auto result = coordinator.run(std::move(session));
    sshm_log(fmt::format("remote shell exited with status {}", coordinator.exit_status()));

    if (result.is_err() && result.code == ErrorCode::RESTORE_FAILED) {
        err << "Warning: failed to restore terminal: " << result.error << "\n" << std::flush;
        return Result<void>::Ok();
    }
    return result;
}

Result<void> SshmCLI::run_sftp(JumpChain& chain, const HostConfig& host) {
    auto remote = chain.open_sftp();
    if (remote.is_err()) return Result<void>::Err("create sftp client: " + remote.error, remote.code);

    auto paths = PathState::create(*remote.value);
    if (paths.is_err()) return Result<void>::Err("init paths: " + paths.error, paths.code);

    ProgressBar bar;
    SftpShell shell(*remote.value, *paths.value, host.user, host.host, &bar);
    ReadlineReader reader;
    auto result = shell.run(reader);
    if (result.is_err()) return Result<void>::Err("sftp shell: " + result.error, result.code);
    return Result<void>::Ok();
}
