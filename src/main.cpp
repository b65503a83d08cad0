#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <managers/terminal_manager.hpp>
#include <platform/terminal.hpp>
#include "cli/sshm_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sshm"
              << theme::color::RESET << theme::color::DIM
              << "                          Pick a host interactively" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshm "
              << theme::color::RESET << theme::color::CYAN << "<group/host> [ssh|sftp]"
              << theme::color::RESET << theme::color::DIM
              << "   Connect directly" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config PATH                 Use this host file instead of ~/.sshm.yaml\n"
              << "    sshm --version                Show version\n"
              << "    sshm --help                   Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    auto terminal = std::make_shared<platform::PosixTerminal>();
    TerminalManager manager(terminal);

    try {
        CliOptions options;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--version") {
                std::cout << theme::color::BLUE << theme::color::BOLD << "sshm"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << SSHM_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cerr << theme::fail("--config needs a path.");
                    return 1;
                }
                options.config_path = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << theme::fail("Unknown option: " + arg);
                print_usage();
                return 1;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.size() > 2) {
            std::cerr << theme::fail("Too many arguments.");
            print_usage();
            return 1;
        }
        if (!positional.empty()) options.host_path = positional[0];
        if (positional.size() == 2) {
            auto mode = parse_mode(positional[1]);
            if (mode.is_err()) {
                std::cerr << theme::fail(mode.error);
                return 1;
            }
            options.mode = mode.value;
        }

        SshmCLI cli(options, manager);
        return cli.run();
    } catch (const std::exception& e) {
        auto restored = manager.restore();
        if (restored.is_err()) {
            std::cerr << "Warning: failed to restore terminal: " << restored.error << "\n";
        }
        std::cout << theme::TERMINAL_RESET << std::flush;
        sshm_log(std::string("fatal: ") + e.what());
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
