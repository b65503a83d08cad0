#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

struct SshIo;

// One authentication attempt, in the order they are tried.
struct AuthStep {
    enum Kind {
        KEY_FILE,   // private key on disk
        PASSWORD,   // "password", then "keyboard-interactive" answered with it
        AGENT,      // identities from $SSH_AUTH_SOCK
    };

    Kind kind;
    std::string key_path;   // KEY_FILE only
};

// True if path is a readable file holding a PEM/OpenSSH private key.
bool is_usable_private_key(const std::filesystem::path& path);

// Ordered attempts for a host: the explicit key, else the first usable
// default key under home; then the password if one is configured; then the
// agent if one is reachable.
std::vector<AuthStep> plan_auth(const HostConfig& host,
                                const std::filesystem::path& home,
                                bool agent_available);

// Run the plan against a handshaken session. A failing step falls through to
// the next one; the error lists every attempt that was made.
Result<void> authenticate(const SshIo& io, const HostConfig& host,
                          StatusCallback callback = nullptr);
