#include "auth.hpp"
#include "ssh_io.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

bool is_usable_private_key(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return false;

    std::string line;
    for (int i = 0; i < 4 && std::getline(in, line); i++) {
        if (line.find("-----BEGIN") != std::string::npos &&
            line.find("PRIVATE KEY-----") != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<AuthStep> plan_auth(const HostConfig& host, const fs::path& home,
                                bool agent_available) {
    std::vector<AuthStep> steps;

    if (host.key_path && !host.key_path->empty()) {
        steps.push_back({AuthStep::KEY_FILE, *host.key_path});
    } else {
        for (const char* rel : DEFAULT_KEY_FILES) {
            fs::path p = home / rel;
            if (is_usable_private_key(p)) {
                steps.push_back({AuthStep::KEY_FILE, p.string()});
                break;
            }
        }
    }

    if (host.password && !host.password->empty()) {
        steps.push_back({AuthStep::PASSWORD, ""});
    }

    if (agent_available) {
        steps.push_back({AuthStep::AGENT, ""});
    }
    return steps;
}

// Answers every keyboard-interactive prompt with the configured password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    const std::string* password = static_cast<const std::string*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(password->c_str());
        responses[i].length = static_cast<unsigned int>(password->length());
    }
}

static bool try_key(const SshIo& io, const HostConfig& host, const std::string& key_path) {
    int rc = ssh_retry(io, [&] {
        return libssh2_userauth_publickey_fromfile(io.session, host.user.c_str(),
                                                   nullptr, key_path.c_str(), "");
    });
    if (rc != 0) {
        sshm_log(fmt::format("auth {}: key {} rejected ({})", host.name, key_path, rc));
    }
    return rc == 0;
}

static bool try_password(const SshIo& io, const HostConfig& host, const std::string& methods) {
    const std::string& password = *host.password;

    if (methods.empty() || methods.find("password") != std::string::npos) {
        int rc = ssh_retry(io, [&] {
            return libssh2_userauth_password(io.session, host.user.c_str(), password.c_str());
        });
        if (rc == 0) return true;
        sshm_log(fmt::format("auth {}: password rejected ({})", host.name, rc));
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        void** abstract = libssh2_session_abstract(io.session);
        void* saved = *abstract;
        *abstract = const_cast<std::string*>(&password);
        int rc = ssh_retry(io, [&] {
            return libssh2_userauth_keyboard_interactive(io.session, host.user.c_str(),
                                                         kbd_callback);
        });
        *abstract = saved;
        if (rc == 0) return true;
        sshm_log(fmt::format("auth {}: keyboard-interactive rejected ({})", host.name, rc));
    }
    return false;
}

static bool try_agent(const SshIo& io, const HostConfig& host) {
    LIBSSH2_AGENT* agent;
    {
        std::lock_guard<std::mutex> lock(*io.mutex);
        agent = libssh2_agent_init(io.session);
    }
    if (!agent) return false;

    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (!authed && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            int rc = ssh_retry(io, [&] {
                return libssh2_agent_userauth(agent, host.user.c_str(), identity);
            });
            authed = rc == 0;
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);

    if (!authed) {
        sshm_log(fmt::format("auth {}: no agent identity accepted", host.name));
    }
    return authed;
}

Result<void> authenticate(const SshIo& io, const HostConfig& host, StatusCallback callback) {
    // Server-offered methods. NULL with authenticated() means "none" worked.
    char* list = ssh_retry_ptr<char>(io, [&] {
        return libssh2_userauth_list(io.session, host.user.c_str(),
                                     static_cast<unsigned int>(host.user.length()));
    });
    {
        std::lock_guard<std::mutex> lock(*io.mutex);
        if (!list && libssh2_userauth_authenticated(io.session)) {
            return Result<void>::Ok();
        }
    }
    std::string methods = list ? list : "";
    sshm_log(fmt::format("auth {}: server offers [{}]", host.name, methods));

    const char* sock = std::getenv("SSH_AUTH_SOCK");
    auto steps = plan_auth(host, platform::home_dir(), sock && *sock);

    std::vector<std::string> tried;
    for (const auto& step : steps) {
        switch (step.kind) {
        case AuthStep::KEY_FILE:
            if (callback) callback("Trying key " + step.key_path + "...");
            if (try_key(io, host, step.key_path)) return Result<void>::Ok();
            tried.push_back("publickey " + step.key_path);
            break;
        case AuthStep::PASSWORD:
            if (callback) callback("Trying password...");
            if (try_password(io, host, methods)) return Result<void>::Ok();
            tried.push_back("password");
            break;
        case AuthStep::AGENT:
            if (callback) callback("Trying ssh-agent...");
            if (try_agent(io, host)) return Result<void>::Ok();
            tried.push_back("agent");
            break;
        }
    }

    if (tried.empty()) {
        return Result<void>::Err("no authentication methods available", ErrorCode::AUTH);
    }
    std::string joined;
    for (size_t i = 0; i < tried.size(); i++) {
        if (i > 0) joined += ", ";
        joined += tried[i];
    }
    return Result<void>::Err("authentication failed (tried: " + joined + ")", ErrorCode::AUTH);
}
