#include "../sftp_shell.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

using Args = SftpShell::Args;

static Result<void> wrap(const std::string& what, const Result<void>& r) {
    return Result<void>::Err(what + ": " + r.error, r.code);
}

template <typename T>
static Result<void> wrap(const std::string& what, const Result<T>& r) {
    return Result<void>::Err(what + ": " + r.error, r.code);
}

static std::string listing_line(uint32_t mode, uint64_t size, std::time_t mtime,
                                const std::string& name) {
    std::string shown = S_ISDIR(mode) ? name + "/" : name;
    return fmt::format("{} {:>8} {} {}\n", format_mode(mode), size, format_mtime(mtime), shown);
}

// ── Remote ──────────────────────────────────────────────────

static Result<void> do_cd(SftpShell& sh, const Args& args) {
    auto resolved = sh.paths().resolve_remote(args.empty() ? "~" : args[0]);
    if (resolved.is_err()) return wrap("resolve path", resolved);

    auto info = sh.remote().stat(resolved.value);
    if (info.is_err()) return wrap("stat", info);
    if (!info.value.is_dir()) {
        return Result<void>::Err(resolved.value + " is not a directory", ErrorCode::IO);
    }
    return sh.paths().update_remote_cwd(resolved.value);
}

static Result<void> do_pwd(SftpShell& sh, const Args&) {
    sh.out() << "Remote working directory: " << sh.paths().remote_cwd() << "\n";
    return Result<void>::Ok();
}

static Result<void> do_ls(SftpShell& sh, const Args& args) {
    auto resolved = sh.paths().resolve_remote(args.empty() ? "." : args[0]);
    if (resolved.is_err()) return wrap("resolve path", resolved);

    auto entries = sh.remote().list_dir(resolved.value);
    if (entries.is_err()) return wrap("read dir", entries);

    auto list = entries.value;
    std::sort(list.begin(), list.end(),
              [](const RemoteFileInfo& a, const RemoteFileInfo& b) { return a.name < b.name; });
    for (const auto& e : list) {
        sh.out() << listing_line(e.mode, e.size, static_cast<std::time_t>(e.mtime), e.name);
    }
    sh.out() << std::flush;
    return Result<void>::Ok();
}

static Result<void> do_mkdir(SftpShell& sh, const Args& args) {
    if (args.empty()) return Result<void>::Err("usage: mkdir <path>");

    auto resolved = sh.paths().resolve_remote(args[0]);
    if (resolved.is_err()) return wrap("resolve path", resolved);

    auto made = sh.remote().mkdir_all(resolved.value);
    if (made.is_err()) return wrap("mkdir", made);

    sh.out() << "Created remote directory: " << resolved.value << "\n";
    return Result<void>::Ok();
}

// ── Local ───────────────────────────────────────────────────

static Result<void> do_lcd(SftpShell& sh, const Args& args) {
    auto resolved = sh.paths().resolve_local(args.empty() ? "~" : args[0]);
    if (resolved.is_err()) return wrap("resolve path", resolved);

    std::error_code ec;
    auto st = fs::status(resolved.value, ec);
    if (ec) return Result<void>::Err(fmt::format("stat: {}: {}", resolved.value, ec.message()));
    if (!fs::is_directory(st)) {
        return Result<void>::Err(resolved.value + " is not a directory");
    }
    return sh.paths().update_local_cwd(resolved.value);
}

static Result<void> do_lpwd(SftpShell& sh, const Args&) {
    sh.out() << "Local working directory: " << sh.paths().local_cwd() << "\n";
    return Result<void>::Ok();
}

static Result<void> do_lls(SftpShell& sh, const Args& args) {
    auto resolved = sh.paths().resolve_local(args.empty() ? "." : args[0]);
    if (resolved.is_err()) return wrap("resolve path", resolved);

    std::error_code ec;
    std::vector<std::string> names;
    for (fs::directory_iterator it(resolved.value, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) return Result<void>::Err(fmt::format("read dir: {}: {}", resolved.value, ec.message()));

    std::sort(names.begin(), names.end());
    for (const auto& name : names) {
        struct stat st;
        std::string full = (fs::path(resolved.value) / name).string();
        if (::lstat(full.c_str(), &st) != 0) {
            sh.out() << fmt::format("?????????? {:>8} {:>12} {}\n", "?", "", name);
            continue;
        }
        sh.out() << listing_line(st.st_mode, static_cast<uint64_t>(st.st_size), st.st_mtime, name);
    }
    sh.out() << std::flush;
    return Result<void>::Ok();
}

static Result<void> do_lmkdir(SftpShell& sh, const Args& args) {
    if (args.empty()) return Result<void>::Err("usage: lmkdir <path>");

    auto resolved = sh.paths().resolve_local(args[0]);
    if (resolved.is_err()) return wrap("resolve path", resolved);

    std::error_code ec;
    fs::create_directories(resolved.value, ec);
    if (ec) return Result<void>::Err(fmt::format("mkdir: {}: {}", resolved.value, ec.message()));

    sh.out() << "Created local directory: " << resolved.value << "\n";
    return Result<void>::Ok();
}

void register_navigation_commands(SftpShell& shell) {
    shell.add_command("cd", do_cd, "<path>", "Change remote directory");
    shell.add_command("lcd", do_lcd, "<path>", "Change local directory");
    shell.add_command("pwd", do_pwd, "", "Print remote working directory");
    shell.add_command("lpwd", do_lpwd, "", "Print local working directory");
    shell.add_command("ls", do_ls, "[path]", "List remote files");
    shell.add_command("lls", do_lls, "[path]", "List local files");
    shell.add_command("mkdir", do_mkdir, "<path>", "Create remote directory");
    shell.add_command("lmkdir", do_lmkdir, "<path>", "Create local directory");
}
