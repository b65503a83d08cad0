#include "../sftp_shell.hpp"
#include <sftp/remote_path.hpp>
#include <filesystem>

namespace fs = std::filesystem;

using Args = SftpShell::Args;

static Result<void> finish(const Result<TransferSummary>& r) {
    if (r.is_ok()) return Result<void>::Ok();
    return Result<void>::Err(r.error, r.code);
}

// get <remote> [local]: the local side defaults to the remote name in the
// local cwd.
static Result<void> do_get(SftpShell& sh, const Args& args, const CancelToken& cancel) {
    if (args.empty()) return Result<void>::Err("usage: get remote-path [local-path]");

    auto remote = sh.paths().resolve_remote(args[0]);
    if (remote.is_err()) return Result<void>::Err("resolve remote: " + remote.error, remote.code);

    auto local = sh.paths().resolve_local(args.size() > 1 ? args[1] : remote_basename(remote.value));
    if (local.is_err()) return Result<void>::Err("resolve local: " + local.error, local.code);

    if (cancel.cancelled()) return Result<void>::Err("transfer cancelled", ErrorCode::CANCELLED);
    return finish(sh.engine().download(remote.value, local.value, cancel));
}

// put <local> [remote]: the remote side defaults to the local name in the
// remote cwd.
static Result<void> do_put(SftpShell& sh, const Args& args, const CancelToken& cancel) {
    if (args.empty()) return Result<void>::Err("usage: put local-path [remote-path]");

    auto local = sh.paths().resolve_local(args[0]);
    if (local.is_err()) return Result<void>::Err("resolve local: " + local.error, local.code);

    std::string name = fs::path(local.value).filename().string();
    auto remote = sh.paths().resolve_remote(args.size() > 1 ? args[1] : name);
    if (remote.is_err()) return Result<void>::Err("resolve remote: " + remote.error, remote.code);

    if (cancel.cancelled()) return Result<void>::Err("transfer cancelled", ErrorCode::CANCELLED);
    return finish(sh.engine().upload(local.value, remote.value, cancel));
}

void register_transfer_commands(SftpShell& shell) {
    shell.add_transfer_command("get", do_get, "<remote> [local]", "Download file or directory");
    shell.add_transfer_command("put", do_put, "<local> [remote]", "Upload file or directory");
}
