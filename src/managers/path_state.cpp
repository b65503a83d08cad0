#include "path_state.hpp"
#include <sftp/remote_path.hpp>
#include <platform/platform.hpp>
#include <filesystem>

namespace fs = std::filesystem;

// Local cleaning: lexical only, no trailing separator except for the root.
static std::string clean_local(const fs::path& p) {
    std::string s = p.lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s.empty() ? "." : s;
}

PathState::PathState(RemoteFs& remote, std::string local_cwd, std::string local_home,
                     std::string remote_cwd, std::string remote_home)
    : remote_(&remote), local_cwd_(std::move(local_cwd)), local_home_(std::move(local_home)),
      remote_cwd_(std::move(remote_cwd)), remote_home_(std::move(remote_home)) {}

Result<std::unique_ptr<PathState>> PathState::create(RemoteFs& remote) {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return Result<std::unique_ptr<PathState>>::Err("get local working directory: " + ec.message());
    }

    // SFTP sessions start in the login directory
    auto home = remote.real_path(".");
    if (home.is_err()) {
        return Result<std::unique_ptr<PathState>>::Err("get remote working directory: " + home.error, home.code);
    }

    return Result<std::unique_ptr<PathState>>::Ok(std::make_unique<PathState>(
        remote, clean_local(cwd), platform::home_dir().string(), home.value, home.value));
}

Result<std::string> PathState::resolve_local(const std::string& path) const {
    if (path.empty() || path == ".") {
        return Result<std::string>::Ok(local_cwd_);
    }
    if (path[0] == '~') {
        if (path == "~") return Result<std::string>::Ok(local_home_);
        if (path[1] != '/') {
            return Result<std::string>::Err("~user paths are not supported: " + path,
                                            ErrorCode::UNSUPPORTED_PATH_FORM);
        }
        return Result<std::string>::Ok(clean_local(fs::path(local_home_) / path.substr(2)));
    }
    fs::path p(path);
    if (p.is_absolute()) {
        return Result<std::string>::Ok(clean_local(p));
    }
    return Result<std::string>::Ok(clean_local(fs::path(local_cwd_) / p));
}

Result<std::string> PathState::resolve_remote(const std::string& path) const {
    if (path.empty() || path == ".") {
        return Result<std::string>::Ok(remote_cwd_);
    }
    if (path[0] == '~') {
        if (path == "~") return Result<std::string>::Ok(remote_home_);
        if (path[1] != '/') {
            return Result<std::string>::Err("~user paths are not supported: " + path,
                                            ErrorCode::UNSUPPORTED_PATH_FORM);
        }
        return Result<std::string>::Ok(join_remote_path(remote_home_, path.substr(2)));
    }
    if (path[0] == '/') {
        return Result<std::string>::Ok(clean_remote_path(path));
    }
    return Result<std::string>::Ok(join_remote_path(remote_cwd_, path));
}

Result<void> PathState::update_remote_cwd(const std::string& path) {
    auto resolved = resolve_remote(path);
    if (resolved.is_err()) return Result<void>::Err(resolved.error, resolved.code);

    auto canonical = remote_->real_path(resolved.value);
    if (canonical.is_err()) return Result<void>::Err(canonical.error, canonical.code);

    remote_cwd_ = canonical.value;
    return Result<void>::Ok();
}

Result<void> PathState::update_local_cwd(const std::string& path) {
    auto resolved = resolve_local(path);
    if (resolved.is_err()) return Result<void>::Err(resolved.error, resolved.code);

    std::error_code ec;
    fs::path abs = fs::absolute(resolved.value, ec);
    if (ec) {
        return Result<void>::Err("resolve " + resolved.value + ": " + ec.message());
    }
    local_cwd_ = clean_local(abs);
    return Result<void>::Ok();
}
