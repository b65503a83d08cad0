#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <sftp/remote_fs.hpp>

// Working directories for both sides of a file-transfer shell.
//
// The remote cwd is only ever set from the server's own canonical path
// (realpath), never from a string computed here, so symlinks and repeated
// ".." cannot make it drift from what the server thinks it is.
class PathState {
public:
    PathState(RemoteFs& remote, std::string local_cwd, std::string local_home,
              std::string remote_cwd, std::string remote_home);

    // Local cwd and home from the process; remote ones from realpath(".").
    static Result<std::unique_ptr<PathState>> create(RemoteFs& remote);

    // "" and "." are the cwd, "~" and "~/x" are under home, absolute paths are
    // cleaned, anything else is joined to the cwd. "~user" is rejected with
    // UNSUPPORTED_PATH_FORM.
    Result<std::string> resolve_local(const std::string& path) const;
    Result<std::string> resolve_remote(const std::string& path) const;

    // Store realpath(resolve_remote(path)). Does not check it is a directory.
    Result<void> update_remote_cwd(const std::string& path);

    // Store the absolute form of resolve_local(path).
    Result<void> update_local_cwd(const std::string& path);

    const std::string& local_cwd() const { return local_cwd_; }
    const std::string& local_home() const { return local_home_; }
    const std::string& remote_cwd() const { return remote_cwd_; }
    const std::string& remote_home() const { return remote_home_; }

private:
    RemoteFs* remote_;
    std::string local_cwd_;
    std::string local_home_;
    std::string remote_cwd_;
    std::string remote_home_;
};
