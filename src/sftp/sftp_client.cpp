#include "sftp_client.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <cstring>

// Transfers can sit behind a slow link; allow more than the connect timeout.
static constexpr int SFTP_OP_TIMEOUT_SECS = 120;

static RemoteFileInfo to_info(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteFileInfo info;
    info.name = name;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) info.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) info.mode = static_cast<uint32_t>(attrs.permissions);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) info.mtime = static_cast<int64_t>(attrs.mtime);
    return info;
}

static const char* status_text(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:       return "no such file or directory";
    case LIBSSH2_FX_PERMISSION_DENIED:  return "permission denied";
    case LIBSSH2_FX_FAILURE:            return "failure";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:return "file already exists";
    case LIBSSH2_FX_NOT_A_DIRECTORY:    return "not a directory";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space left on device";
    case LIBSSH2_FX_DIR_NOT_EMPTY:      return "directory not empty";
    default:                            return nullptr;
    }
}

// ── SftpFile ─────────────────────────────────────────────────

namespace {

class SftpFile : public RemoteFile {
public:
    SftpFile(SshIo io, LIBSSH2_SFTP_HANDLE* handle, std::string path)
        : io_(std::move(io)), handle_(handle), path_(std::move(path)) {}

    ~SftpFile() override {
        if (handle_) {
            auto r = close();
            if (r.is_err()) sshm_log("close " + path_ + ": " + r.error);
        }
    }

    Result<size_t> read(char* buf, size_t len) override {
        ssize_t n = ssh_retry(io_, [&] {
            return static_cast<int>(libssh2_sftp_read(handle_, buf, len));
        }, SFTP_OP_TIMEOUT_SECS);
        if (n < 0) {
            return Result<size_t>::Err(ssh_error(io_, "read " + path_), ErrorCode::TRANSFER);
        }
        return Result<size_t>::Ok(static_cast<size_t>(n));
    }

    Result<size_t> write(const char* buf, size_t len) override {
        size_t sent = 0;
        while (sent < len) {
            ssize_t w = ssh_retry(io_, [&] {
                return static_cast<int>(libssh2_sftp_write(handle_, buf + sent, len - sent));
            }, SFTP_OP_TIMEOUT_SECS);
            if (w < 0) {
                return Result<size_t>::Err(ssh_error(io_, "write " + path_), ErrorCode::TRANSFER);
            }
            sent += static_cast<size_t>(w);
        }
        return Result<size_t>::Ok(sent);
    }

    Result<void> close() override {
        if (!handle_) return Result<void>::Ok();
        int rc = ssh_retry(io_, [&] { return libssh2_sftp_close_handle(handle_); });
        handle_ = nullptr;
        if (rc != 0) {
            return Result<void>::Err(ssh_error(io_, "close " + path_), ErrorCode::TRANSFER);
        }
        return Result<void>::Ok();
    }

private:
    SshIo io_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
};

} // namespace

// ── SftpClient ───────────────────────────────────────────────

SftpClient::SftpClient(SshIo io, LIBSSH2_SFTP* sftp) : io_(std::move(io)), sftp_(sftp) {}

SftpClient::~SftpClient() {
    if (sftp_) {
        int rc = ssh_retry(io_, [&] { return libssh2_sftp_shutdown(sftp_); }, 2);
        if (rc != 0) sshm_log(fmt::format("sftp shutdown failed ({})", rc));
        sftp_ = nullptr;
    }
}

std::string SftpClient::sftp_error(const std::string& what) {
    unsigned long code = 0;
    {
        std::lock_guard<std::mutex> lock(*io_.mutex);
        if (io_.is_alive()) code = libssh2_sftp_last_error(sftp_);
    }
    const char* text = status_text(code);
    if (text) return what + ": " + text;
    return ssh_error(io_, what);
}

Result<std::string> SftpClient::real_path(const std::string& path) {
    char buf[4096];
    int n = ssh_retry(io_, [&] {
        return libssh2_sftp_symlink_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                       buf, sizeof(buf) - 1, LIBSSH2_SFTP_REALPATH);
    });
    if (n < 0) {
        return Result<std::string>::Err(sftp_error("realpath " + path), ErrorCode::NOT_FOUND);
    }
    return Result<std::string>::Ok(std::string(buf, static_cast<size_t>(n)));
}

Result<RemoteFileInfo> SftpClient::stat_ex(const std::string& path, int stat_type, const char* op) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    int rc = ssh_retry(io_, [&] {
        return libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                    stat_type, &attrs);
    });
    if (rc != 0) {
        return Result<RemoteFileInfo>::Err(sftp_error(fmt::format("{} {}", op, path)),
                                           ErrorCode::NOT_FOUND);
    }
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return Result<RemoteFileInfo>::Ok(to_info(name, attrs));
}

Result<RemoteFileInfo> SftpClient::stat(const std::string& path) {
    return stat_ex(path, LIBSSH2_SFTP_STAT, "stat");
}

Result<RemoteFileInfo> SftpClient::lstat(const std::string& path) {
    return stat_ex(path, LIBSSH2_SFTP_LSTAT, "lstat");
}

Result<std::vector<RemoteFileInfo>> SftpClient::list_dir(const std::string& path) {
    using R = Result<std::vector<RemoteFileInfo>>;

    LIBSSH2_SFTP_HANDLE* dir = ssh_retry_ptr<LIBSSH2_SFTP_HANDLE>(io_, [&] {
        return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                    0, 0, LIBSSH2_SFTP_OPENDIR);
    });
    if (!dir) {
        return R::Err(sftp_error("opendir " + path), ErrorCode::NOT_FOUND);
    }

    std::vector<RemoteFileInfo> out;
    char filename[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::string error;

    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = ssh_retry(io_, [&] {
            return libssh2_sftp_readdir_ex(dir, filename, sizeof(filename), nullptr, 0, &attrs);
        });
        if (rc > 0) {
            std::string name(filename, static_cast<size_t>(rc));
            if (name == "." || name == "..") continue;
            out.push_back(to_info(name, attrs));
        } else if (rc == 0) {
            break;
        } else {
            error = sftp_error("readdir " + path);
            break;
        }
    }

    int rc = ssh_retry(io_, [&] { return libssh2_sftp_close_handle(dir); });
    if (rc != 0) sshm_log(fmt::format("close dir handle {} failed ({})", path, rc));
    if (!error.empty()) return R::Err(error, ErrorCode::IO);
    return R::Ok(std::move(out));
}

Result<std::unique_ptr<RemoteFile>> SftpClient::open(const std::string& path, unsigned long flags,
                                                     long mode, const char* op) {
    LIBSSH2_SFTP_HANDLE* handle = ssh_retry_ptr<LIBSSH2_SFTP_HANDLE>(io_, [&] {
        return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                    flags, mode, LIBSSH2_SFTP_OPENFILE);
    });
    if (!handle) {
        return Result<std::unique_ptr<RemoteFile>>::Err(
            sftp_error(fmt::format("{} {}", op, path)), ErrorCode::TRANSFER);
    }
    return Result<std::unique_ptr<RemoteFile>>::Ok(
        std::make_unique<SftpFile>(io_, handle, path));
}

Result<std::unique_ptr<RemoteFile>> SftpClient::open_read(const std::string& path) {
    return open(path, LIBSSH2_FXF_READ, 0, "open");
}

Result<std::unique_ptr<RemoteFile>> SftpClient::create(const std::string& path) {
    return open(path, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH, "create");
}

Result<void> SftpClient::remove(const std::string& path) {
    int rc = ssh_retry(io_, [&] {
        return libssh2_sftp_unlink_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()));
    });
    if (rc != 0) {
        return Result<void>::Err(sftp_error("remove " + path), ErrorCode::IO);
    }
    return Result<void>::Ok();
}

Result<void> SftpClient::mkdir(const std::string& path) {
    int rc = ssh_retry(io_, [&] {
        return libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                     LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP |
                                     LIBSSH2_SFTP_S_IXGRP | LIBSSH2_SFTP_S_IROTH |
                                     LIBSSH2_SFTP_S_IXOTH);
    });
    if (rc != 0) {
        return Result<void>::Err(sftp_error("mkdir " + path), ErrorCode::IO);
    }
    return Result<void>::Ok();
}
