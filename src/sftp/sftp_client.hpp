#pragma once

#include <memory>
#include <string>
#include <vector>
#include <ssh/ssh_io.hpp>
#include "remote_fs.hpp"

typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

// RemoteFs over libssh2_sftp on a non-blocking session.
class SftpClient : public RemoteFs {
public:
    SftpClient(SshIo io, LIBSSH2_SFTP* sftp);
    ~SftpClient() override;

    Result<std::string> real_path(const std::string& path) override;
    Result<RemoteFileInfo> stat(const std::string& path) override;
    Result<RemoteFileInfo> lstat(const std::string& path) override;
    Result<std::vector<RemoteFileInfo>> list_dir(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> create(const std::string& path) override;
    Result<void> remove(const std::string& path) override;
    Result<void> mkdir(const std::string& path) override;

    SftpClient(const SftpClient&) = delete;
    SftpClient& operator=(const SftpClient&) = delete;

private:
    SshIo io_;
    LIBSSH2_SFTP* sftp_;

    Result<RemoteFileInfo> stat_ex(const std::string& path, int stat_type, const char* op);
    Result<std::unique_ptr<RemoteFile>> open(const std::string& path, unsigned long flags,
                                             long mode, const char* op);
    std::string sftp_error(const std::string& what);
};
