#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <core/types.hpp>

// Attributes of a remote entry, POSIX mode bits as sent by the server.
struct RemoteFileInfo {
    std::string name;
    uint64_t size = 0;
    uint32_t mode = 0;
    int64_t mtime = 0;

    bool is_dir() const { return S_ISDIR(mode); }
    bool is_regular() const { return S_ISREG(mode); }
    bool is_symlink() const { return S_ISLNK(mode); }
};

class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns 0 at end of file.
    virtual Result<size_t> read(char* buf, size_t len) = 0;
    virtual Result<size_t> write(const char* buf, size_t len) = 0;
    virtual Result<void> close() = 0;
};

// File-transfer client on one transport. Paths are remote, "/"-separated.
class RemoteFs {
public:
    virtual ~RemoteFs() = default;

    // Server-side canonical absolute path.
    virtual Result<std::string> real_path(const std::string& path) = 0;

    virtual Result<RemoteFileInfo> stat(const std::string& path) = 0;
    virtual Result<RemoteFileInfo> lstat(const std::string& path) = 0;

    // Entries without "." and "..", attributes not following symlinks.
    virtual Result<std::vector<RemoteFileInfo>> list_dir(const std::string& path) = 0;

    virtual Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) = 0;

    // Create or truncate for writing.
    virtual Result<std::unique_ptr<RemoteFile>> create(const std::string& path) = 0;

    virtual Result<void> remove(const std::string& path) = 0;
    virtual Result<void> mkdir(const std::string& path) = 0;

    // mkdir -p. Existing directories are fine; an existing non-directory fails.
    Result<void> mkdir_all(const std::string& path);
};
