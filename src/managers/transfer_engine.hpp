#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <sftp/remote_fs.hpp>

// Cooperative cancellation flag. Set from any thread, observed by the engine
// before each file and at every buffer boundary.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }
    void reset() { flag_.store(false); }

private:
    std::atomic<bool> flag_{false};
};

// Byte-level progress for one file at a time.
class TransferProgress {
public:
    virtual ~TransferProgress() = default;
    virtual void begin(const std::string& label, uint64_t total_bytes) = 0;
    virtual void advance(uint64_t bytes) = 0;
    virtual void end(bool ok) = 0;
};

// One regular file found by a directory pre-scan.
struct TransferEntry {
    std::string rel_path;   // "/"-separated, relative to the scanned root
    uint64_t size = 0;
};

struct TransferSummary {
    size_t files_total = 0;
    size_t files_done = 0;
    uint64_t bytes_total = 0;
    uint64_t bytes_done = 0;
    std::vector<std::string> failed;   // relative paths, in transfer order
};

// Single-file and recursive transfers between the local filesystem and a
// RemoteFs. A failed or cancelled file never leaves a partial destination.
// Directory transfers continue past per-file failures and fail overall if
// any file failed; cancellation stops the batch with CANCELLED.
class TransferEngine {
public:
    explicit TransferEngine(RemoteFs& remote, TransferProgress* progress = nullptr,
                            StatusCallback status = nullptr);

    // Absolute paths. A file source landing on an existing directory gets
    // the source name appended; a directory source is merged into the
    // destination directory.
    Result<TransferSummary> download(const std::string& remote_src, const std::string& local_dst,
                                     const CancelToken& cancel);
    Result<TransferSummary> upload(const std::string& local_src, const std::string& remote_dst,
                                   const CancelToken& cancel);

    Result<uint64_t> download_file(const std::string& remote_src, const std::string& local_dst,
                                   const CancelToken& cancel, const std::string& label = "");
    Result<uint64_t> upload_file(const std::string& local_src, const std::string& remote_dst,
                                 const CancelToken& cancel, const std::string& label = "");

    Result<TransferSummary> download_dir(const std::string& remote_src, const std::string& local_dst,
                                         const CancelToken& cancel);
    Result<TransferSummary> upload_dir(const std::string& local_src, const std::string& remote_dst,
                                       const CancelToken& cancel);

    // Recursive listings of regular files; symlinks, devices, sockets and
    // pipes are skipped. Sorted by relative path.
    Result<std::vector<TransferEntry>> scan_remote(const std::string& root);
    Result<std::vector<TransferEntry>> scan_local(const std::string& root);

private:
    RemoteFs& remote_;
    TransferProgress* progress_;
    StatusCallback status_;

    void say(const std::string& msg) const;
    Result<void> walk_remote(const std::string& root, const std::string& rel,
                             std::vector<TransferEntry>& out);
};
