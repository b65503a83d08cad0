#include "transfer_engine.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <sftp/remote_path.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Owned POSIX descriptor for the local side of a copy.
class LocalFile {
public:
    ~LocalFile() { if (fd_ >= 0) ::close(fd_); }

    Result<void> open_read(const std::string& path) {
        fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ < 0) return Result<void>::Err(fmt::format("open {}: {}", path, std::strerror(errno)));
        return Result<void>::Ok();
    }

    Result<void> create(const std::string& path) {
        fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd_ < 0) return Result<void>::Err(fmt::format("create {}: {}", path, std::strerror(errno)));
        return Result<void>::Ok();
    }

    Result<size_t> read(char* buf, size_t len) {
        for (;;) {
            ssize_t n = ::read(fd_, buf, len);
            if (n >= 0) return Result<size_t>::Ok(static_cast<size_t>(n));
            if (errno == EINTR) continue;
            return Result<size_t>::Err(fmt::format("read: {}", std::strerror(errno)));
        }
    }

    Result<size_t> write(const char* buf, size_t len) {
        size_t off = 0;
        while (off < len) {
            ssize_t n = ::write(fd_, buf + off, len - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                return Result<size_t>::Err(fmt::format("write: {}", std::strerror(errno)));
            }
            off += static_cast<size_t>(n);
        }
        return Result<size_t>::Ok(len);
    }

    // Close without flushing; used before removing a partial file.
    void discard() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

    Result<void> sync_and_close() {
        int fd = fd_;
        fd_ = -1;
        if (::fsync(fd) != 0) {
            int err = errno;
            ::close(fd);
            return Result<void>::Err(fmt::format("sync: {}", std::strerror(err)));
        }
        if (::close(fd) != 0) {
            return Result<void>::Err(fmt::format("close: {}", std::strerror(errno)));
        }
        return Result<void>::Ok();
    }

private:
    int fd_ = -1;
};

// Shared copy loop. Cancellation is checked before every buffer.
template <typename ReadFn, typename WriteFn>
Result<uint64_t> copy_loop(ReadFn&& read_fn, WriteFn&& write_fn,
                           const CancelToken& cancel, TransferProgress* progress) {
    std::vector<char> buf(TRANSFER_BUF_SIZE);
    uint64_t total = 0;
    uint64_t pending = 0;

    for (;;) {
        if (cancel.cancelled()) {
            return Result<uint64_t>::Err("transfer cancelled", ErrorCode::CANCELLED);
        }
        auto r = read_fn(buf.data(), buf.size());
        if (r.is_err()) return Result<uint64_t>::Err(r.error, r.code);
        if (r.value == 0) break;

        auto w = write_fn(buf.data(), r.value);
        if (w.is_err()) return Result<uint64_t>::Err(w.error, w.code);

        total += r.value;
        pending += r.value;
        if (progress && pending >= PROGRESS_BATCH_BYTES) {
            progress->advance(pending);
            pending = 0;
        }
    }
    if (progress && pending > 0) progress->advance(pending);
    return Result<uint64_t>::Ok(total);
}

std::string local_basename(const std::string& path) {
    std::string s = path;
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return fs::path(s).filename().string();
}

bool local_is_dir(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

void remove_local_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) sshm_log(fmt::format("remove partial {}: {}", path, ec.message()));
}

} // namespace

TransferEngine::TransferEngine(RemoteFs& remote, TransferProgress* progress, StatusCallback status)
    : remote_(remote), progress_(progress), status_(std::move(status)) {}

void TransferEngine::say(const std::string& msg) const {
    if (status_) status_(msg);
}

// ── Single files ────────────────────────────────────────────

Result<uint64_t> TransferEngine::download_file(const std::string& remote_src,
                                               const std::string& local_dst,
                                               const CancelToken& cancel,
                                               const std::string& label) {
    if (cancel.cancelled()) {
        return Result<uint64_t>::Err("transfer cancelled", ErrorCode::CANCELLED);
    }

    auto info = remote_.stat(remote_src);
    if (info.is_err()) {
        return Result<uint64_t>::Err("stat remote file: " + info.error, info.code);
    }
    auto src = remote_.open_read(remote_src);
    if (src.is_err()) {
        return Result<uint64_t>::Err("open remote file: " + src.error, src.code);
    }

    LocalFile dst;
    auto created = dst.create(local_dst);
    if (created.is_err()) {
        auto closed = src.value->close();
        if (closed.is_err()) sshm_log("close remote " + remote_src + ": " + closed.error);
        return Result<uint64_t>::Err("create local file: " + created.error, created.code);
    }

    if (progress_) progress_->begin(label.empty() ? local_basename(local_dst) : label, info.value.size);

    auto copied = copy_loop(
        [&](char* buf, size_t len) { return src.value->read(buf, len); },
        [&](const char* buf, size_t len) { return dst.write(buf, len); },
        cancel, progress_);

    auto src_closed = src.value->close();
    if (src_closed.is_err()) sshm_log("close remote " + remote_src + ": " + src_closed.error);

    Result<uint64_t> result = copied;
    if (copied.is_ok() && copied.value != info.value.size) {
        result = Result<uint64_t>::Err(
            fmt::format("incomplete download: got {} bytes, expected {} bytes",
                        copied.value, info.value.size), ErrorCode::TRANSFER);
    } else if (copied.is_err() && copied.code != ErrorCode::CANCELLED) {
        result.error = "copy data: " + copied.error;
    }
    if (result.is_ok()) {
        auto synced = dst.sync_and_close();
        if (synced.is_err()) result = Result<uint64_t>::Err(synced.error, synced.code);
    }

    if (progress_) progress_->end(result.is_ok());
    if (result.is_err()) {
        dst.discard();
        remove_local_quietly(local_dst);
    }
    return result;
}

Result<uint64_t> TransferEngine::upload_file(const std::string& local_src,
                                             const std::string& remote_dst,
                                             const CancelToken& cancel,
                                             const std::string& label) {
    if (cancel.cancelled()) {
        return Result<uint64_t>::Err("transfer cancelled", ErrorCode::CANCELLED);
    }

    std::error_code ec;
    uint64_t expected = fs::file_size(local_src, ec);
    if (ec) {
        return Result<uint64_t>::Err(fmt::format("stat local file: {}: {}", local_src, ec.message()));
    }

    LocalFile src;
    auto opened = src.open_read(local_src);
    if (opened.is_err()) {
        return Result<uint64_t>::Err("open local file: " + opened.error, opened.code);
    }
    auto dst = remote_.create(remote_dst);
    if (dst.is_err()) {
        return Result<uint64_t>::Err("create remote file: " + dst.error, dst.code);
    }

    if (progress_) progress_->begin(label.empty() ? remote_basename(remote_dst) : label, expected);

    auto copied = copy_loop(
        [&](char* buf, size_t len) { return src.read(buf, len); },
        [&](const char* buf, size_t len) { return dst.value->write(buf, len); },
        cancel, progress_);

    Result<uint64_t> result = copied;
    if (copied.is_ok() && copied.value != expected) {
        result = Result<uint64_t>::Err(
            fmt::format("incomplete upload: sent {} bytes, expected {} bytes",
                        copied.value, expected), ErrorCode::TRANSFER);
    } else if (copied.is_err() && copied.code != ErrorCode::CANCELLED) {
        result.error = "copy data: " + copied.error;
    }

    auto closed = dst.value->close();
    if (result.is_ok() && closed.is_err()) {
        result = Result<uint64_t>::Err("close remote file: " + closed.error, closed.code);
    }

    if (progress_) progress_->end(result.is_ok());
    if (result.is_err()) {
        auto removed = remote_.remove(remote_dst);
        if (removed.is_err()) sshm_log("remove partial " + remote_dst + ": " + removed.error);
    }
    return result;
}

// ── Scans ───────────────────────────────────────────────────

Result<void> TransferEngine::walk_remote(const std::string& root, const std::string& rel,
                                         std::vector<TransferEntry>& out) {
    std::string dir = rel.empty() ? root : join_remote_path(root, rel);
    auto entries = remote_.list_dir(dir);
    if (entries.is_err()) {
        return Result<void>::Err(fmt::format("list {}: {}", dir, entries.error), entries.code);
    }
    for (const auto& e : entries.value) {
        std::string child = rel.empty() ? e.name : rel + "/" + e.name;
        if (e.is_dir()) {
            auto r = walk_remote(root, child, out);
            if (r.is_err()) return r;
        } else if (e.is_regular()) {
            out.push_back({child, e.size});
        }
    }
    return Result<void>::Ok();
}

Result<std::vector<TransferEntry>> TransferEngine::scan_remote(const std::string& root) {
    std::vector<TransferEntry> out;
    auto r = walk_remote(root, "", out);
    if (r.is_err()) return Result<std::vector<TransferEntry>>::Err("scan remote directory: " + r.error, r.code);
    std::sort(out.begin(), out.end(),
              [](const TransferEntry& a, const TransferEntry& b) { return a.rel_path < b.rel_path; });
    return Result<std::vector<TransferEntry>>::Ok(std::move(out));
}

Result<std::vector<TransferEntry>> TransferEngine::scan_local(const std::string& root) {
    std::vector<TransferEntry> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, ec), end;
    if (ec) {
        return Result<std::vector<TransferEntry>>::Err(
            fmt::format("scan local directory: {}: {}", root, ec.message()));
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return Result<std::vector<TransferEntry>>::Err(
                fmt::format("scan local directory: {}: {}", root, ec.message()));
        }
        // symlink_status: links are skipped, never followed
        auto st = it->symlink_status(ec);
        if (ec || !fs::is_regular_file(st)) continue;
        auto size = it->file_size(ec);
        if (ec) continue;
        std::string rel = it->path().lexically_relative(root).generic_string();
        out.push_back({rel, size});
    }
    std::sort(out.begin(), out.end(),
              [](const TransferEntry& a, const TransferEntry& b) { return a.rel_path < b.rel_path; });
    return Result<std::vector<TransferEntry>>::Ok(std::move(out));
}

// ── Directories ─────────────────────────────────────────────

Result<TransferSummary> TransferEngine::download_dir(const std::string& remote_src,
                                                     const std::string& local_dst,
                                                     const CancelToken& cancel) {
    using R = Result<TransferSummary>;

    auto scanned = scan_remote(remote_src);
    if (scanned.is_err()) return R::Err(scanned.error, scanned.code);

    std::error_code ec;
    if (fs::exists(local_dst, ec) && !fs::is_directory(local_dst, ec)) {
        return R::Err(fmt::format("local path '{}' already exists and is not a directory", local_dst));
    }
    fs::create_directories(local_dst, ec);
    if (ec) return R::Err(fmt::format("create local directory {}: {}", local_dst, ec.message()));

    TransferSummary sum;
    sum.files_total = scanned.value.size();
    for (const auto& e : scanned.value) sum.bytes_total += e.size;

    if (sum.files_total == 0) {
        say("Downloaded empty directory: " + local_dst);
        return R::Ok(sum);
    }

    say(fmt::format("\nDownloading {} ({} files, {} total)", remote_src, sum.files_total,
                    format_bytes(sum.bytes_total)));

    for (size_t i = 0; i < scanned.value.size(); i++) {
        const auto& e = scanned.value[i];
        if (cancel.cancelled()) return R::Err("transfer cancelled", ErrorCode::CANCELLED);

        fs::path dst = fs::path(local_dst) / e.rel_path;
        fs::create_directories(dst.parent_path(), ec);
        Result<uint64_t> r = ec
            ? Result<uint64_t>::Err(fmt::format("create local directory {}: {}",
                                                dst.parent_path().string(), ec.message()))
            : download_file(join_remote_path(remote_src, e.rel_path), dst.string(), cancel,
                            fmt::format("[{}/{}] {}", i + 1, sum.files_total, e.rel_path));
        if (r.is_err()) {
            if (r.code == ErrorCode::CANCELLED) return R::Err(r.error, r.code);
            say(fmt::format("Warning: failed to download {}: {}", e.rel_path, r.error));
            sum.failed.push_back(e.rel_path);
            continue;
        }
        sum.files_done++;
        sum.bytes_done += r.value;
    }

    if (!sum.failed.empty()) {
        say(fmt::format("Download completed with {} failures:", sum.failed.size()));
        for (const auto& f : sum.failed) say("  - " + f);
    }
    say(fmt::format("Download complete: {}/{} files, {}/{} downloaded", sum.files_done,
                    sum.files_total, format_bytes(sum.bytes_done), format_bytes(sum.bytes_total)));

    if (!sum.failed.empty()) {
        R r = R::Err(fmt::format("{} files failed to download", sum.failed.size()), ErrorCode::TRANSFER);
        r.value = sum;
        return r;
    }
    return R::Ok(sum);
}

Result<TransferSummary> TransferEngine::upload_dir(const std::string& local_src,
                                                   const std::string& remote_dst,
                                                   const CancelToken& cancel) {
    using R = Result<TransferSummary>;

    auto scanned = scan_local(local_src);
    if (scanned.is_err()) return R::Err(scanned.error, scanned.code);

    auto existing = remote_.stat(remote_dst);
    if (existing.is_ok() && !existing.value.is_dir()) {
        return R::Err(fmt::format("remote path '{}' already exists and is not a directory", remote_dst));
    }
    auto made = remote_.mkdir_all(remote_dst);
    if (made.is_err()) return R::Err("create remote directory: " + made.error, made.code);

    TransferSummary sum;
    sum.files_total = scanned.value.size();
    for (const auto& e : scanned.value) sum.bytes_total += e.size;

    if (sum.files_total == 0) {
        say("Uploaded empty directory: " + remote_dst);
        return R::Ok(sum);
    }

    say(fmt::format("\nUploading {} ({} files, {} total)", local_src, sum.files_total,
                    format_bytes(sum.bytes_total)));

    for (size_t i = 0; i < scanned.value.size(); i++) {
        const auto& e = scanned.value[i];
        if (cancel.cancelled()) return R::Err("transfer cancelled", ErrorCode::CANCELLED);

        std::string dst = join_remote_path(remote_dst, e.rel_path);
        auto parent = remote_.mkdir_all(remote_dirname(dst));
        Result<uint64_t> r = parent.is_err()
            ? Result<uint64_t>::Err("create remote directory: " + parent.error, parent.code)
            : upload_file((fs::path(local_src) / e.rel_path).string(), dst, cancel,
                          fmt::format("[{}/{}] {}", i + 1, sum.files_total, e.rel_path));
        if (r.is_err()) {
            if (r.code == ErrorCode::CANCELLED) return R::Err(r.error, r.code);
            say(fmt::format("Warning: failed to upload {}: {}", e.rel_path, r.error));
            sum.failed.push_back(e.rel_path);
            continue;
        }
        sum.files_done++;
        sum.bytes_done += r.value;
    }

    if (!sum.failed.empty()) {
        say(fmt::format("Upload completed with {} failures:", sum.failed.size()));
        for (const auto& f : sum.failed) say("  - " + f);
    }
    say(fmt::format("Upload complete: {}/{} files, {}/{} uploaded", sum.files_done,
                    sum.files_total, format_bytes(sum.bytes_done), format_bytes(sum.bytes_total)));

    if (!sum.failed.empty()) {
        R r = R::Err(fmt::format("{} files failed to upload", sum.failed.size()), ErrorCode::TRANSFER);
        r.value = sum;
        return r;
    }
    return R::Ok(sum);
}

// ── Dispatch ────────────────────────────────────────────────

Result<TransferSummary> TransferEngine::download(const std::string& remote_src,
                                                 const std::string& local_dst,
                                                 const CancelToken& cancel) {
    using R = Result<TransferSummary>;

    auto info = remote_.stat(remote_src);
    if (info.is_err()) return R::Err("stat remote path: " + info.error, info.code);

    if (info.value.is_dir()) return download_dir(remote_src, local_dst, cancel);

    std::string dst = local_dst;
    if (local_is_dir(dst)) dst = (fs::path(dst) / remote_basename(remote_src)).string();

    auto r = download_file(remote_src, dst, cancel);
    if (r.is_err()) return R::Err(r.error, r.code);

    say(fmt::format("Download complete: {} ({})", dst, format_bytes(r.value)));
    TransferSummary sum;
    sum.files_total = sum.files_done = 1;
    sum.bytes_total = sum.bytes_done = r.value;
    return R::Ok(sum);
}

Result<TransferSummary> TransferEngine::upload(const std::string& local_src,
                                               const std::string& remote_dst,
                                               const CancelToken& cancel) {
    using R = Result<TransferSummary>;

    std::error_code ec;
    auto st = fs::status(local_src, ec);
    if (ec || !fs::exists(st)) {
        return R::Err(fmt::format("stat local path: {}: {}", local_src,
                                  ec ? ec.message() : "No such file or directory"),
                      ErrorCode::NOT_FOUND);
    }

    if (fs::is_directory(st)) return upload_dir(local_src, remote_dst, cancel);

    auto existing = remote_.stat(remote_dst);
    bool dst_is_dir = existing.is_ok() && existing.value.is_dir();
    std::string dst = dst_is_dir ? join_remote_path(remote_dst, local_basename(local_src)) : remote_dst;

    auto r = upload_file(local_src, dst, cancel);
    if (r.is_err()) return R::Err(r.error, r.code);

    say(fmt::format("Upload complete: {} ({})", dst, format_bytes(r.value)));
    TransferSummary sum;
    sum.files_total = sum.files_done = 1;
    sum.bytes_total = sum.bytes_done = r.value;
    return R::Ok(sum);
}
