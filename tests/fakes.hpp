#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <climits>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include <cli/line_reader.hpp>
#include <core/types.hpp>
#include <platform/terminal.hpp>
#include <sftp/remote_fs.hpp>
#include <sftp/remote_path.hpp>
#include <ssh/transport.hpp>

namespace fs = std::filesystem;

// ── Scratch directory ───────────────────────────────────────

class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::string pattern = (fs::temp_directory_path() / ("sshm_" + tag + "_XXXXXX")).string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        char* made = ::mkdtemp(buf.data());
        path_ = made ? fs::canonical(made) : fs::temp_directory_path() / ("sshm_" + tag);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// ── Pipes ───────────────────────────────────────────────────

// Stand-in for local stdin: tests write to it and close the write end for EOF.
struct Pipe {
    int fds[2] = {-1, -1};
    Pipe() { EXPECT_EQ(::pipe(fds), 0); }
    ~Pipe() {
        close_write();
        if (fds[0] >= 0) ::close(fds[0]);
    }
    int read_end() const { return fds[0]; }
    void write(const std::string& s) { ASSERT_EQ(::write(fds[1], s.data(), s.size()), (ssize_t)s.size()); }
    void close_write() {
        if (fds[1] >= 0) ::close(fds[1]);
        fds[1] = -1;
    }
};

// ── Events ──────────────────────────────────────────────────

// Ordered record of events shared by fakes: dial/close for transports,
// make_raw/set_state/close_input for terminal and session.
struct EventLog {
    std::mutex mutex;
    std::vector<std::string> events;
    int live = 0;

    void add(const std::string& e) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(e);
    }
    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
    int live_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return live;
    }

    // Position of the first event equal to e, -1 if absent.
    int index_of(const std::string& e) {
        std::lock_guard<std::mutex> lock(mutex);
        for (size_t i = 0; i < events.size(); i++) {
            if (events[i] == e) return static_cast<int>(i);
        }
        return -1;
    }
};

// ── Terminal ────────────────────────────────────────────────

// Terminal whose line discipline is a plain termios value. "Cooked" is
// ECHO|ICANON in c_lflag; make_raw clears it.
class FakeTerminal : public platform::TerminalDevice {
public:
    FakeTerminal() {
        std::memset(&current_, 0, sizeof(current_));
        current_.c_lflag = ECHO | ICANON;
    }

    Result<platform::TerminalState> get_state() override {
        std::lock_guard<std::mutex> lock(mutex_);
        get_state_calls++;
        platform::TerminalState s;
        s.attrs = current_;
        return Result<platform::TerminalState>::Ok(s);
    }

    Result<void> set_state(const platform::TerminalState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        set_state_calls++;
        if (events) events->add("set_state");
        if (fail_set_state) return Result<void>::Err("tcsetattr: injected failure");
        current_ = state.attrs;
        return Result<void>::Ok();
    }

    Result<void> make_raw() override {
        std::lock_guard<std::mutex> lock(mutex_);
        make_raw_calls++;
        if (events) events->add("make_raw");
        if (on_make_raw) on_make_raw();
        if (fail_make_raw) {
            current_.c_lflag = ICANON;   // half-applied
            return Result<void>::Err("tcsetattr: injected failure");
        }
        current_.c_lflag = 0;
        return Result<void>::Ok();
    }

    std::optional<platform::TerminalSize> size() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    bool is_cooked() {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_.c_lflag == (ECHO | ICANON);
    }

    bool is_raw() {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_.c_lflag == 0;
    }

    // Simulate the user changing the cooked settings between sessions.
    void set_lflag(tcflag_t flags) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.c_lflag = flags;
    }

    void set_size(std::optional<platform::TerminalSize> s) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_ = s;
    }

    std::atomic<int> get_state_calls{0};
    std::atomic<int> set_state_calls{0};
    std::atomic<int> make_raw_calls{0};
    std::atomic<bool> fail_set_state{false};
    std::atomic<bool> fail_make_raw{false};
    std::shared_ptr<EventLog> events;
    std::function<void()> on_make_raw;   // runs inside make_raw, before the switch

private:
    std::mutex mutex_;
    struct termios current_;
    std::optional<platform::TerminalSize> size_ = platform::TerminalSize{120, 40};
};

// ── Remote shell ────────────────────────────────────────────

class FakeSession : public RemoteSession {
public:
    Result<void> request_pty(const std::string& term, int width, int height) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pty_term = term;
        pty_width = width;
        pty_height = height;
        if (fail_pty) return Result<void>::Err("pty refused", ErrorCode::PROTOCOL);
        return Result<void>::Ok();
    }

    void set_output(int out_fd, int err_fd) override {
        std::lock_guard<std::mutex> lock(mutex_);
        this->out_fd = out_fd;
        this->err_fd = err_fd;
    }

    Result<void> start_shell() override {
        std::lock_guard<std::mutex> lock(mutex_);
        shell_started = true;
        return Result<void>::Ok();
    }

    Result<void> write_input(const char* data, size_t len) override {
        std::lock_guard<std::mutex> lock(mutex_);
        input.append(data, len);
        cv_.notify_all();
        return Result<void>::Ok();
    }

    Result<void> close_input() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            input_closed = true;
        }
        if (events) events->add("close_input");
        cv_.notify_all();
        if (exit_on_input_close) finish(0);
        return Result<void>::Ok();
    }

    Result<int> wait() override {
        std::unique_lock<std::mutex> lock(mutex_);
        waiting_ = true;
        cv_.notify_all();
        cv_.wait(lock, [&] { return finished_; });
        return Result<int>::Ok(exit_status_);
    }

    Result<void> close() override {
        close_calls++;
        finish(-1);
        return Result<void>::Ok();
    }

    Result<void> window_change(int width, int height) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return !stall_window_change; });
        resizes.push_back({width, height});
        return Result<void>::Ok();
    }

    // Remote side exits. Only the first call sets the status.
    void finish(int status) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (finished_) return;
            finished_ = true;
            exit_status_ = status;
        }
        cv_.notify_all();
    }

    void release_window_change() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stall_window_change = false;
        }
        cv_.notify_all();
    }

    bool wait_for_input(const std::string& expected, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return input == expected; });
    }

    // True once something is blocked in wait().
    bool wait_for_watcher(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return waiting_; });
    }

    bool is_finished() {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

    std::vector<platform::TerminalSize> resize_log() {
        std::lock_guard<std::mutex> lock(mutex_);
        return resizes;
    }

    std::string received_input() {
        std::lock_guard<std::mutex> lock(mutex_);
        return input;
    }

    std::string pty_term;
    int pty_width = 0;
    int pty_height = 0;
    int out_fd = -1;
    int err_fd = -1;
    bool shell_started = false;
    bool input_closed = false;
    bool fail_pty = false;
    bool exit_on_input_close = false;
    bool stall_window_change = false;
    std::atomic<int> close_calls{0};
    std::shared_ptr<EventLog> events;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::string input;
    std::vector<platform::TerminalSize> resizes;
    bool finished_ = false;
    bool waiting_ = false;
    int exit_status_ = -1;
};

// ── Transports ──────────────────────────────────────────────

class FakeTransport : public Transport {
public:
    FakeTransport(std::string name, std::shared_ptr<EventLog> log)
        : name_(std::move(name)), log_(std::move(log)) {
        std::lock_guard<std::mutex> lock(log_->mutex);
        log_->live++;
    }

    Result<std::shared_ptr<RemoteSession>> open_session() override {
        return Result<std::shared_ptr<RemoteSession>>::Ok(std::make_shared<FakeSession>());
    }

    Result<std::unique_ptr<RemoteFs>> open_sftp() override {
        return Result<std::unique_ptr<RemoteFs>>::Err("sftp not available", ErrorCode::PROTOCOL);
    }

    Result<std::unique_ptr<ForwardedStream>> dial(const std::string&, int) override {
        return Result<std::unique_ptr<ForwardedStream>>::Err("not supported", ErrorCode::CONNECTION);
    }

    Result<void> close() override {
        if (closed_) return Result<void>::Ok();
        closed_ = true;
        log_->add("close " + name_);
        {
            std::lock_guard<std::mutex> lock(log_->mutex);
            log_->live--;
        }
        if (fail_close) return Result<void>::Err("disconnect failed", ErrorCode::CONNECTION);
        return Result<void>::Ok();
    }

    bool is_active() const override { return !closed_; }
    const std::string& name() const override { return name_; }

    bool fail_close = false;

private:
    std::string name_;
    std::shared_ptr<EventLog> log_;
    bool closed_ = false;
};

class FakeDialer : public Dialer {
public:
    explicit FakeDialer(std::shared_ptr<EventLog> log) : log_(std::move(log)) {}

    Result<std::unique_ptr<Transport>> dial(const HostConfig& host, Transport* via,
                                            StatusCallback) override {
        log_->add("dial " + host.name + " via " + (via ? via->name() : std::string("direct")));
        if (fail_hosts.count(host.name)) {
            return Result<std::unique_ptr<Transport>>::Err("connection refused", ErrorCode::CONNECTION);
        }
        auto t = std::make_unique<FakeTransport>(host.name, log_);
        t->fail_close = fail_close_hosts.count(host.name) > 0;
        return Result<std::unique_ptr<Transport>>::Ok(std::move(t));
    }

    std::set<std::string> fail_hosts;
    std::set<std::string> fail_close_hosts;

private:
    std::shared_ptr<EventLog> log_;
};

// ── Remote filesystem ───────────────────────────────────────

// RemoteFs over a local directory: remote "/x" is <root>/x. Symlinks are
// real, so real_path canonicalises like a server would.
class FakeRemoteFs : public RemoteFs {
public:
    explicit FakeRemoteFs(const fs::path& root) : root_(fs::canonical(root)) {}

    fs::path local(const std::string& remote) const {
        std::string clean = clean_remote_path(remote);
        if (clean == "/") return root_;
        return root_ / clean.substr(1);
    }

    Result<std::string> real_path(const std::string& path) override {
        std::string p = path == "." ? cwd : (path[0] == '/' ? path : join_remote_path(cwd, path));
        char buf[PATH_MAX];
        if (!::realpath(local(p).c_str(), buf)) {
            return Result<std::string>::Err("realpath " + p + ": " + std::strerror(errno), ErrorCode::NOT_FOUND);
        }
        std::string real = buf;
        std::string root = root_.string();
        if (real == root) return Result<std::string>::Ok("/");
        if (real.compare(0, root.size() + 1, root + "/") != 0) {
            return Result<std::string>::Err("realpath " + p + ": outside root", ErrorCode::NOT_FOUND);
        }
        return Result<std::string>::Ok(real.substr(root.size()));
    }

    Result<RemoteFileInfo> stat(const std::string& path) override { return info(path, true); }
    Result<RemoteFileInfo> lstat(const std::string& path) override { return info(path, false); }

    Result<std::vector<RemoteFileInfo>> list_dir(const std::string& path) override {
        using R = Result<std::vector<RemoteFileInfo>>;
        std::error_code ec;
        std::vector<RemoteFileInfo> out;
        for (fs::directory_iterator it(local(path), ec), end; !ec && it != end; it.increment(ec)) {
            auto i = info(join_remote_path(path, it->path().filename().string()), false);
            if (i.is_ok()) out.push_back(i.value);
        }
        if (ec) return R::Err("opendir " + path + ": " + ec.message(), ErrorCode::NOT_FOUND);
        return R::Ok(std::move(out));
    }

    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override {
        using R = Result<std::unique_ptr<RemoteFile>>;
        std::string p = clean_remote_path(path);
        if (fail_open.count(p)) return R::Err("open " + p + ": permission denied", ErrorCode::IO);
        int fd = ::open(local(p).c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) return R::Err("open " + p + ": " + std::strerror(errno), ErrorCode::NOT_FOUND);
        uint64_t limit = fail_after.count(p) ? fail_after[p] : UINT64_MAX;
        return R::Ok(std::make_unique<File>(fd, limit));
    }

    Result<std::unique_ptr<RemoteFile>> create(const std::string& path) override {
        using R = Result<std::unique_ptr<RemoteFile>>;
        std::string p = clean_remote_path(path);
        if (fail_open.count(p)) return R::Err("open " + p + ": permission denied", ErrorCode::IO);
        int fd = ::open(local(p).c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) return R::Err("open " + p + ": " + std::strerror(errno), ErrorCode::NOT_FOUND);
        return R::Ok(std::make_unique<File>(fd, UINT64_MAX));
    }

    Result<void> remove(const std::string& path) override {
        if (::unlink(local(path).c_str()) != 0) {
            return Result<void>::Err("unlink " + path + ": " + std::strerror(errno));
        }
        return Result<void>::Ok();
    }

    Result<void> mkdir(const std::string& path) override {
        if (::mkdir(local(path).c_str(), 0755) != 0) {
            return Result<void>::Err("mkdir " + path + ": " + std::strerror(errno));
        }
        return Result<void>::Ok();
    }

    std::string cwd = "/";
    std::set<std::string> fail_open;                 // remote paths that refuse to open
    std::map<std::string, uint64_t> fail_after;      // reads fail once this many bytes are served

private:
    fs::path root_;

    class File : public RemoteFile {
    public:
        File(int fd, uint64_t limit) : fd_(fd), limit_(limit) {}
        ~File() override { if (fd_ >= 0) ::close(fd_); }

        Result<size_t> read(char* buf, size_t len) override {
            if (served_ >= limit_) return Result<size_t>::Err("connection lost", ErrorCode::IO);
            if (limit_ != UINT64_MAX && len > limit_ - served_) len = static_cast<size_t>(limit_ - served_);
            ssize_t n = ::read(fd_, buf, len);
            if (n < 0) return Result<size_t>::Err(std::strerror(errno));
            served_ += static_cast<uint64_t>(n);
            return Result<size_t>::Ok(static_cast<size_t>(n));
        }

        Result<size_t> write(const char* buf, size_t len) override {
            ssize_t n = ::write(fd_, buf, len);
            if (n < 0) return Result<size_t>::Err(std::strerror(errno));
            return Result<size_t>::Ok(static_cast<size_t>(n));
        }

        Result<void> close() override {
            if (fd_ >= 0) ::close(fd_);
            fd_ = -1;
            return Result<void>::Ok();
        }

    private:
        int fd_;
        uint64_t limit_;
        uint64_t served_ = 0;
    };

    Result<RemoteFileInfo> info(const std::string& path, bool follow) {
        struct ::stat st;
        std::string p = clean_remote_path(path);
        int rc = follow ? ::stat(local(p).c_str(), &st) : ::lstat(local(p).c_str(), &st);
        if (rc != 0) {
            return Result<RemoteFileInfo>::Err("stat " + p + ": no such file", ErrorCode::NOT_FOUND);
        }
        RemoteFileInfo i;
        i.name = remote_basename(p);
        i.size = static_cast<uint64_t>(st.st_size);
        i.mode = static_cast<uint32_t>(st.st_mode);
        i.mtime = static_cast<int64_t>(st.st_mtime);
        return Result<RemoteFileInfo>::Ok(i);
    }
};

// ── Line input ──────────────────────────────────────────────

class ScriptedReader : public LineReader {
public:
    explicit ScriptedReader(std::vector<std::string> lines) : lines_(lines.begin(), lines.end()) {}

    std::optional<std::string> read_line(const std::string& prompt) override {
        prompts.push_back(prompt);
        if (lines_.empty()) return std::nullopt;
        std::string line = lines_.front();
        lines_.pop_front();
        return line;
    }

    std::vector<std::string> prompts;

private:
    std::deque<std::string> lines_;
};
