#include <gtest/gtest.h>
#include <managers/transfer_engine.hpp>
#include "fakes.hpp"
#include <fstream>
#include <sstream>

namespace {

std::string pattern_data(size_t size) {
    std::string s(size, '\0');
    for (size_t i = 0; i < size; i++) s[i] = static_cast<char>('a' + (i * 7) % 26);
    return s;
}

void write_file(const fs::path& p, const std::string& data) {
    fs::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary) << data;
}

std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Cancels the transfer as soon as any bytes have been reported.
class CancelOnProgress : public TransferProgress {
public:
    explicit CancelOnProgress(CancelToken& token) : token_(token) {}
    void begin(const std::string&, uint64_t) override { begun++; }
    void advance(uint64_t bytes) override {
        advanced += bytes;
        token_.cancel();
    }
    void end(bool ok) override { ended_ok = ok; }

    int begun = 0;
    uint64_t advanced = 0;
    bool ended_ok = true;

private:
    CancelToken& token_;
};

} // namespace

class TransferEngineTest : public ::testing::Test {
protected:
    TempDir remote_root{"xfer_remote"};
    TempDir local_root{"xfer_local"};
    FakeRemoteFs remote{remote_root.path()};
    std::vector<std::string> messages;

    TransferEngine engine(TransferProgress* progress = nullptr) {
        return TransferEngine(remote, progress, [this](const std::string& m) { messages.push_back(m); });
    }

    bool said(const std::string& needle) const {
        for (const auto& m : messages) {
            if (m.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

TEST_F(TransferEngineTest, DownloadSingleFile) {
    std::string data = pattern_data(3 * 1024 * 1024 + 17);
    write_file(remote_root.path() / "f.bin", data);

    CancelToken cancel;
    auto dst = (local_root.path() / "copy.bin").string();
    auto r = engine().download("/f.bin", dst, cancel);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.files_done, 1u);
    EXPECT_EQ(r.value.bytes_done, data.size());
    EXPECT_EQ(read_file(dst), data);
    EXPECT_TRUE(said("Download complete: " + dst));
}

TEST_F(TransferEngineTest, DownloadIntoDirectoryAppendsName) {
    write_file(remote_root.path() / "docs" / "notes.txt", "hello");

    CancelToken cancel;
    auto r = engine().download("/docs/notes.txt", local_root.path().string(), cancel);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(local_root.path() / "notes.txt"), "hello");
}

TEST_F(TransferEngineTest, DirectoryContinuesPastFailures) {
    auto data_dir = remote_root.path() / "data";
    write_file(data_dir / "a.txt", "alpha");
    write_file(data_dir / "b.txt", "bravo");
    write_file(data_dir / "c.txt", "charlie");
    write_file(data_dir / "e.txt", "echo");
    write_file(data_dir / "sub" / "d.txt", pattern_data(4096));

    remote.fail_open = {"/data/b.txt"};
    remote.fail_after["/data/sub/d.txt"] = 100;   // dies mid-stream

    CancelToken cancel;
    auto dst = local_root.path() / "out";
    auto r = engine().download_dir("/data", dst.string(), cancel);

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::TRANSFER);
    EXPECT_EQ(r.error, "2 files failed to download");
    EXPECT_EQ(r.value.files_total, 5u);
    EXPECT_EQ(r.value.files_done, 3u);
    std::vector<std::string> failed = {"b.txt", "sub/d.txt"};
    EXPECT_EQ(r.value.failed, failed);

    EXPECT_EQ(read_file(dst / "a.txt"), "alpha");
    EXPECT_EQ(read_file(dst / "c.txt"), "charlie");
    EXPECT_EQ(read_file(dst / "e.txt"), "echo");
    EXPECT_FALSE(fs::exists(dst / "b.txt"));
    EXPECT_FALSE(fs::exists(dst / "sub" / "d.txt"));

    EXPECT_TRUE(said("Warning: failed to download b.txt"));
    EXPECT_TRUE(said("Download completed with 2 failures:"));
    EXPECT_TRUE(said("  - sub/d.txt"));
    EXPECT_TRUE(said("Download complete: 3/5 files"));
}

TEST_F(TransferEngineTest, CancelMidCopyLeavesNoPartialFile) {
    write_file(remote_root.path() / "big.bin", pattern_data(3 * 1024 * 1024));

    CancelToken cancel;
    CancelOnProgress progress(cancel);
    auto dst = local_root.path() / "big.bin";
    auto r = engine(&progress).download("/big.bin", dst.string(), cancel);

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::CANCELLED);
    EXPECT_GT(progress.advanced, 0u);
    EXPECT_FALSE(progress.ended_ok);
    EXPECT_FALSE(fs::exists(dst));
}

TEST_F(TransferEngineTest, CancelStopsDirectoryBatch) {
    for (int i = 0; i < 3; i++) {
        write_file(remote_root.path() / "many" / ("f" + std::to_string(i)), pattern_data(1024 * 1024));
    }

    CancelToken cancel;
    CancelOnProgress progress(cancel);
    auto dst = local_root.path() / "many";
    auto r = engine(&progress).download_dir("/many", dst.string(), cancel);

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::CANCELLED);
    EXPECT_EQ(progress.begun, 1);
    EXPECT_FALSE(fs::exists(dst / "f0"));
    EXPECT_FALSE(fs::exists(dst / "f1"));
}

TEST_F(TransferEngineTest, AlreadyCancelledTouchesNothing) {
    write_file(remote_root.path() / "f.txt", "data");

    CancelToken cancel;
    cancel.cancel();
    auto dst = local_root.path() / "f.txt";
    auto r = engine().download("/f.txt", dst.string(), cancel);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::CANCELLED);
    EXPECT_FALSE(fs::exists(dst));
}

TEST_F(TransferEngineTest, EmptyRemoteDirectory) {
    fs::create_directories(remote_root.path() / "empty");

    CancelToken cancel;
    auto dst = local_root.path() / "empty";
    auto r = engine().download("/empty", dst.string(), cancel);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.files_total, 0u);
    EXPECT_TRUE(fs::is_directory(dst));
    EXPECT_TRUE(said("Downloaded empty directory: " + dst.string()));
}

TEST_F(TransferEngineTest, RemoteScanSkipsSymlinks) {
    write_file(remote_root.path() / "tree" / "real.txt", "r");
    write_file(remote_root.path() / "tree" / "nested" / "deep.txt", "d");
    fs::create_symlink(remote_root.path() / "tree" / "real.txt", remote_root.path() / "tree" / "alias.txt");

    auto r = engine().scan_remote("/tree");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].rel_path, "nested/deep.txt");
    EXPECT_EQ(r.value[1].rel_path, "real.txt");
    EXPECT_EQ(r.value[1].size, 1u);
}

TEST_F(TransferEngineTest, LocalScanSkipsSymlinks) {
    auto src = local_root.path() / "src";
    write_file(src / "one.txt", "1");
    write_file(src / "inner" / "two.txt", "22");
    fs::create_symlink(src / "one.txt", src / "link.txt");

    auto r = engine().scan_local(src.string());
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].rel_path, "inner/two.txt");
    EXPECT_EQ(r.value[0].size, 2u);
    EXPECT_EQ(r.value[1].rel_path, "one.txt");
}

TEST_F(TransferEngineTest, UploadDirectory) {
    auto src = local_root.path() / "site";
    write_file(src / "index.html", "<html/>");
    write_file(src / "css" / "main.css", "body{}");

    CancelToken cancel;
    auto r = engine().upload(src.string(), "/www", cancel);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.files_done, 2u);
    EXPECT_EQ(read_file(remote_root.path() / "www" / "index.html"), "<html/>");
    EXPECT_EQ(read_file(remote_root.path() / "www" / "css" / "main.css"), "body{}");
    EXPECT_TRUE(said("Upload complete: 2/2 files"));
}

TEST_F(TransferEngineTest, UploadDirectoryOntoFileFails) {
    auto src = local_root.path() / "site";
    write_file(src / "index.html", "x");
    write_file(remote_root.path() / "www", "not a dir");

    CancelToken cancel;
    auto r = engine().upload_dir(src.string(), "/www", cancel);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("remote path '/www' already exists and is not a directory"),
              std::string::npos);
}

TEST_F(TransferEngineTest, UploadFileIntoRemoteDirectory) {
    write_file(local_root.path() / "report.pdf", "pdf");
    fs::create_directories(remote_root.path() / "inbox");

    CancelToken cancel;
    auto r = engine().upload((local_root.path() / "report.pdf").string(), "/inbox", cancel);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(read_file(remote_root.path() / "inbox" / "report.pdf"), "pdf");
}

TEST_F(TransferEngineTest, CancelledUploadRemovesRemotePartial) {
    write_file(local_root.path() / "big.bin", pattern_data(3 * 1024 * 1024));

    CancelToken cancel;
    CancelOnProgress progress(cancel);
    auto r = engine(&progress).upload((local_root.path() / "big.bin").string(), "/big.bin", cancel);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::CANCELLED);
    EXPECT_FALSE(fs::exists(remote_root.path() / "big.bin"));
}

TEST_F(TransferEngineTest, MissingLocalSource) {
    CancelToken cancel;
    auto r = engine().upload((local_root.path() / "nope").string(), "/x", cancel);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NOT_FOUND);
}
