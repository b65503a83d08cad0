#include <gtest/gtest.h>
#include <cli/sftp_shell.hpp>
#include "fakes.hpp"
#include <atomic>
#include <csignal>
#include <fstream>
#include <sstream>
#include <thread>

namespace {

// Presses Ctrl+C once the first bytes have been copied, then gives the
// shell time to react before the copy goes on.
class InterruptOnProgress : public TransferProgress {
public:
    void begin(const std::string&, uint64_t) override {}

    void advance(uint64_t) override {
        if (raised_.exchange(true)) return;
        ::raise(SIGINT);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
    }

    void end(bool ok) override { ended_ok = ok; }

    bool raised() const { return raised_; }
    std::atomic<bool> ended_ok{true};

private:
    std::atomic<bool> raised_{false};
};

} // namespace

class SftpShellTest : public ::testing::Test {
protected:
    TempDir remote_root{"shell_remote"};
    TempDir local_root{"shell_local"};
    FakeRemoteFs remote{remote_root.path()};
    std::ostringstream out;
    std::ostringstream err;
    std::unique_ptr<PathState> paths;
    std::unique_ptr<SftpShell> shell;

    void SetUp() override {
        fs::create_directories(remote_root.path() / "home" / "u" / "data");
        std::ofstream(remote_root.path() / "home" / "u" / "notes.txt") << "remote notes";
        std::ofstream(remote_root.path() / "home" / "u" / "data" / "1.csv") << "a,b\n";
        std::ofstream(local_root.path() / "report.txt") << "local report";

        std::string local = local_root.path().string();
        paths = std::make_unique<PathState>(remote, local, local, "/home/u", "/home/u");
        shell = std::make_unique<SftpShell>(remote, *paths, "me", "box", nullptr, out, err);
    }

    std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(SftpShellTest, UnknownCommandKeepsRunning) {
    EXPECT_TRUE(shell->execute_line("frobnicate now"));
    EXPECT_EQ(err.str(), "Error: unknown command: frobnicate\n");
}

TEST_F(SftpShellTest, BlankLineIsIgnored) {
    EXPECT_TRUE(shell->execute_line("   "));
    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(err.str().empty());
}

TEST_F(SftpShellTest, PrintWorkingDirectories) {
    EXPECT_TRUE(shell->execute_line("pwd"));
    EXPECT_TRUE(shell->execute_line("LPWD"));
    EXPECT_EQ(out.str(), "Remote working directory: /home/u\n"
                         "Local working directory: " + local_root.path().string() + "\n");
}

TEST_F(SftpShellTest, ChangeRemoteDirectory) {
    EXPECT_TRUE(shell->execute_line("cd data"));
    EXPECT_EQ(paths->remote_cwd(), "/home/u/data");
    EXPECT_TRUE(shell->execute_line("cd .."));
    EXPECT_EQ(paths->remote_cwd(), "/home/u");
    EXPECT_TRUE(err.str().empty());
}

TEST_F(SftpShellTest, ChangeRemoteDirectoryOntoFileFails) {
    EXPECT_TRUE(shell->execute_line("cd notes.txt"));
    EXPECT_EQ(paths->remote_cwd(), "/home/u");
    EXPECT_EQ(err.str(), "Error: /home/u/notes.txt is not a directory\n");
}

TEST_F(SftpShellTest, ChangeLocalDirectory) {
    fs::create_directories(local_root.path() / "out");
    EXPECT_TRUE(shell->execute_line("lcd out"));
    EXPECT_EQ(paths->local_cwd(), (local_root.path() / "out").string());

    EXPECT_TRUE(shell->execute_line("lcd ../report.txt"));
    EXPECT_NE(err.str().find("is not a directory"), std::string::npos);
}

TEST_F(SftpShellTest, ListingsAreSorted) {
    EXPECT_TRUE(shell->execute_line("ls"));
    std::string listing = out.str();
    auto data = listing.find(" data/\n");
    auto notes = listing.find(" notes.txt\n");
    ASSERT_NE(data, std::string::npos);
    ASSERT_NE(notes, std::string::npos);
    EXPECT_LT(data, notes);
    EXPECT_EQ(listing.rfind("drwx", 0), 0u);
}

TEST_F(SftpShellTest, MakeDirectories) {
    EXPECT_TRUE(shell->execute_line("mkdir new/deep"));
    EXPECT_TRUE(fs::is_directory(remote_root.path() / "home" / "u" / "new" / "deep"));
    EXPECT_TRUE(shell->execute_line("lmkdir made"));
    EXPECT_TRUE(fs::is_directory(local_root.path() / "made"));

    EXPECT_NE(out.str().find("Created remote directory: /home/u/new/deep\n"), std::string::npos);
    EXPECT_NE(out.str().find("Created local directory: " + (local_root.path() / "made").string()),
              std::string::npos);
}

TEST_F(SftpShellTest, MissingArgumentsShowUsage) {
    EXPECT_TRUE(shell->execute_line("get"));
    EXPECT_TRUE(shell->execute_line("put"));
    EXPECT_TRUE(shell->execute_line("mkdir"));
    EXPECT_NE(err.str().find("Error: usage: get remote-path [local-path]\n"), std::string::npos);
    EXPECT_NE(err.str().find("Error: usage: put local-path [remote-path]\n"), std::string::npos);
    EXPECT_NE(err.str().find("Error: usage: mkdir <path>\n"), std::string::npos);
}

TEST_F(SftpShellTest, GetDefaultsToLocalCwd) {
    EXPECT_TRUE(shell->execute_line("get notes.txt"));
    EXPECT_EQ(read_file(local_root.path() / "notes.txt"), "remote notes");
    EXPECT_NE(out.str().find("Download complete: "), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(SftpShellTest, GetDirectory) {
    EXPECT_TRUE(shell->execute_line("get data fetched"));
    EXPECT_EQ(read_file(local_root.path() / "fetched" / "1.csv"), "a,b\n");
}

TEST_F(SftpShellTest, PutDefaultsToRemoteCwd) {
    EXPECT_TRUE(shell->execute_line("cd data"));
    EXPECT_TRUE(shell->execute_line("put report.txt"));
    EXPECT_EQ(read_file(remote_root.path() / "home" / "u" / "data" / "report.txt"), "local report");
}

TEST_F(SftpShellTest, GetMissingFileReportsError) {
    EXPECT_TRUE(shell->execute_line("get nope.txt"));
    EXPECT_EQ(err.str().rfind("Error: ", 0), 0u);
    EXPECT_FALSE(fs::exists(local_root.path() / "nope.txt"));
}

TEST_F(SftpShellTest, HelpTable) {
    EXPECT_TRUE(shell->execute_line("help"));
    std::string help = out.str();
    EXPECT_NE(help.find("COMMAND"), std::string::npos);
    EXPECT_NE(help.find("Download file or directory"), std::string::npos);
    EXPECT_LT(help.find("lcd"), help.find("get"));

    out.str("");
    EXPECT_TRUE(shell->execute_line("?"));
    EXPECT_EQ(out.str(), help);
}

TEST_F(SftpShellTest, ExitAliases) {
    EXPECT_FALSE(shell->execute_line("exit"));
    EXPECT_FALSE(shell->execute_line("Quit"));
    EXPECT_FALSE(shell->execute_line("bye"));
}

TEST_F(SftpShellTest, PromptShowsRemoteCwd) {
    EXPECT_NE(shell->prompt().find("sftp me@box:/home/u>"), std::string::npos);
}

TEST_F(SftpShellTest, RunUntilEndOfInput) {
    ScriptedReader reader({"cd data", "pwd"});
    auto r = shell->run(reader);
    ASSERT_TRUE(r.is_ok());
    EXPECT_NE(out.str().find("Remote working directory: /home/u/data"), std::string::npos);
    ASSERT_EQ(reader.prompts.size(), 3u);
    EXPECT_NE(reader.prompts[2].find("sftp me@box:/home/u/data>"), std::string::npos);
}

TEST_F(SftpShellTest, RunStopsAtExit) {
    ScriptedReader reader({"exit", "pwd"});
    ASSERT_TRUE(shell->run(reader).is_ok());
    EXPECT_EQ(reader.prompts.size(), 1u);
    EXPECT_EQ(out.str().find("Remote working directory"), std::string::npos);
}

TEST_F(SftpShellTest, CtrlCDuringGetCancelsAndRemovesPartialFile) {
    std::ofstream(remote_root.path() / "home" / "u" / "big.bin", std::ios::binary)
        << std::string(4 * 1024 * 1024, 'z');

    InterruptOnProgress progress;
    SftpShell interactive(remote, *paths, "me", "box", &progress, out, err);
    ScriptedReader reader({"get big.bin", "pwd"});
    ASSERT_TRUE(interactive.run(reader).is_ok());

    EXPECT_TRUE(progress.raised());
    EXPECT_FALSE(progress.ended_ok);
    EXPECT_FALSE(fs::exists(local_root.path() / "big.bin"));
    EXPECT_NE(out.str().find("\n^C\nTransfer cancelled.\n"), std::string::npos);
    EXPECT_EQ(err.str().find("Error"), std::string::npos);

    // Back at the prompt afterwards
    EXPECT_NE(out.str().find("Remote working directory: /home/u\n"), std::string::npos);
    EXPECT_EQ(reader.prompts.size(), 3u);
}

TEST_F(SftpShellTest, TransferUnderRunFinishesWithoutInterrupt) {
    ScriptedReader reader({"get notes.txt", "put report.txt data/report.txt"});
    ASSERT_TRUE(shell->run(reader).is_ok());

    EXPECT_EQ(read_file(local_root.path() / "notes.txt"), "remote notes");
    EXPECT_EQ(read_file(remote_root.path() / "home" / "u" / "data" / "report.txt"), "local report");
    EXPECT_EQ(out.str().find("Transfer cancelled."), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}
