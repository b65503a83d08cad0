#include <gtest/gtest.h>
#include <cli/progress_bar.hpp>
#include <cstdio>
#include <string>

TEST(ProgressBarTest, RenderHalfway) {
    std::string line = ProgressBar::render("a.bin", 512, 1024, 0, 10);
    EXPECT_EQ(line, "a.bin  [=====>    ]  50%  512 B/1.00 KB");
}

TEST(ProgressBarTest, RenderComplete) {
    std::string line = ProgressBar::render("a.bin", 1024, 1024, 0, 4);
    EXPECT_EQ(line, "a.bin  [====] 100%  1.00 KB/1.00 KB");
}

TEST(ProgressBarTest, ZeroTotalShowsFull) {
    std::string line = ProgressBar::render("empty", 0, 0, 0, 4);
    EXPECT_NE(line.find("[====] 100%"), std::string::npos);
}

TEST(ProgressBarTest, RateIsAppended) {
    std::string line = ProgressBar::render("x", 0, 2048, 2048, 4);
    EXPECT_NE(line.find("[>   ]   0%"), std::string::npos);
    EXPECT_NE(line.find("  2.00 KB/s"), std::string::npos);
}

TEST(ProgressBarTest, OverrunIsClamped) {
    std::string line = ProgressBar::render("x", 4096, 1024, 0, 4);
    EXPECT_NE(line.find("100%"), std::string::npos);
}

TEST(ProgressBarTest, DrawsToStream) {
    FILE* f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    {
        ProgressBar bar(f, 4);
        bar.begin("f.txt", 100);
        bar.advance(100);
        bar.end(false);
    }
    std::rewind(f);
    std::string text;
    char buf[256];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) text.append(buf, n);
    std::fclose(f);

    EXPECT_NE(text.find("\r\033[Kf.txt  ["), std::string::npos);
    EXPECT_NE(text.find("100%"), std::string::npos);
    EXPECT_NE(text.find("  (failed)\n"), std::string::npos);
}
