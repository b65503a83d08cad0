#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <managers/transfer_engine.hpp>

// Single-line transfer progress on a stdio stream (stderr by default):
//   name  [=========>          ]  45%  12.50 MB/27.00 MB  3.20 MB/s
// Redraws are throttled; the final state is always drawn.
class ProgressBar : public TransferProgress {
public:
    explicit ProgressBar(FILE* out = stderr, int width = 30);

    void begin(const std::string& label, uint64_t total_bytes) override;
    void advance(uint64_t bytes) override;
    void end(bool ok) override;

    // Pure rendering, exposed for tests.
    static std::string render(const std::string& label, uint64_t done, uint64_t total,
                              double bytes_per_sec, int width);

private:
    FILE* out_;
    int width_;
    std::mutex mutex_;
    std::string label_;
    uint64_t total_ = 0;
    uint64_t done_ = 0;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point last_draw_;
    bool active_ = false;

    void draw();
};
