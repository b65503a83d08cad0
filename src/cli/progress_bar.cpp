#include "progress_bar.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

static constexpr auto REDRAW_INTERVAL = std::chrono::milliseconds(100);

ProgressBar::ProgressBar(FILE* out, int width) : out_(out), width_(width) {}

std::string ProgressBar::render(const std::string& label, uint64_t done, uint64_t total,
                                double bytes_per_sec, int width) {
    if (width < 2) width = 2;
    double frac = total > 0 ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    if (frac > 1.0) frac = 1.0;

    int filled = static_cast<int>(frac * width);
    std::string bar;
    bar.reserve(width);
    for (int i = 0; i < width; i++) {
        if (i < filled) bar += '=';
        else if (i == filled && filled < width) bar += '>';
        else bar += ' ';
    }

    std::string line = fmt::format("{}  [{}] {:3d}%  {}/{}", label, bar,
                                   static_cast<int>(frac * 100), format_bytes(done),
                                   format_bytes(total));
    if (bytes_per_sec > 0) {
        line += "  " + format_bytes(static_cast<uint64_t>(bytes_per_sec)) + "/s";
    }
    return line;
}

void ProgressBar::begin(const std::string& label, uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    label_ = label;
    total_ = total_bytes;
    done_ = 0;
    started_ = std::chrono::steady_clock::now();
    last_draw_ = started_;
    active_ = true;
    draw();
}

void ProgressBar::advance(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return;
    done_ += bytes;
    auto now = std::chrono::steady_clock::now();
    if (now - last_draw_ < REDRAW_INTERVAL) return;
    last_draw_ = now;
    draw();
}

void ProgressBar::end(bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return;
    draw();
    fmt::print(out_, "{}\n", ok ? "" : "  (failed)");
    std::fflush(out_);
    active_ = false;
}

void ProgressBar::draw() {
    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    double rate = secs > 0.05 ? static_cast<double>(done_) / secs : 0.0;
    // \r and clear-to-end keep the bar on one line
    fmt::print(out_, "\r\033[K{}", render(label_, done_, total_, rate, width_));
    std::fflush(out_);
}
