#pragma once

#include <optional>
#include <string>

// Source of interactive input lines. Returns nullopt at end of input.
class LineReader {
public:
    virtual ~LineReader() = default;
    virtual std::optional<std::string> read_line(const std::string& prompt) = 0;
};

// GNU readline with history.
class ReadlineReader : public LineReader {
public:
    std::optional<std::string> read_line(const std::string& prompt) override;
};
