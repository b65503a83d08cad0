#include "line_reader.hpp"
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

std::optional<std::string> ReadlineReader::read_line(const std::string& prompt) {
    char* raw = readline(prompt.c_str());
    if (!raw) return std::nullopt;   // EOF / Ctrl-D
    std::string line = raw;
    free(raw);
    if (line.find_first_not_of(" \t") != std::string::npos) {
        add_history(line.c_str());
    }
    return line;
}
