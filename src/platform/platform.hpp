#pragma once

#include <string>
#include <cstddef>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Write the whole buffer to fd, retrying on EINTR and short writes.
// Returns false if the fd reports an error.
bool write_all(int fd, const char* data, size_t len);

// Pipe with both ends close-on-exec and non-blocking. Returns false on failure.
bool make_pipe(int fds[2]);

// Consume everything currently readable from a non-blocking fd.
void drain_fd(int fd);

void close_fd(int& fd);

} // namespace platform
