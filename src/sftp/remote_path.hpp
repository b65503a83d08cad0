#pragma once

#include <string>

// "/"-only path arithmetic for remote paths. Never goes through
// std::filesystem, whose separator rules belong to the local host.

// Collapse "//", "." and "..". Absolute paths stay absolute and ".." never
// climbs above "/". An empty relative result is ".".
std::string clean_remote_path(const std::string& path);

// base + "/" + rel, cleaned. rel starting with "/" replaces base.
std::string join_remote_path(const std::string& base, const std::string& rel);

// Last component ("/" for the root).
std::string remote_basename(const std::string& path);

// Everything before the last component ("/" or ".").
std::string remote_dirname(const std::string& path);
