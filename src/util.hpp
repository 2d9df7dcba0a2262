#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chitin {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

bool starts_with(const std::string& s, const std::string& prefix);

// $HOME, else the password database entry. Empty if neither is available.
std::string home_dir();

// Expand ~ to home directory. Returns an empty string when `path` starts
// with ~ and no home directory is known, never a cwd-relative "~/...".
std::string expand_home(const std::string& path);

// Write content to a sibling temp file, fsync it, then rename over path.
// Creates the parent directory if needed. Returns false on any I/O failure,
// leaving the previous file (if any) untouched.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace chitin
