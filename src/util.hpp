#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace docrelay {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// True if s begins with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Last path segment of a repository URL, without a trailing ".git".
// "https://github.com/acme/widgets.git" -> "widgets"
std::string repo_name_from_url(const std::string& url);

} // namespace docrelay
