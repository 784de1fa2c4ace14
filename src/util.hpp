#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace wacast {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Standard base64 (RFC 4648) with padding
std::string base64_encode(const std::string& data);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename; creates parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace wacast
