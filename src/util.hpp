#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chorus {

// ISO 8601 timestamp
std::string timestamp_now();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a random UUID (version 4, lowercase hex)
std::string generate_id();

// Estimate token count from text (~4 chars per token)
uint32_t estimate_tokens(const std::string& text);

// Cut a string to at most max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string& text, size_t max_bytes);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace chorus
