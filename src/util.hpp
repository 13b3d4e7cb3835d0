#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace toolgate {

// Unix epoch milliseconds (frame timestamps)
int64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename, creating parent directories as needed.
bool atomic_write_file(const std::string& path, const std::string& content);

// Standard base64 (RFC 4648, padded)
std::string base64_encode(const std::string& data);

} // namespace toolgate
