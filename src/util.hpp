#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace genstream {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch milliseconds
int64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Generate a simple unique ID (hex)
std::string generate_id();

// Standard base64 (with padding) of raw bytes, via OpenSSL
std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::string& data);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a temp file beside path, then rename over it. Creates parent dirs.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace genstream
