#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace llmgw {

// Trim whitespace
std::string trim(const std::string& s);

// Join with separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Shell-style glob: '*' matches any run, '?' one character. Case-sensitive.
bool glob_match(const std::string& pattern, const std::string& text);

// "my-provider" -> "MY_PROVIDER" (for env var names)
std::string env_key(const std::string& s);

// Write to a temp file beside path, then rename over it.
// Creates missing parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace llmgw
