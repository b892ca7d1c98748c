#pragma once
#include <string>
#include <vector>

namespace termai {

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Join strings with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Cut to at most max_chars bytes, appending "..." when shortened.
// Never splits a UTF-8 sequence.
std::string truncate_text(const std::string& s, size_t max_chars);

// Remove trailing '/' characters (base URLs)
std::string strip_trailing_slashes(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace termai
