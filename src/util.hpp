#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstdint>

namespace tooledchat {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Case-insensitive ASCII comparison
bool iequals(const std::string& a, const std::string& b);

// Substitute {key} placeholders. Unknown placeholders are left as-is.
std::string format_placeholders(const std::string& tmpl,
                                const std::vector<std::pair<std::string, std::string>>& values);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace tooledchat
