#ifndef toolgate_CORE_UTILS_HPP
#define toolgate_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace toolgate {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds, for measuring durations
int64_t monotonic_ms();

// Format a millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// Human-readable duration: "850ms", "2.4s", "3m 12s"
std::string format_duration(int64_t ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Decode %XX escapes. Returns false on a malformed escape.
bool percent_decode(const std::string& in, std::string& out);

// Well-formed UTF-8: no overlongs, surrogates or code points above U+10FFFF.
bool is_valid_utf8(const std::string& s);

// ============ Path utilities ============

// Normalize path (resolve . and ..)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Parent directory of an absolute normalized path ("/" for top-level entries)
std::string parent_path(const std::string& path);

// Last path component
std::string base_name(const std::string& path);

// True if `path` equals `dir` or lies beneath it
bool is_within_dir(const std::string& path, const std::string& dir);

// Replace a leading "~" with $HOME
std::string expand_home(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

} // namespace toolgate

#endif // toolgate_CORE_UTILS_HPP
