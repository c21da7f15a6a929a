#ifndef bashgate_CORE_UTILS_HPP
#define bashgate_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace bashgate {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Milliseconds on the monotonic clock (for deadlines, never wall time)
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Check if string starts with prefix

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Render control characters visibly ("\n" -> "\\n") for log and error text
std::string escape_control(const std::string& s);

// ============ Path utilities ============

// Lexically normalize a path: collapse "//", "." and "..", drop any
// trailing '/'. Does not touch the filesystem (symlinks are not resolved).
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

bool is_absolute_path(const std::string& path);

// Make `path` absolute against the process working directory, then normalize
std::string absolute_path(const std::string& path);

// True if `path` equals `base` or extends it by whole segments.
// Both arguments must already be normalized.
bool is_same_or_descendant(const std::string& path, const std::string& base);

// Process working directory, or "/" if it cannot be determined
std::string current_directory();

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// ============ Hashing utilities ============

// Lowercase hex SHA-256 of the input
std::string sha256_hex(const std::string& data);

// ============ ID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// Short random id used to correlate log lines of one request
std::string generate_request_id();

} // namespace bashgate

#endif // bashgate_CORE_UTILS_HPP
