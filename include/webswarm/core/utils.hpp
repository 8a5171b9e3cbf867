#ifndef WEBSWARM_CORE_UTILS_HPP
#define WEBSWARM_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace webswarm {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds, for measuring durations
int64_t monotonic_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Replace all occurrences of 'from' with 'to'
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Lower-cased, whitespace-trimmed form used to compare target labels
std::string normalize_label(const std::string& label);

// Labels from "CLAIM: <label>" lines (case-insensitive, anywhere in the
// line), trimmed, in order. Blank labels are skipped. Linear in the input.
std::vector<std::string> claim_labels(const std::string& text);

// ============ Encoding utilities ============

// Decode standard base64 (padding and embedded whitespace tolerated).
// Returns false on malformed input.
bool base64_decode(const std::string& encoded, std::string& out);

// Short random hex identifier (8 chars) for runs and connections
std::string generate_short_id();

} // namespace webswarm

#endif // WEBSWARM_CORE_UTILS_HPP
