#ifndef DOCGATE_CORE_UTILS_HPP
#define DOCGATE_CORE_UTILS_HPP

#include <string>
#include <vector>

namespace docgate {

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter (empty trailing part dropped, like getline)
std::vector<std::string> split(const std::string& s, char delimiter);

// Split into lines, accepting \n and \r\n
std::vector<std::string> split_lines(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate to at most max_len bytes without cutting a UTF-8 sequence
std::string truncate_safe(const std::string& s, size_t max_len);

// ============ Path utilities ============

std::string get_home_dir();

// Resolve ~ to home directory
std::string resolve_user_path(const std::string& path);

// Resolve . and .. lexically
std::string normalize_path(const std::string& path);

// Make a path absolute against the working directory, then normalize it
std::string absolute_path(const std::string& path);

std::string join_path(const std::string& a, const std::string& b);
std::string dirname(const std::string& path);

// True when `path` equals `dir` or lies below it (both normalized absolute)
bool path_within(const std::string& path, const std::string& dir);

// Read a whole file; false if it cannot be opened
bool read_file(const std::string& path, std::string& out);

} // namespace docgate

#endif // DOCGATE_CORE_UTILS_HPP
