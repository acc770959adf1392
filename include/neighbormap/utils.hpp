#ifndef NEIGHBORMAP_UTILS_HPP
#define NEIGHBORMAP_UTILS_HPP

#include <string>    // For std::string
#include <optional>  // For std::optional
#include <stdexcept> // For std::invalid_argument, std::out_of_range (used in .cpp)
#include <vector>    // For std::vector

namespace neighbormap {
namespace utils {

// Safely converts a string to an int.
// Returns std::nullopt if conversion fails.
std::optional<int> safe_stoi(const std::string& str);

// Strips leading and trailing whitespace.
std::string trim(const std::string& str);

std::string to_lower(const std::string& str);

bool starts_with(const std::string& str, const std::string& prefix);

bool contains(const std::string& haystack, const std::string& needle);

// Splits on a single delimiter. Empty fields are kept.
std::vector<std::string> split(const std::string& str, char delimiter);

// Splits on any of the delimiter characters and drops empty tokens,
// e.g. "Router Switch,IGMP" -> {"Router", "Switch", "IGMP"}.
std::vector<std::string> tokenize(const std::string& str, const std::string& delimiters);

// Returns the text after the first occurrence of label, trimmed.
// Returns an empty string when label is absent.
std::string value_after(const std::string& line, const std::string& label);

// "dist-sw-01.corp.example.com" -> "dist-sw-01"
std::string strip_domain(const std::string& name);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace utils
} // namespace neighbormap

#endif // NEIGHBORMAP_UTILS_HPP
