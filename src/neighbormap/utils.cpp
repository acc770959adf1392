#include "neighbormap/utils.hpp"
#include <string>
#include <vector>
#include <sstream>
#include <stdexcept> // For std::stoi exceptions
#include <algorithm> // For std::transform
#include <cctype>    // For std::isspace, std::tolower

namespace neighbormap {
namespace utils {

std::optional<int> safe_stoi(const std::string& str) {
    try {
        size_t processed_chars = 0;
        int val = std::stoi(str, &processed_chars, 10);
        if (processed_chars != str.length()) {
            return std::nullopt;
        }
        return val;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string trim(const std::string& str) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::string to_lower(const std::string& str) {
    std::string lowered = str;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string segment;
    while (std::getline(ss, segment, delimiter)) {
        parts.push_back(segment);
    }
    // getline drops a trailing empty field; keep it so "a," yields two parts.
    if (!str.empty() && str.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::vector<std::string> tokenize(const std::string& str, const std::string& delimiters) {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < str.size()) {
        size_t start = str.find_first_not_of(delimiters, pos);
        if (start == std::string::npos) break;
        size_t end = str.find_first_of(delimiters, start);
        if (end == std::string::npos) end = str.size();
        tokens.push_back(str.substr(start, end - start));
        pos = end;
    }
    return tokens;
}

std::string value_after(const std::string& line, const std::string& label) {
    size_t pos = line.find(label);
    if (pos == std::string::npos) {
        return "";
    }
    return trim(line.substr(pos + label.size()));
}

std::string strip_domain(const std::string& name) {
    size_t dot = name.find('.');
    if (dot == std::string::npos) {
        return name;
    }
    return name.substr(0, dot);
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

} // namespace utils
} // namespace neighbormap
