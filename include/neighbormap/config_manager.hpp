#ifndef NEIGHBORMAP_CONFIG_MANAGER_HPP
#define NEIGHBORMAP_CONFIG_MANAGER_HPP

#include <cstdint> // For uint32_t, uint64_t
#include <string>
#include <vector>
#include <map>
#include <variant>
#include <optional>
#include <charconv>  // For std::from_chars (C++17 for string to number)

#include <fstream>   // For std::ifstream
#include <sstream>   // For std::stringstream
#include <algorithm> // For std::transform for case-insensitive string comparison
#include <limits>    // For std::numeric_limits

namespace neighbormap {
    class MapperLogger;
}

namespace neighbormap {

// Define supported configuration value types
using ConfigValue = std::variant<
    bool,
    int,
    uint32_t,
    uint64_t,
    double,
    std::string,
    std::vector<std::string>
>;

// Configuration data is stored as a map of string paths to ConfigValue
using ConfigurationData = std::map<std::string, ConfigValue>;

class ConfigManager {
public:
    ConfigManager() = default;

    // Loads "key = value" lines. Blank lines and lines starting with '#' are
    // skipped, malformed lines are skipped with a warning. Returns false only
    // when the file cannot be opened.
    bool load_config(const std::string& filename);

    std::optional<ConfigValue> get_parameter(const std::string& path) const {
        auto it = config_data_.find(path);
        if (it != config_data_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    // Template helper to get a parameter and cast it to a specific type.
    template<typename T>
    std::optional<T> get_parameter_as(const std::string& path) const {
        std::optional<ConfigValue> opt_val = get_parameter(path);
        if (opt_val.has_value() && std::holds_alternative<T>(opt_val.value())) {
            return std::get<T>(opt_val.value());
        }
        return std::nullopt; // Not found or type mismatch
    }

    // Returns the value as text whatever type it was parsed into. Values read
    // from a file come back exactly as written ("7965" stays "7965").
    std::optional<std::string> get_string(const std::string& path) const;

    // Splits a comma-separated value into trimmed, non-empty entries.
    // A std::vector<std::string> parameter is returned as is.
    std::vector<std::string> get_string_list(const std::string& path) const;

    // Sets a configuration parameter.
    void set_parameter(const std::string& path, ConfigValue value) {
        raw_values_.erase(path);
        config_data_[path] = std::move(value);
    }

    const ConfigurationData& get_current_config_data() const {
        return config_data_;
    }

    const std::string& get_loaded_filename() const {
        return loaded_config_filename_;
    }

    void set_logger(MapperLogger* logger) {
        logger_ = logger;
    }

    // Checks keys this application understands. Returns one message per problem.
    std::vector<std::string> validate_config(const ConfigurationData& config_to_validate) const;

private:
    ConfigurationData config_data_;
    std::map<std::string, std::string> raw_values_; // Text as it appeared in the file
    std::string loaded_config_filename_; // Stores the name of the file last loaded from
    MapperLogger* logger_ = nullptr;   // Optional: for logging internal errors/info

    static ConfigValue parse_value(const std::string& value_str) {
        std::string lower_value_str = value_str;
        std::transform(lower_value_str.begin(), lower_value_str.end(), lower_value_str.begin(), ::tolower);

        if (lower_value_str == "true") {
            return true;
        }
        if (lower_value_str == "false") {
            return false;
        }

        const char* begin = value_str.data();
        const char* end = value_str.data() + value_str.size();

        int int_val;
        auto [ptr, ec] = std::from_chars(begin, end, int_val);
        if (ec == std::errc() && ptr == end && !value_str.empty()) {
            return int_val;
        }

        uint64_t uint64_val;
        auto [ptr_u64, ec_u64] = std::from_chars(begin, end, uint64_val);
        if (ec_u64 == std::errc() && ptr_u64 == end && !value_str.empty()) {
            if (uint64_val <= std::numeric_limits<uint32_t>::max()) {
                return static_cast<uint32_t>(uint64_val);
            }
            return uint64_val;
        }

        double double_val;
        std::stringstream ss_double(value_str);
        ss_double >> double_val;
        if (!value_str.empty() && !ss_double.fail() && ss_double.eof()) {
            return double_val;
        }
        return value_str; // Default to string
    }
};

} // namespace neighbormap

#endif // NEIGHBORMAP_CONFIG_MANAGER_HPP
