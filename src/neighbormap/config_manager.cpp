#include "neighbormap/config_manager.hpp"
#include "neighbormap/logger.hpp"
#include "neighbormap/utils.hpp"

#include <sstream>     // For std::ostringstream
#include <type_traits> // For std::is_same_v, std::decay_t

namespace neighbormap {

bool ConfigManager::load_config(const std::string& filename) {
    if (logger_) logger_->info("ConfigManager", "Attempting to load configuration from: " + filename);

    std::ifstream file(filename);
    if (!file.is_open()) {
        if (logger_) logger_->error("ConfigManager", "Failed to open config file: " + filename);
        return false;
    }

    config_data_.clear();
    raw_values_.clear();
    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        line = utils::trim(line);

        if (line.empty() || line[0] == '#') { // Skip empty lines or comments
            continue;
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            if (logger_) logger_->warning("ConfigManager", "Skipping malformed line (no '='): " + line +
                                          " in file " + filename + " at line " + std::to_string(line_num));
            continue;
        }

        std::string key = utils::trim(line.substr(0, delimiter_pos));
        std::string value_str = utils::trim(line.substr(delimiter_pos + 1));

        if (key.empty()) {
            if (logger_) logger_->warning("ConfigManager", "Skipping line with empty key in file " + filename +
                                          " at line " + std::to_string(line_num));
            continue;
        }

        config_data_[key] = parse_value(value_str);
        raw_values_[key] = value_str;
        if (logger_) logger_->debug("ConfigManager", "Loaded: " + key + " = " + value_str);
    }

    loaded_config_filename_ = filename;
    if (logger_) logger_->info("ConfigManager", "Successfully loaded " + std::to_string(config_data_.size()) +
                               " parameters from " + filename);
    return true;
}

std::optional<std::string> ConfigManager::get_string(const std::string& path) const {
    auto raw_it = raw_values_.find(path);
    if (raw_it != raw_values_.end()) {
        return raw_it->second;
    }

    std::optional<ConfigValue> opt_val = get_parameter(path);
    if (!opt_val) {
        return std::nullopt;
    }

    std::ostringstream oss;
    std::visit([&](const auto& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, bool>) {
            oss << (val ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            oss << utils::join(val, ",");
        } else {
            oss << val;
        }
    }, opt_val.value());
    return oss.str();
}

std::vector<std::string> ConfigManager::get_string_list(const std::string& path) const {
    if (auto vec = get_parameter_as<std::vector<std::string>>(path)) {
        return vec.value();
    }

    std::vector<std::string> entries;
    std::optional<std::string> text = get_string(path);
    if (!text) {
        return entries;
    }
    for (const std::string& part : utils::split(text.value(), ',')) {
        std::string entry = utils::trim(part);
        if (!entry.empty()) {
            entries.push_back(entry);
        }
    }
    return entries;
}

std::vector<std::string> ConfigManager::validate_config(const ConfigurationData& config_to_validate) const {
    std::vector<std::string> errors;
    if (logger_) logger_->debug("ConfigManager", "Starting configuration validation...");

    for (const auto& pair : config_to_validate) {
        const std::string& key = pair.first;
        const ConfigValue& value = pair.second;

        if (key.empty()) {
            errors.push_back("Configuration key cannot be empty.");
            continue;
        }

        if (key == "discovery.max_depth") {
            const int* depth = std::get_if<int>(&value);
            if (!depth) {
                errors.push_back("Invalid type for key '" + key + "'. Expected a non-negative integer.");
            } else if (*depth < 0) {
                errors.push_back("Invalid value for key '" + key + "'. Depth cannot be negative.");
            }
        } else if (utils::starts_with(key, "device_type.") &&
                   key.size() > std::string(".priority").size() &&
                   key.compare(key.size() - 9, 9, ".priority") == 0) {
            if (!std::holds_alternative<int>(value)) {
                errors.push_back("Invalid type for key '" + key + "'. Expected an integer priority.");
            }
        } else if (utils::starts_with(key, "filter.")) {
            if (!std::holds_alternative<bool>(value)) {
                errors.push_back("Invalid type for key '" + key + "'. Expected true or false.");
            }
        } else if (utils::contains(key, "timeout_seconds")) {
            const int* seconds = std::get_if<int>(&value);
            if (!seconds || *seconds <= 0) {
                errors.push_back("Invalid value for key '" + key + "'. Expected a positive integer.");
            }
        }
    }

    if (logger_) {
        if (!errors.empty()) {
            logger_->warning("ConfigManager", "Configuration validation found " + std::to_string(errors.size()) + " errors.");
        } else {
            logger_->debug("ConfigManager", "Configuration validation successful.");
        }
    }
    return errors;
}

} // namespace neighbormap
