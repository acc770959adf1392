#include "neighbormap/device_classifier.hpp"
#include "neighbormap/config_manager.hpp"
#include "neighbormap/logger.hpp"
#include "neighbormap/utils.hpp"

#include <algorithm> // For std::find
#include <array>

namespace neighbormap {

namespace {

// Order in which capability categories are tested.
const std::array<CapabilityCategory, 5> CATEGORY_PRIORITY = {
    CapabilityCategory::ACCESS_POINT,
    CapabilityCategory::ROUTER,
    CapabilityCategory::SWITCH,
    CapabilityCategory::PHONE,
    CapabilityCategory::SERVER
};

const std::string DEVICE_TYPE_PREFIX = "device_type.";

std::string config_key_for(CapabilityCategory category) {
    switch (category) {
        case CapabilityCategory::ACCESS_POINT: return "access_point";
        case CapabilityCategory::ROUTER:       return "router";
        case CapabilityCategory::SWITCH:       return "switch";
        case CapabilityCategory::PHONE:        return "phone";
        case CapabilityCategory::SERVER:       return "server";
        default:                               return "other";
    }
}

} // namespace

std::string to_string(CapabilityCategory category) {
    switch (category) {
        case CapabilityCategory::ACCESS_POINT: return "access-point";
        case CapabilityCategory::ROUTER:       return "router";
        case CapabilityCategory::SWITCH:       return "switch";
        case CapabilityCategory::PHONE:        return "phone";
        case CapabilityCategory::SERVER:       return "server";
        case CapabilityCategory::OTHER:        return "other";
        default:                               return "unknown";
    }
}

std::optional<CapabilityCategory> category_from_string(const std::string& name) {
    std::string lowered = utils::to_lower(name);
    if (lowered == "router" || lowered == "routers") return CapabilityCategory::ROUTER;
    if (lowered == "switch" || lowered == "switches") return CapabilityCategory::SWITCH;
    if (lowered == "phone" || lowered == "phones") return CapabilityCategory::PHONE;
    if (lowered == "server" || lowered == "servers") return CapabilityCategory::SERVER;
    if (lowered == "access-point" || lowered == "access_point" || lowered == "ap" || lowered == "aps" ||
        lowered == "access-points" || lowered == "access_points") {
        return CapabilityCategory::ACCESS_POINT;
    }
    if (lowered == "other") return CapabilityCategory::OTHER;
    return std::nullopt;
}

// --- CrawlFilters ---

bool CrawlFilters::allows(CapabilityCategory category) const {
    switch (category) {
        case CapabilityCategory::ROUTER:       return include_routers;
        case CapabilityCategory::SWITCH:       return include_switches;
        case CapabilityCategory::PHONE:        return include_phones;
        case CapabilityCategory::SERVER:       return include_servers;
        case CapabilityCategory::ACCESS_POINT: return include_access_points;
        case CapabilityCategory::OTHER:        return include_other;
        default:                               return false;
    }
}

void CrawlFilters::set(CapabilityCategory category, bool enabled) {
    switch (category) {
        case CapabilityCategory::ROUTER:       include_routers = enabled; break;
        case CapabilityCategory::SWITCH:       include_switches = enabled; break;
        case CapabilityCategory::PHONE:        include_phones = enabled; break;
        case CapabilityCategory::SERVER:       include_servers = enabled; break;
        case CapabilityCategory::ACCESS_POINT: include_access_points = enabled; break;
        case CapabilityCategory::OTHER:        include_other = enabled; break;
    }
}

CrawlFilters CrawlFilters::from_config(const ConfigManager& config) {
    CrawlFilters filters;
    filters.include_routers = config.get_parameter_as<bool>("filter.include_routers").value_or(filters.include_routers);
    filters.include_switches = config.get_parameter_as<bool>("filter.include_switches").value_or(filters.include_switches);
    filters.include_phones = config.get_parameter_as<bool>("filter.include_phones").value_or(filters.include_phones);
    filters.include_servers = config.get_parameter_as<bool>("filter.include_servers").value_or(filters.include_servers);
    filters.include_access_points = config.get_parameter_as<bool>("filter.include_access_points").value_or(filters.include_access_points);
    filters.include_other = config.get_parameter_as<bool>("filter.include_other").value_or(filters.include_other);
    return filters;
}

// --- ClassifierConfig ---

std::map<CapabilityCategory, std::set<std::string>> ClassifierConfig::default_capability_tokens() {
    return {
        // Some Cisco APs advertise only "Trans-Bridge" over CDP
        {CapabilityCategory::ACCESS_POINT, {"trans-bridge", "w", "wlan", "access-point"}},
        {CapabilityCategory::ROUTER,       {"router", "r"}},
        {CapabilityCategory::SWITCH,       {"switch", "bridge", "s", "b"}},
        {CapabilityCategory::PHONE,        {"phone", "telephone", "t"}},
        {CapabilityCategory::SERVER,       {"host", "station", "h"}}
    };
}

ClassifierConfig ClassifierConfig::defaults() {
    ClassifierConfig config;
    DeviceTypeProfile ios;
    ios.id = "cisco_ios";
    ios.platform_patterns = {"cisco", "catalyst"};
    ios.description_patterns = {"IOS"};
    ios.priority = 50;
    config.profiles.push_back(ios);
    config.default_device_type = "cisco_ios";
    config.capability_tokens = default_capability_tokens();
    return config;
}

ClassifierConfig load_classifier_config(const ConfigManager& config, const MapperLogger& logger) {
    ClassifierConfig result;
    result.default_device_type = config.get_string("default_device_type").value_or("cisco_ios");
    result.capability_tokens = ClassifierConfig::default_capability_tokens();

    // Every id that has at least one device_type.<id>.* key
    std::set<std::string> defined_ids;
    for (const auto& pair : config.get_current_config_data()) {
        const std::string& key = pair.first;
        if (!utils::starts_with(key, DEVICE_TYPE_PREFIX)) continue;
        std::string rest = key.substr(DEVICE_TYPE_PREFIX.size());
        size_t dot = rest.find('.');
        if (dot != std::string::npos && dot > 0) {
            defined_ids.insert(rest.substr(0, dot));
        }
    }

    std::vector<std::string> order = config.get_string_list("device_types");
    if (order.empty()) {
        // Without an explicit list the only stable order is the key order
        order.assign(defined_ids.begin(), defined_ids.end());
        if (!order.empty()) {
            logger.warning("CLASSIFIER", "No 'device_types' order given; using alphabetical profile order");
        }
    }

    for (const std::string& id : defined_ids) {
        if (std::find(order.begin(), order.end(), id) == order.end()) {
            logger.warning("CLASSIFIER", "Profile '" + id + "' is not listed in 'device_types' and is ignored");
        }
    }

    std::set<std::string> seen;
    for (const std::string& id : order) {
        if (!seen.insert(id).second) {
            logger.warning("CLASSIFIER", "Duplicate profile '" + id + "' in 'device_types' ignored");
            continue;
        }
        DeviceTypeProfile profile;
        profile.id = id;
        profile.platform_patterns = config.get_string_list(DEVICE_TYPE_PREFIX + id + ".platforms");
        profile.description_patterns = config.get_string_list(DEVICE_TYPE_PREFIX + id + ".system_descriptions");
        profile.priority = config.get_parameter_as<int>(DEVICE_TYPE_PREFIX + id + ".priority").value_or(10);
        if (profile.platform_patterns.empty() && profile.description_patterns.empty()) {
            logger.warning("CLASSIFIER", "Profile '" + id + "' has no patterns and can only win as default");
        }
        result.profiles.push_back(profile);
    }

    for (CapabilityCategory category : CATEGORY_PRIORITY) {
        std::vector<std::string> tokens = config.get_string_list("capability." + config_key_for(category));
        if (tokens.empty()) continue;
        std::set<std::string>& bucket = result.capability_tokens[category];
        bucket.clear();
        for (const std::string& token : tokens) {
            bucket.insert(utils::to_lower(token));
        }
    }

    return result;
}

// --- DeviceClassifier ---

DeviceClassifier::DeviceClassifier(const MapperLogger& logger, ClassifierConfig config)
    : logger_(logger), config_(std::move(config)) {
}

bool DeviceClassifier::load_patterns(const std::string& path) {
    patterns_path_ = path;

    ConfigManager pattern_file;
    if (!pattern_file.load_config(path)) {
        logger_.error("CLASSIFIER", "Config file " + path + " not found, using defaults");
        config_ = ClassifierConfig::defaults();
        return false;
    }

    config_ = load_classifier_config(pattern_file, logger_);
    if (config_.profiles.empty()) {
        logger_.error("CLASSIFIER", "No device types defined in " + path + ", using defaults");
        config_ = ClassifierConfig::defaults();
        return false;
    }

    logger_.info("CLASSIFIER", "Device type detector initialized with " +
                               std::to_string(config_.profiles.size()) + " device types");
    return true;
}

bool DeviceClassifier::reload_patterns() {
    if (patterns_path_.empty()) {
        logger_.warning("CLASSIFIER", "No pattern file loaded yet; nothing to reload");
        return false;
    }
    bool ok = load_patterns(patterns_path_);
    if (ok) logger_.info("CLASSIFIER", "Configuration reloaded");
    return ok;
}

CapabilityCategory DeviceClassifier::resolve_category(const std::string& capabilities) const {
    std::vector<std::string> tokens = utils::tokenize(utils::to_lower(capabilities), ", ");

    for (CapabilityCategory category : CATEGORY_PRIORITY) {
        auto it = config_.capability_tokens.find(category);
        if (it == config_.capability_tokens.end()) continue;
        for (const std::string& token : tokens) {
            if (it->second.count(token)) {
                return category;
            }
        }
    }
    return CapabilityCategory::OTHER;
}

bool DeviceClassifier::should_crawl(const std::string& capabilities, const CrawlFilters& filters) const {
    if (utils::trim(capabilities).empty()) {
        return filters.include_routers || filters.include_switches;
    }
    return filters.allows(resolve_category(capabilities));
}

std::optional<std::string> DeviceClassifier::classify(const std::string& platform,
                                                      const std::string& system_description,
                                                      const std::string& capabilities,
                                                      const CrawlFilters& filters) const {
    if (!should_crawl(capabilities, filters)) {
        logger_.debug("CLASSIFIER", "Skipping device with capabilities: " + capabilities +
                                    " (category " + to_string(resolve_category(capabilities)) + ")");
        return std::nullopt;
    }

    std::string device_type = match_patterns(platform, system_description);
    logger_.debug("CLASSIFIER", "Platform '" + platform + "' / description '" + system_description +
                                "' detected as '" + device_type + "'");
    return device_type;
}

// Once the category gate passes, a non-empty platform always yields a type
// (an unmatched one falls back to the default), so the description is only
// consulted when the platform is empty. An LLDP chassis id in the platform
// field therefore classifies as the default type.
std::optional<std::string> DeviceClassifier::classify_neighbor(const NeighborRecord& neighbor,
                                                               const CrawlFilters& filters) const {
    if (!neighbor.remote_platform.empty()) {
        auto device_type = classify(neighbor.remote_platform, "", neighbor.remote_capabilities, filters);
        if (device_type) {
            return device_type;
        }
    }

    if (!neighbor.system_description.empty()) {
        auto device_type = classify("", neighbor.system_description, neighbor.remote_capabilities, filters);
        if (device_type) {
            return device_type;
        }
    }

    return std::nullopt;
}

std::string DeviceClassifier::match_patterns(const std::string& platform, const std::string& system_description) const {
    std::string platform_lower = utils::to_lower(platform);
    std::string desc_lower = utils::to_lower(system_description);

    const DeviceTypeProfile* best = nullptr;
    double best_score = 0.0;

    for (const DeviceTypeProfile& profile : config_.profiles) {
        double score = 0.0;

        for (const std::string& pattern : profile.platform_patterns) {
            if (!pattern.empty() && platform_lower.find(utils::to_lower(pattern)) != std::string::npos) {
                score += profile.priority;
                logger_.debug("CLASSIFIER", "Platform pattern '" + pattern + "' matched for " + profile.id);
                break;
            }
        }

        for (const std::string& pattern : profile.description_patterns) {
            if (!pattern.empty() && desc_lower.find(utils::to_lower(pattern)) != std::string::npos) {
                score += profile.priority * 0.5;
                logger_.debug("CLASSIFIER", "Description pattern '" + pattern + "' matched for " + profile.id);
                break;
            }
        }

        // Strictly greater: on a tie the earlier declared profile stays
        if (score > 0.0 && score > best_score) {
            best = &profile;
            best_score = score;
        }
    }

    if (best) {
        return best->id;
    }

    logger_.debug("CLASSIFIER", "No pattern matched, using default: " + config_.default_device_type);
    return config_.default_device_type;
}

} // namespace neighbormap
