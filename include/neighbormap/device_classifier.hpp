#ifndef NEIGHBORMAP_DEVICE_CLASSIFIER_HPP
#define NEIGHBORMAP_DEVICE_CLASSIFIER_HPP

#include "neighbormap/neighbor_record.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <utility> // For std::move

namespace neighbormap {

class MapperLogger;
class ConfigManager;

// Coarse role derived from advertised capability tokens.
enum class CapabilityCategory {
    ACCESS_POINT,
    ROUTER,
    SWITCH,
    PHONE,
    SERVER,
    OTHER
};

std::string to_string(CapabilityCategory category);
std::optional<CapabilityCategory> category_from_string(const std::string& name);

// Which neighbor categories a discovery request is willing to crawl into.
struct CrawlFilters {
    bool include_routers = true;
    bool include_switches = true;
    bool include_phones = false;
    bool include_servers = false;
    bool include_access_points = false;
    bool include_other = false;

    bool allows(CapabilityCategory category) const;
    void set(CapabilityCategory category, bool enabled);

    // Reads filter.include_* keys; missing keys keep the defaults above.
    static CrawlFilters from_config(const ConfigManager& config);
};

// A connection profile (e.g. "cisco_nxos") and the strings that identify it.
struct DeviceTypeProfile {
    std::string id;
    std::vector<std::string> platform_patterns;     // Matched against CDP platform
    std::vector<std::string> description_patterns;  // Matched against LLDP system description
    int priority = 10;
};

struct ClassifierConfig {
    // Declaration order resolves score ties: the earlier profile wins.
    std::vector<DeviceTypeProfile> profiles;
    std::string default_device_type = "cisco_ios";
    // Lower-case capability tokens per category. OTHER has no tokens.
    std::map<CapabilityCategory, std::set<std::string>> capability_tokens;

    static ClassifierConfig defaults();
    static std::map<CapabilityCategory, std::set<std::string>> default_capability_tokens();
};

// Builds the typed profile list from the key=value pattern table:
//   default_device_type=cisco_ios
//   device_types=cisco_nxos,cisco_ios          (declared order)
//   device_type.cisco_nxos.platforms=N9K,Nexus
//   device_type.cisco_nxos.system_descriptions=NX-OS
//   device_type.cisco_nxos.priority=90
//   capability.router=router,r
ClassifierConfig load_classifier_config(const ConfigManager& config, const MapperLogger& logger);

class DeviceClassifier {
public:
    explicit DeviceClassifier(const MapperLogger& logger, ClassifierConfig config = ClassifierConfig::defaults());

    // Loads the pattern table from a file. On failure the built-in defaults
    // are installed and false is returned.
    bool load_patterns(const std::string& path);

    // Re-reads the file given to the last load_patterns call.
    bool reload_patterns();

    const ClassifierConfig& config() const { return config_; }

    // First matching category in priority order: access point, router,
    // switch, phone, server. Nothing matched (or no tokens) gives OTHER.
    CapabilityCategory resolve_category(const std::string& capabilities) const;

    // Category gate. An empty capability string means "unknown" and passes
    // when routers or switches are allowed.
    bool should_crawl(const std::string& capabilities, const CrawlFilters& filters) const;

    // Returns the device type to connect with, or std::nullopt for "do not crawl".
    std::optional<std::string> classify(const std::string& platform,
                                        const std::string& system_description,
                                        const std::string& capabilities,
                                        const CrawlFilters& filters) const;

    // Platform first; falls back to the system description if that gives nothing.
    std::optional<std::string> classify_neighbor(const NeighborRecord& neighbor,
                                                 const CrawlFilters& filters) const;

    // Highest scoring profile, or the default device type.
    std::string match_patterns(const std::string& platform, const std::string& system_description) const;

private:
    const MapperLogger& logger_;
    ClassifierConfig config_;
    std::string patterns_path_;
};

} // namespace neighbormap

#endif // NEIGHBORMAP_DEVICE_CLASSIFIER_HPP
