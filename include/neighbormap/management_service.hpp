#ifndef NEIGHBORMAP_MANAGEMENT_SERVICE_HPP
#define NEIGHBORMAP_MANAGEMENT_SERVICE_HPP

#include "neighbormap/management_interface.hpp"
#include "neighbormap/device_classifier.hpp"
#include "neighbormap/topology_discoverer.hpp"
#include "neighbormap/topology.hpp"
#include "neighbormap/transport.hpp"
#include "neighbormap/logger.hpp"
#include <string>
#include <vector>
#include <optional>

namespace neighbormap {

class ConfigManager;

// Operator commands on top of the discoverer. Holds the result of the last
// discovery so it can be shown again without re-crawling.
class ManagementService {
public:
    ManagementService(MapperLogger& logger, ManagementInterface& mi, DeviceClassifier& classifier,
                      Transport& transport, const ConfigManager& config);

    void register_cli_commands();

    // Runs a crawl and keeps its result. Returns an error string on failure,
    // std::nullopt on success.
    std::optional<std::string> run_discovery(const std::string& seed_address,
                                             const std::string& device_type,
                                             const Credentials& credentials,
                                             int max_depth);

    const std::optional<Topology>& last_topology() const { return last_topology_; }
    const std::vector<std::string>& last_visited() const { return last_visited_; }

    CrawlFilters& filters() { return filters_; }
    int default_max_depth() const { return default_max_depth_; }

private:
    MapperLogger& logger_;
    ManagementInterface& management_interface_;
    DeviceClassifier& classifier_;
    TopologyDiscoverer discoverer_;
    CrawlFilters filters_;
    int default_max_depth_ = 3;

    std::optional<Topology> last_topology_;
    std::vector<std::string> last_visited_;

    std::string handle_discover_command(const std::vector<std::string>& args);
    std::string handle_set_filter_command(const std::vector<std::string>& args);
    std::string show_topology_cli(const std::vector<std::string>& args) const;
    std::string show_devices_cli() const;
    std::string show_summary_cli() const;
    std::string show_filters_cli() const;
    std::string show_device_types_cli() const;
    std::string help_cli() const;
};

} // namespace neighbormap

#endif // NEIGHBORMAP_MANAGEMENT_SERVICE_HPP
