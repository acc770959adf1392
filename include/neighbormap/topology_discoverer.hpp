#ifndef NEIGHBORMAP_TOPOLOGY_DISCOVERER_HPP
#define NEIGHBORMAP_TOPOLOGY_DISCOVERER_HPP

#include "neighbormap/topology.hpp"
#include "neighbormap/transport.hpp"
#include "neighbormap/device_classifier.hpp" // For CrawlFilters
#include "neighbormap/cdp_parser.hpp"
#include "neighbormap/lldp_parser.hpp"
#include "neighbormap/neighbor_merger.hpp"

#include <string>
#include <vector>
#include <set>
#include <deque>
#include <variant>
#include <atomic>
#include <chrono>
#include <utility> // For std::move

namespace neighbormap {

class MapperLogger;
class ConfigManager;

struct DiscoverySettings {
    std::string cdp_command = "show cdp neighbors detail";
    std::string lldp_command = "show lldp neighbors detail";
    std::chrono::seconds command_timeout{30};

    // discovery.cdp_command, discovery.lldp_command, discovery.command_timeout_seconds
    static DiscoverySettings from_config(const ConfigManager& config);
};

// Failure attributed to one crawled address.
struct DiscoveryError {
    ErrorKind kind = ErrorKind::GENERIC_ERROR;
    std::string address;
    std::string message;
};

using DiscoveryResult = std::variant<Topology, DiscoveryError>;

// Breadth-first crawl over CDP/LLDP neighbor tables, one session at a time.
class TopologyDiscoverer {
public:
    TopologyDiscoverer(const DeviceClassifier& classifier,
                       Transport& transport,
                       const MapperLogger& logger,
                       DiscoverySettings settings = DiscoverySettings());

    // Fails only when the seed itself cannot be polled. Failures on any other
    // address are logged, recorded in node_errors() and skipped.
    DiscoveryResult discover(const std::string& seed_address,
                             const std::string& seed_device_type,
                             const Credentials& credentials,
                             int max_depth,
                             const CrawlFilters& filters = CrawlFilters());

    // Addresses of the last run, in the order they were dequeued and polled.
    const std::vector<std::string>& visited() const { return visit_order_; }
    const std::vector<DiscoveryError>& node_errors() const { return node_errors_; }

    // Stops the running crawl before the next frontier entry is taken. The
    // topology gathered so far is returned. Safe to call from another thread.
    void request_cancel() { cancel_requested_.store(true); }
    bool cancel_requested() const { return cancel_requested_.load(); }

private:
    struct FrontierEntry {
        std::string address;
        std::string device_type;
        int depth;
    };

    const DeviceClassifier& classifier_;
    Transport& transport_;
    const MapperLogger& logger_;
    DiscoverySettings settings_;
    CdpNeighborParser cdp_parser_;
    LldpNeighborParser lldp_parser_;
    NeighborMerger merger_;

    std::set<std::string> visited_;
    std::vector<std::string> visit_order_;
    std::vector<DiscoveryError> node_errors_;
    std::atomic<bool> cancel_requested_{false};

    // Polls one device and extends the topology. Returns false with `error`
    // filled when the device could not be reached.
    bool poll_node(const FrontierEntry& entry, const Credentials& credentials,
                   const CrawlFilters& filters, Topology& topology,
                   std::deque<FrontierEntry>& frontier, DiscoveryError& error);

    std::vector<NeighborRecord> collect_neighbors(Session& session, const std::string& hostname) const;

    static std::string hostname_from_prompt(const std::string& prompt);
};

} // namespace neighbormap

#endif // NEIGHBORMAP_TOPOLOGY_DISCOVERER_HPP
