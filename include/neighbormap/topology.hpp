#ifndef NEIGHBORMAP_TOPOLOGY_HPP
#define NEIGHBORMAP_TOPOLOGY_HPP

#include "neighbormap/neighbor_record.hpp" // For DiscoveryProtocol
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstddef>
#include <utility> // For std::move

namespace neighbormap {

// Directed adjacency as seen from local_device. Endpoints are hostname keys
// into Topology, never pointers.
struct Link {
    std::string local_device;
    std::string local_interface;
    std::string remote_device;
    std::string remote_interface;
    std::optional<std::string> remote_ip;
    std::vector<DiscoveryProtocol> protocols;

    std::string protocols_label() const; // "CDP+LLDP", empty if none
};

struct Device {
    std::string hostname;
    std::optional<std::string> mgmt_ip;
    std::optional<std::string> device_type;
    std::optional<std::string> platform;
    std::vector<Link> links;
    bool polled = false; // Own fields are set once, when this device is polled

    explicit Device(std::string name = "") : hostname(std::move(name)) {}
};

class Topology {
public:
    Topology() = default;

    // Creates the device if unknown. Identity fields are filled on the first
    // call for a hostname and left untouched afterwards.
    Device& register_polled_device(const std::string& hostname,
                                   const std::optional<std::string>& mgmt_ip,
                                   const std::optional<std::string>& device_type,
                                   const std::optional<std::string>& platform = std::nullopt);

    // Appends the link to its local device, creating either endpoint if needed.
    void add_link(const Link& link);

    const Device* find_device(const std::string& hostname) const;
    bool has_device(const std::string& hostname) const;

    const std::map<std::string, Device>& devices() const { return devices_; }

    // Hostnames in the order they were first referenced; for a crawl the seed comes first.
    const std::vector<std::string>& insertion_order() const { return insertion_order_; }

    std::size_t device_count() const { return devices_.size(); }
    std::size_t link_count() const;       // Directed links as stored
    std::size_t unique_link_count() const; // Unordered device pairs
    bool empty() const { return devices_.empty(); }

private:
    std::map<std::string, Device> devices_;
    std::vector<std::string> insertion_order_;

    Device& ensure_device(const std::string& hostname);
};

} // namespace neighbormap

#endif // NEIGHBORMAP_TOPOLOGY_HPP
