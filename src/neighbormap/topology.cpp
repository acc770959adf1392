#include "neighbormap/topology.hpp"

#include <set>
#include <utility> // For std::pair, std::minmax

namespace neighbormap {

std::string Link::protocols_label() const {
    std::string label;
    for (DiscoveryProtocol protocol : protocols) {
        if (!label.empty()) label += "+";
        label += to_string(protocol);
    }
    return label;
}

Device& Topology::ensure_device(const std::string& hostname) {
    auto it = devices_.find(hostname);
    if (it != devices_.end()) {
        return it->second;
    }
    insertion_order_.push_back(hostname);
    return devices_.emplace(hostname, Device(hostname)).first->second;
}

Device& Topology::register_polled_device(const std::string& hostname,
                                         const std::optional<std::string>& mgmt_ip,
                                         const std::optional<std::string>& device_type,
                                         const std::optional<std::string>& platform) {
    Device& device = ensure_device(hostname);
    if (!device.polled) {
        device.mgmt_ip = mgmt_ip;
        device.device_type = device_type;
        device.platform = platform;
        device.polled = true;
    }
    return device;
}

void Topology::add_link(const Link& link) {
    Device& local = ensure_device(link.local_device);
    ensure_device(link.remote_device); // std::map insertion keeps `local` valid
    local.links.push_back(link);
}

const Device* Topology::find_device(const std::string& hostname) const {
    auto it = devices_.find(hostname);
    return it != devices_.end() ? &it->second : nullptr;
}

bool Topology::has_device(const std::string& hostname) const {
    return devices_.count(hostname) > 0;
}

std::size_t Topology::link_count() const {
    std::size_t count = 0;
    for (const auto& pair : devices_) {
        count += pair.second.links.size();
    }
    return count;
}

std::size_t Topology::unique_link_count() const {
    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& pair : devices_) {
        for (const Link& link : pair.second.links) {
            auto ends = std::minmax(link.local_device, link.remote_device);
            pairs.emplace(ends.first, ends.second);
        }
    }
    return pairs.size();
}

} // namespace neighbormap
