#pragma once

#include <string>
#include <vector>
#include <algorithm> // For std::find

namespace neighbormap {

// Discovery protocols a neighbor can be learned from.
enum class DiscoveryProtocol {
    CDP,
    LLDP
};

inline std::string to_string(DiscoveryProtocol protocol) {
    switch (protocol) {
        case DiscoveryProtocol::CDP:  return "CDP";
        case DiscoveryProtocol::LLDP: return "LLDP";
        default:                      return "UNKNOWN";
    }
}

// One adjacency as reported by a neighbor table. An empty string means the
// field was not present in the command output.
struct NeighborRecord {
    std::string remote_device;
    std::string remote_ip;
    std::string remote_platform;     // CDP platform, or LLDP chassis id
    std::string remote_capabilities;
    std::string system_description;  // LLDP only, may span several lines
    std::string local_interface;
    std::string remote_interface;
    std::vector<DiscoveryProtocol> protocols;

    // Name when known, otherwise management IP. Empty if neither was parsed.
    const std::string& merge_key() const {
        return remote_device.empty() ? remote_ip : remote_device;
    }

    bool empty() const {
        return remote_device.empty() && remote_ip.empty() && remote_platform.empty() &&
               remote_capabilities.empty() && system_description.empty() &&
               local_interface.empty() && remote_interface.empty();
    }

    bool learned_via(DiscoveryProtocol protocol) const {
        return std::find(protocols.begin(), protocols.end(), protocol) != protocols.end();
    }
};

} // namespace neighbormap
