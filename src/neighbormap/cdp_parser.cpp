#include "neighbormap/cdp_parser.hpp"
#include "neighbormap/logger.hpp"
#include "neighbormap/utils.hpp"

#include <sstream> // For std::istringstream

namespace neighbormap {

namespace {

const std::string DEVICE_ID_LABEL = "Device ID:";
const std::string IP_ADDRESS_LABEL = "IP address:";
const std::string IPV4_ADDRESS_LABEL = "IPv4 Address:";
const std::string PLATFORM_LABEL = "Platform:";
const std::string CAPABILITIES_LABEL = "Capabilities:";
const std::string INTERFACE_LABEL = "Interface:";
const std::string PORT_ID_LABEL = "Port ID";

} // namespace

CdpNeighborParser::CdpNeighborParser(const MapperLogger& logger)
    : logger_(logger) {
}

std::vector<NeighborRecord> CdpNeighborParser::parse(const std::string& output) const {
    std::vector<NeighborRecord> neighbors;
    NeighborRecord current;

    std::istringstream stream(output);
    std::string raw_line;
    while (std::getline(stream, raw_line)) {
        std::string line = utils::trim(raw_line);

        if (utils::starts_with(line, DEVICE_ID_LABEL)) {
            if (!current.empty()) {
                neighbors.push_back(current);
                current = NeighborRecord();
            }
            current.remote_device = utils::strip_domain(utils::value_after(line, DEVICE_ID_LABEL));
        } else if (utils::contains(line, IP_ADDRESS_LABEL) || utils::contains(line, IPV4_ADDRESS_LABEL)) {
            std::string ip = utils::contains(line, IPV4_ADDRESS_LABEL)
                                 ? utils::value_after(line, IPV4_ADDRESS_LABEL)
                                 : utils::value_after(line, IP_ADDRESS_LABEL);
            // "(not available)" and similar placeholders are not addresses
            if (!ip.empty() && ip[0] != '(') {
                current.remote_ip = ip;
            }
        } else if (utils::starts_with(line, PLATFORM_LABEL)) {
            parse_platform_line(line, current);
        } else if (utils::starts_with(line, INTERFACE_LABEL)) {
            parse_interface_line(line, current);
        }
    }

    if (!current.empty()) {
        neighbors.push_back(current);
    }

    logger_.info("CDP", "Parsed " + std::to_string(neighbors.size()) + " CDP neighbors");
    for (size_t i = 0; i < neighbors.size(); ++i) {
        const NeighborRecord& n = neighbors[i];
        logger_.debug("CDP", "  CDP Neighbor " + std::to_string(i + 1) + ": " +
                             (n.remote_device.empty() ? "?" : n.remote_device) +
                             " - IP: " + (n.remote_ip.empty() ? "MISSING" : n.remote_ip) +
                             " - Platform: " + (n.remote_platform.empty() ? "?" : n.remote_platform));
    }
    return neighbors;
}

// "Platform: cisco WS-C3750X-48,  Capabilities: Router Switch IGMP"
void CdpNeighborParser::parse_platform_line(const std::string& line, NeighborRecord& current) const {
    std::vector<std::string> parts = utils::split(line, ',');
    if (parts.empty()) {
        return;
    }
    current.remote_platform = utils::value_after(parts[0], PLATFORM_LABEL);

    for (const std::string& part : parts) {
        if (utils::contains(part, CAPABILITIES_LABEL)) {
            current.remote_capabilities = utils::value_after(part, CAPABILITIES_LABEL);
        }
    }
}

// "Interface: GigabitEthernet1/0/1,  Port ID (outgoing port): GigabitEthernet0/1"
void CdpNeighborParser::parse_interface_line(const std::string& line, NeighborRecord& current) const {
    std::vector<std::string> parts = utils::split(line, ',');
    if (parts.empty()) {
        return;
    }
    current.local_interface = utils::value_after(parts[0], INTERFACE_LABEL);

    if (parts.size() > 1 && utils::contains(parts[1], PORT_ID_LABEL)) {
        size_t colon = parts[1].rfind(':');
        if (colon != std::string::npos) {
            current.remote_interface = utils::trim(parts[1].substr(colon + 1));
        }
    }
}

} // namespace neighbormap
