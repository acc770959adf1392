#include "neighbormap/lldp_parser.hpp"
#include "neighbormap/logger.hpp"
#include "neighbormap/utils.hpp"

#include <array>
#include <sstream> // For std::istringstream

namespace neighbormap {

namespace {

const std::string CHASSIS_ID_LABEL = "Chassis id:";
const std::string SYSTEM_NAME_LABEL = "System Name:";
const std::string PORT_ID_LABEL = "Port id:";
const std::string LOCAL_PORT_ID_LABEL = "Local Port id:";
const std::string SYSTEM_DESCRIPTION_LABEL = "System Description:";
const std::string SYSTEM_CAPABILITIES_LABEL = "System Capabilities:";
const std::string MGMT_ADDRESSES_LABEL = "Management Addresses:";
const std::string MGMT_ADDRESS_LABEL = "Management Address:";
const std::string IP_LABEL = "IP:";

const std::array<const char*, 4> DESCRIPTION_TERMINATORS = {
    "Time remaining", "System Capabilities", "Enabled Capabilities", "Management"
};

const std::array<const char*, 4> ADDRESS_FAMILY_PREFIXES = {
    "IP", "IPv4", "IPv6", "Other"
};

} // namespace

LldpNeighborParser::LldpNeighborParser(const MapperLogger& logger)
    : logger_(logger) {
}

bool LldpNeighborParser::is_description_terminator(const std::string& line) {
    for (const char* prefix : DESCRIPTION_TERMINATORS) {
        if (utils::starts_with(line, prefix)) return true;
    }
    return false;
}

bool LldpNeighborParser::is_address_family_line(const std::string& line) {
    for (const char* prefix : ADDRESS_FAMILY_PREFIXES) {
        if (utils::starts_with(line, prefix)) return true;
    }
    return false;
}

std::vector<NeighborRecord> LldpNeighborParser::parse(const std::string& output) const {
    std::vector<NeighborRecord> neighbors;
    NeighborRecord current;
    ScanState state;

    std::istringstream stream(output);
    std::string raw_line;
    while (std::getline(stream, raw_line)) {
        std::string line = utils::trim(raw_line);

        if (utils::starts_with(line, CHASSIS_ID_LABEL)) {
            if (!current.empty()) {
                neighbors.push_back(current);
                current = NeighborRecord();
            }
            state = ScanState();
            current.remote_platform = utils::value_after(line, CHASSIS_ID_LABEL);
            continue;
        }

        if (utils::starts_with(line, SYSTEM_NAME_LABEL)) {
            current.remote_device = utils::strip_domain(utils::value_after(line, SYSTEM_NAME_LABEL));
            state.in_mgmt_addresses = false;
            continue;
        }

        if (utils::starts_with(line, PORT_ID_LABEL)) {
            current.remote_interface = utils::value_after(line, PORT_ID_LABEL);
            state.in_mgmt_addresses = false;
            continue;
        }

        if (utils::starts_with(line, LOCAL_PORT_ID_LABEL)) {
            current.local_interface = utils::value_after(line, LOCAL_PORT_ID_LABEL);
            state.in_mgmt_addresses = false;
            continue;
        }

        if (utils::starts_with(line, SYSTEM_DESCRIPTION_LABEL)) {
            state.in_mgmt_addresses = false;
            state.in_description = true;
            // Some platforms print the first description line on the header itself
            current.system_description = utils::value_after(line, SYSTEM_DESCRIPTION_LABEL);
            continue;
        }

        if (state.in_description) {
            if (line.empty()) {
                continue;
            }
            if (!is_description_terminator(line)) {
                if (!current.system_description.empty()) {
                    current.system_description += " ";
                }
                current.system_description += line;
                continue;
            }
            // Terminator: close the description, then handle the line below
            state.in_description = false;
        }

        if (utils::starts_with(line, SYSTEM_CAPABILITIES_LABEL)) {
            current.remote_capabilities = utils::value_after(line, SYSTEM_CAPABILITIES_LABEL);
            state.in_mgmt_addresses = false;
        } else if (utils::starts_with(line, MGMT_ADDRESSES_LABEL) || utils::starts_with(line, MGMT_ADDRESS_LABEL)) {
            state.in_mgmt_addresses = true;
        } else if (state.in_mgmt_addresses && utils::starts_with(line, IP_LABEL)) {
            std::string ip = utils::value_after(line, IP_LABEL);
            if (!ip.empty()) {
                current.remote_ip = ip;
            }
        } else if (state.in_mgmt_addresses && !line.empty() && !is_address_family_line(line)) {
            state.in_mgmt_addresses = false;
        }
    }

    if (!current.empty()) {
        neighbors.push_back(current);
    }

    logger_.info("LLDP", "Parsed " + std::to_string(neighbors.size()) + " LLDP neighbors");
    for (size_t i = 0; i < neighbors.size(); ++i) {
        const NeighborRecord& n = neighbors[i];
        logger_.debug("LLDP", "  LLDP Neighbor " + std::to_string(i + 1) + ": " +
                              (n.remote_device.empty() ? "?" : n.remote_device) +
                              " - IP: " + (n.remote_ip.empty() ? "MISSING" : n.remote_ip));
    }
    return neighbors;
}

} // namespace neighbormap
