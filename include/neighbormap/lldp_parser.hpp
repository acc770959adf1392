#pragma once

#include "neighbormap/neighbor_record.hpp"
#include <string>
#include <vector>

namespace neighbormap {

class MapperLogger;

// Parses the text of "show lldp neighbors detail".
class LldpNeighborParser {
public:
    explicit LldpNeighborParser(const MapperLogger& logger);

    // One record per "Chassis id:" block, in output order. Never fails.
    std::vector<NeighborRecord> parse(const std::string& output) const;

private:
    const MapperLogger& logger_;

    // Scanner sub-states; both reset when a new chassis block starts.
    struct ScanState {
        bool in_description = false;     // After "System Description:" until a terminator line
        bool in_mgmt_addresses = false;  // After "Management Address(es):"
    };

    static bool is_description_terminator(const std::string& line);
    static bool is_address_family_line(const std::string& line);
};

} // namespace neighbormap
