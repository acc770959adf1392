#pragma once

#include "neighbormap/neighbor_record.hpp"
#include <string>
#include <vector>

namespace neighbormap {

class MapperLogger;

// Parses the text of "show cdp neighbors detail".
class CdpNeighborParser {
public:
    explicit CdpNeighborParser(const MapperLogger& logger);

    // One record per "Device ID:" block, in output order. Lines that are not
    // understood are ignored; this never fails.
    std::vector<NeighborRecord> parse(const std::string& output) const;

private:
    const MapperLogger& logger_;

    void parse_platform_line(const std::string& line, NeighborRecord& current) const;
    void parse_interface_line(const std::string& line, NeighborRecord& current) const;
};

} // namespace neighbormap
