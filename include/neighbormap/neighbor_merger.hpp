#pragma once

#include "neighbormap/neighbor_record.hpp"
#include <vector>

namespace neighbormap {

class MapperLogger;

// Reconciles the CDP and LLDP views of one device into one record per neighbor.
//
// Records are keyed by remote device name, falling back to management IP;
// records with neither are dropped. CDP records seed the result. A matching
// LLDP record only fills fields CDP left empty (IP, both interfaces) except
// the system description, which LLDP always supplies when it has one.
// Output order: CDP keys in first-seen order, then LLDP-only keys.
//
// An LLDP block without "System Name:" is keyed by its IP, so it will not
// fold into a CDP record keyed by the same device's name.
class NeighborMerger {
public:
    explicit NeighborMerger(const MapperLogger& logger);

    std::vector<NeighborRecord> merge(const std::vector<NeighborRecord>& cdp_neighbors,
                                      const std::vector<NeighborRecord>& lldp_neighbors) const;

private:
    const MapperLogger& logger_;
};

} // namespace neighbormap
