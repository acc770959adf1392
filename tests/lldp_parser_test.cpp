#include "gtest/gtest.h"
#include "neighbormap/lldp_parser.hpp"
#include "neighbormap/logger.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace neighbormap;

namespace {

const std::string TWO_NEIGHBORS =
    "------------------------------------------------\n"
    "Chassis id: aabb.cc00.1122\n"
    "Port id: Gi1/0/48\n"
    "Port Description: GigabitEthernet1/0/48\n"
    "System Name: DIST-SW-01\n"
    "\n"
    "System Description: \n"
    "Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8\n"
    "\n"
    "Time remaining: 112 seconds\n"
    "System Capabilities: B,R\n"
    "Enabled Capabilities: R\n"
    "Management Addresses:\n"
    "    IP: 192.168.1.10\n"
    "Auto Negotiation - supported, enabled\n"
    "Physical media capabilities:\n"
    "    1000baseT(FD)\n"
    "Vlan ID: 1\n"
    "\n"
    "Local Port id: Gi1/0/1\n"
    "\n"
    "------------------------------------------------\n"
    "Chassis id: aabb.cc00.3344\n"
    "Port id: Gi1/0/48\n"
    "System Name: DIST-SW-02.corp.example.com\n"
    "\n"
    "System Description: \n"
    "Cisco IOS Software, C3750E Software\n"
    "Technical Support: http://www.cisco.com/techsupport\n"
    "\n"
    "Time remaining: 97 seconds\n"
    "System Capabilities: B,R\n"
    "Management Addresses:\n"
    "    IP: 192.168.1.11\n"
    "Local Port id: Gi1/0/2\n";

} // namespace

class LldpNeighborParserTest : public ::testing::Test {
protected:
    MapperLogger logger_{LogLevel::DEBUG};
    std::ostringstream log_sink_;
    LldpNeighborParser parser_{logger_};

    void SetUp() override {
        logger_.set_output_stream(&log_sink_);
    }
};

TEST_F(LldpNeighborParserTest, ParsesChassisBlocks) {
    std::vector<NeighborRecord> neighbors = parser_.parse(TWO_NEIGHBORS);

    ASSERT_EQ(neighbors.size(), 2u);

    const NeighborRecord& first = neighbors[0];
    EXPECT_EQ(first.remote_device, "DIST-SW-01");
    EXPECT_EQ(first.remote_platform, "aabb.cc00.1122");
    EXPECT_EQ(first.remote_interface, "Gi1/0/48");
    EXPECT_EQ(first.local_interface, "Gi1/0/1");
    EXPECT_EQ(first.remote_capabilities, "B,R");
    EXPECT_EQ(first.remote_ip, "192.168.1.10");
    EXPECT_EQ(first.system_description,
              "Cisco IOS Software, C3750E Software (C3750E-UNIVERSALK9-M), Version 15.2(4)E8");

    const NeighborRecord& second = neighbors[1];
    EXPECT_EQ(second.remote_device, "DIST-SW-02");
    EXPECT_EQ(second.remote_ip, "192.168.1.11");
    EXPECT_EQ(second.local_interface, "Gi1/0/2");
}

TEST_F(LldpNeighborParserTest, JoinsMultiLineDescription) {
    std::vector<NeighborRecord> neighbors = parser_.parse(TWO_NEIGHBORS);
    ASSERT_EQ(neighbors.size(), 2u);
    EXPECT_EQ(neighbors[1].system_description,
              "Cisco IOS Software, C3750E Software Technical Support: http://www.cisco.com/techsupport");
}

TEST_F(LldpNeighborParserTest, DescriptionOnHeaderLine) {
    const std::string output =
        "Chassis id: 0011.2233.4455\n"
        "System Name: EDGE-RTR\n"
        "System Description: Juniper Networks, Inc. srx300\n"
        "JUNOS 21.4R3\n"
        "System Capabilities: B, R\n";

    std::vector<NeighborRecord> neighbors = parser_.parse(output);
    ASSERT_EQ(neighbors.size(), 1u);
    EXPECT_EQ(neighbors[0].system_description, "Juniper Networks, Inc. srx300 JUNOS 21.4R3");
    EXPECT_EQ(neighbors[0].remote_capabilities, "B, R");
}

TEST_F(LldpNeighborParserTest, ManagementAddressWithoutPreviousTerminator) {
    // The description runs straight into the address section
    const std::string output =
        "Chassis id: 0011.2233.4455\n"
        "System Name: LEAF-7\n"
        "System Description:\n"
        "Arista Networks EOS version 4.28\n"
        "Management Address: \n"
        "    IP: 10.1.1.7\n"
        "    IPv6: fe80::1\n"
        "Vlan ID: 10\n"
        "    IP: 10.9.9.9\n";

    std::vector<NeighborRecord> neighbors = parser_.parse(output);
    ASSERT_EQ(neighbors.size(), 1u);
    EXPECT_EQ(neighbors[0].system_description, "Arista Networks EOS version 4.28");
    // The address after "Vlan ID" is outside the management section
    EXPECT_EQ(neighbors[0].remote_ip, "10.1.1.7");
}

TEST_F(LldpNeighborParserTest, BlockWithoutSystemNameKeepsAddress) {
    const std::string output =
        "Chassis id: 0011.2233.4455\n"
        "Port id: 1\n"
        "Management Addresses:\n"
        "    IP: 192.168.1.200\n";

    std::vector<NeighborRecord> neighbors = parser_.parse(output);
    ASSERT_EQ(neighbors.size(), 1u);
    EXPECT_TRUE(neighbors[0].remote_device.empty());
    EXPECT_EQ(neighbors[0].remote_ip, "192.168.1.200");
    EXPECT_EQ(neighbors[0].merge_key(), "192.168.1.200");
}

TEST_F(LldpNeighborParserTest, EmptyOutputYieldsNothing) {
    EXPECT_TRUE(parser_.parse("").empty());
    EXPECT_TRUE(parser_.parse("Total entries displayed: 0\n").empty());
    EXPECT_NE(log_sink_.str().find("Parsed 0 LLDP neighbors"), std::string::npos);
}
