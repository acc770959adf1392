#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "neighbormap/neighbor_merger.hpp"
#include "neighbormap/logger.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace neighbormap;
using ::testing::ElementsAre;

namespace {

NeighborRecord make_record(const std::string& name, const std::string& ip,
                           const std::string& local_if = "", const std::string& remote_if = "") {
    NeighborRecord record;
    record.remote_device = name;
    record.remote_ip = ip;
    record.local_interface = local_if;
    record.remote_interface = remote_if;
    return record;
}

} // namespace

class NeighborMergerTest : public ::testing::Test {
protected:
    MapperLogger logger_{LogLevel::DEBUG};
    std::ostringstream log_sink_;
    NeighborMerger merger_{logger_};

    void SetUp() override {
        logger_.set_output_stream(&log_sink_);
    }
};

TEST_F(NeighborMergerTest, EmptyInputsGiveEmptyResult) {
    EXPECT_TRUE(merger_.merge({}, {}).empty());
}

TEST_F(NeighborMergerTest, CdpOnlyIsReproducedAndTagged) {
    std::vector<NeighborRecord> cdp = {
        make_record("DIST-SW-01", "192.168.1.10", "Gi1/0/1", "Gi1/0/48"),
        make_record("DIST-SW-02", "192.168.1.11", "Gi1/0/2", "Gi1/0/48")
    };
    cdp[0].remote_platform = "cisco WS-C3750X-48";

    std::vector<NeighborRecord> merged = merger_.merge(cdp, {});

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].remote_device, "DIST-SW-01");
    EXPECT_EQ(merged[0].remote_platform, "cisco WS-C3750X-48");
    EXPECT_EQ(merged[1].remote_device, "DIST-SW-02");
    for (const NeighborRecord& record : merged) {
        EXPECT_THAT(record.protocols, ElementsAre(DiscoveryProtocol::CDP));
    }
}

TEST_F(NeighborMergerTest, MatchingKeyFavorsCdpExceptDescription) {
    NeighborRecord cdp_record = make_record("DIST-SW-01", "192.168.1.10", "GigabitEthernet1/0/1", "GigabitEthernet1/0/48");
    cdp_record.remote_platform = "cisco WS-C3750X-48";
    cdp_record.remote_capabilities = "Router Switch IGMP";

    NeighborRecord lldp_record = make_record("DIST-SW-01", "10.99.99.99", "Gi1/0/1", "Gi1/0/48");
    lldp_record.remote_platform = "aabb.cc00.1122";
    lldp_record.remote_capabilities = "B,R";
    lldp_record.system_description = "Cisco IOS Software, C3750E Software";

    std::vector<NeighborRecord> merged = merger_.merge({cdp_record}, {lldp_record});

    ASSERT_EQ(merged.size(), 1u);
    const NeighborRecord& n = merged[0];
    EXPECT_EQ(n.remote_ip, "192.168.1.10");
    EXPECT_EQ(n.local_interface, "GigabitEthernet1/0/1");
    EXPECT_EQ(n.remote_interface, "GigabitEthernet1/0/48");
    EXPECT_EQ(n.remote_platform, "cisco WS-C3750X-48");
    EXPECT_EQ(n.remote_capabilities, "Router Switch IGMP");
    EXPECT_EQ(n.system_description, "Cisco IOS Software, C3750E Software");
    EXPECT_THAT(n.protocols, ElementsAre(DiscoveryProtocol::CDP, DiscoveryProtocol::LLDP));
}

TEST_F(NeighborMergerTest, LldpBackfillsMissingCdpFields) {
    NeighborRecord cdp_record = make_record("EDGE-RTR", "");
    NeighborRecord lldp_record = make_record("EDGE-RTR", "10.0.0.1", "Gi0/0", "ge-0/0/1");

    std::vector<NeighborRecord> merged = merger_.merge({cdp_record}, {lldp_record});

    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].remote_ip, "10.0.0.1");
    EXPECT_EQ(merged[0].local_interface, "Gi0/0");
    EXPECT_EQ(merged[0].remote_interface, "ge-0/0/1");
}

TEST_F(NeighborMergerTest, EmptyLldpDescriptionDoesNotOverwrite) {
    NeighborRecord cdp_record = make_record("CORE", "10.0.0.1");
    cdp_record.system_description = "from cdp";
    NeighborRecord lldp_record = make_record("CORE", "10.0.0.1");

    std::vector<NeighborRecord> merged = merger_.merge({cdp_record}, {lldp_record});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].system_description, "from cdp");
}

TEST_F(NeighborMergerTest, LldpOnlyNeighborsFollowCdpOnes) {
    std::vector<NeighborRecord> cdp = {make_record("B", "10.0.0.2"), make_record("A", "10.0.0.1")};
    std::vector<NeighborRecord> lldp = {make_record("Z", "10.0.0.26"), make_record("A", "10.0.0.1")};

    std::vector<NeighborRecord> merged = merger_.merge(cdp, lldp);

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].remote_device, "B");
    EXPECT_EQ(merged[1].remote_device, "A");
    EXPECT_EQ(merged[2].remote_device, "Z");
    EXPECT_THAT(merged[2].protocols, ElementsAre(DiscoveryProtocol::LLDP));
}

TEST_F(NeighborMergerTest, NamelessLldpRecordIsKeyedByAddress) {
    NeighborRecord cdp_record = make_record("DIST-SW-01", "192.168.1.10");
    NeighborRecord nameless = make_record("", "192.168.1.10", "Gi1/0/1", "Gi1/0/48");

    std::vector<NeighborRecord> merged = merger_.merge({cdp_record}, {nameless});

    // The address key never matches the name key, so the same device shows up twice
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].merge_key(), "DIST-SW-01");
    EXPECT_THAT(merged[0].protocols, ElementsAre(DiscoveryProtocol::CDP));
    EXPECT_EQ(merged[1].merge_key(), "192.168.1.10");
    EXPECT_TRUE(merged[1].remote_device.empty());
    EXPECT_THAT(merged[1].protocols, ElementsAre(DiscoveryProtocol::LLDP));
}

TEST_F(NeighborMergerTest, RecordsWithoutKeyAreDropped) {
    NeighborRecord keyless;
    keyless.local_interface = "Gi0/1";

    EXPECT_TRUE(merger_.merge({keyless}, {keyless}).empty());
}

TEST_F(NeighborMergerTest, RepeatedKeyKeepsFirstPositionAndLaterContent) {
    std::vector<NeighborRecord> cdp = {
        make_record("A", "10.0.0.1", "Gi0/1"),
        make_record("B", "10.0.0.2"),
        make_record("A", "10.0.0.1", "Gi0/9")
    };
    std::vector<NeighborRecord> lldp = {make_record("B", "10.0.0.2"), make_record("B", "10.0.0.2")};

    std::vector<NeighborRecord> merged = merger_.merge(cdp, lldp);

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].remote_device, "A");
    EXPECT_EQ(merged[0].local_interface, "Gi0/9");
    EXPECT_THAT(merged[1].protocols, ElementsAre(DiscoveryProtocol::CDP, DiscoveryProtocol::LLDP));
}
