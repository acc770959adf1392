#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "neighbormap/topology.hpp"

#include <string>
#include <vector>

using namespace neighbormap;
using ::testing::ElementsAre;

namespace {

Link make_link(const std::string& local, const std::string& remote,
               std::vector<DiscoveryProtocol> protocols = {DiscoveryProtocol::CDP}) {
    Link link;
    link.local_device = local;
    link.local_interface = "Gi0/1";
    link.remote_device = remote;
    link.remote_interface = "Gi0/2";
    link.protocols = std::move(protocols);
    return link;
}

} // namespace

class TopologyTest : public ::testing::Test {
protected:
    Topology topology_;

    void expect_link_endpoints_known() {
        for (const auto& pair : topology_.devices()) {
            for (const Link& link : pair.second.links) {
                EXPECT_TRUE(topology_.has_device(link.local_device)) << link.local_device;
                EXPECT_TRUE(topology_.has_device(link.remote_device)) << link.remote_device;
            }
        }
    }
};

TEST_F(TopologyTest, StartsEmpty) {
    EXPECT_TRUE(topology_.empty());
    EXPECT_EQ(topology_.device_count(), 0u);
    EXPECT_EQ(topology_.link_count(), 0u);
    EXPECT_EQ(topology_.find_device("CORE"), nullptr);
}

TEST_F(TopologyTest, AddLinkCreatesBothEndpoints) {
    topology_.add_link(make_link("CORE", "DIST"));

    EXPECT_EQ(topology_.device_count(), 2u);
    EXPECT_THAT(topology_.insertion_order(), ElementsAre("CORE", "DIST"));
    expect_link_endpoints_known();

    const Device* dist = topology_.find_device("DIST");
    ASSERT_NE(dist, nullptr);
    EXPECT_FALSE(dist->polled);
    EXPECT_FALSE(dist->mgmt_ip.has_value());
    EXPECT_TRUE(dist->links.empty());

    const Device* core = topology_.find_device("CORE");
    ASSERT_NE(core, nullptr);
    ASSERT_EQ(core->links.size(), 1u);
    EXPECT_EQ(core->links[0].remote_device, "DIST");
}

TEST_F(TopologyTest, RegisterPolledDeviceSetsFieldsOnce) {
    topology_.add_link(make_link("CORE", "DIST"));
    topology_.register_polled_device("DIST", std::string("10.0.0.2"), std::string("cisco_ios"));
    topology_.register_polled_device("DIST", std::string("10.9.9.9"), std::string("cisco_nxos"),
                                     std::string("N9K"));

    const Device* dist = topology_.find_device("DIST");
    ASSERT_NE(dist, nullptr);
    EXPECT_TRUE(dist->polled);
    EXPECT_EQ(dist->mgmt_ip.value_or(""), "10.0.0.2");
    EXPECT_EQ(dist->device_type.value_or(""), "cisco_ios");
    EXPECT_FALSE(dist->platform.has_value());
    EXPECT_EQ(topology_.device_count(), 2u);
}

TEST_F(TopologyTest, RegisterKeepsExistingLinks) {
    topology_.register_polled_device("CORE", std::string("10.0.0.1"), std::string("cisco_ios"));
    topology_.add_link(make_link("CORE", "DIST"));
    topology_.register_polled_device("CORE", std::string("10.0.0.1"), std::string("cisco_ios"));

    EXPECT_EQ(topology_.find_device("CORE")->links.size(), 1u);
}

TEST_F(TopologyTest, UniqueLinksIgnoreDirectionAndRepeats) {
    topology_.add_link(make_link("A", "B"));
    topology_.add_link(make_link("B", "A"));
    topology_.add_link(make_link("B", "C"));
    Link parallel = make_link("A", "B");
    parallel.local_interface = "Gi0/3";
    topology_.add_link(parallel);

    EXPECT_EQ(topology_.link_count(), 4u);
    EXPECT_EQ(topology_.unique_link_count(), 2u);
    expect_link_endpoints_known();
}

TEST_F(TopologyTest, ProtocolsLabel) {
    EXPECT_EQ(make_link("A", "B", {DiscoveryProtocol::CDP, DiscoveryProtocol::LLDP}).protocols_label(), "CDP+LLDP");
    EXPECT_EQ(make_link("A", "B", {DiscoveryProtocol::LLDP}).protocols_label(), "LLDP");
    EXPECT_EQ(make_link("A", "B", {}).protocols_label(), "");
}
