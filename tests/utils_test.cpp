#include "gtest/gtest.h"
#include "neighbormap/utils.hpp"

#include <string>
#include <vector>

using namespace neighbormap;

TEST(UtilsTest, SafeStoiRejectsPartialInput) {
    EXPECT_EQ(utils::safe_stoi("42"), 42);
    EXPECT_EQ(utils::safe_stoi("-3"), -3);
    EXPECT_FALSE(utils::safe_stoi("4x").has_value());
    EXPECT_FALSE(utils::safe_stoi("").has_value());
    EXPECT_FALSE(utils::safe_stoi("99999999999").has_value());
}

TEST(UtilsTest, TrimAndLower) {
    EXPECT_EQ(utils::trim("  Gi1/0/1 \t\r"), "Gi1/0/1");
    EXPECT_EQ(utils::trim("   "), "");
    EXPECT_EQ(utils::to_lower("Trans-Bridge"), "trans-bridge");
}

TEST(UtilsTest, SplitKeepsEmptyFields) {
    std::vector<std::string> parts = utils::split("a,,b,", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");
}

TEST(UtilsTest, TokenizeDropsEmptyTokens) {
    std::vector<std::string> tokens = utils::tokenize("Router Switch,  IGMP ", ", ");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "Router");
    EXPECT_EQ(tokens[1], "Switch");
    EXPECT_EQ(tokens[2], "IGMP");
    EXPECT_TRUE(utils::tokenize(" , ", ", ").empty());
}

TEST(UtilsTest, ValueAfterLabel) {
    EXPECT_EQ(utils::value_after("  IP address: 192.168.1.10 ", "IP address:"), "192.168.1.10");
    EXPECT_EQ(utils::value_after("Holdtime : 164 sec", "Device ID:"), "");
}

TEST(UtilsTest, StripDomainAndJoin) {
    EXPECT_EQ(utils::strip_domain("dist-sw-01.corp.example.com"), "dist-sw-01");
    EXPECT_EQ(utils::strip_domain("CORE-SW-01"), "CORE-SW-01");
    EXPECT_EQ(utils::join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(utils::join({}, ","), "");
}

TEST(UtilsTest, ContainsIsCaseSensitive) {
    EXPECT_TRUE(utils::contains("Cisco IOS Software", "IOS"));
    EXPECT_FALSE(utils::contains("Cisco IOS Software", "ios"));
}
