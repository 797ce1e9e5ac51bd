/**
 * @file test_mac_address.cpp
 * @brief Unit tests for hardware address parsing and formatting
 */

#include <gtest/gtest.h>
#include <lumen/core/mac_address.hpp>

#include <sstream>
#include <unordered_set>

using namespace lumen::core;

TEST(MacAddressTest, ParsesCompactForm) {
    auto mac = MacAddress::parse("a8bb5006e1c2");
    ASSERT_TRUE(mac.has_value());
    EXPECT_EQ(mac->toString(), "A8:BB:50:06:E1:C2");
    EXPECT_EQ(mac->toCompactString(), "a8bb5006e1c2");
}

TEST(MacAddressTest, ParsesSeparatedForms) {
    auto colon = MacAddress::parse("AA:BB:CC:DD:EE:FF");
    auto dash = MacAddress::parse("aa-bb-cc-dd-ee-ff");
    ASSERT_TRUE(colon.has_value());
    ASSERT_TRUE(dash.has_value());
    EXPECT_EQ(*colon, *dash);
    EXPECT_EQ(colon->bytes()[0], 0xAA);
    EXPECT_EQ(colon->bytes()[5], 0xFF);
}

TEST(MacAddressTest, RejectsMalformedInput) {
    EXPECT_FALSE(MacAddress::parse("").has_value());
    EXPECT_FALSE(MacAddress::parse("aabbccddee").has_value());
    EXPECT_FALSE(MacAddress::parse("aabbccddeeff00").has_value());
    EXPECT_FALSE(MacAddress::parse("gg:bb:cc:dd:ee:ff").has_value());
    EXPECT_FALSE(MacAddress::parse("aa:bb-cc:dd:ee:ff").has_value());
    EXPECT_FALSE(MacAddress::parse("aab:bcc:dde:eff").has_value());
    EXPECT_FALSE(MacAddress::parse(":aabbccddeeff").has_value());
    EXPECT_FALSE(MacAddress::parse("aa:bbccddeeff").has_value());
}

TEST(MacAddressTest, NoneIsAllZero) {
    MacAddress none = MacAddress::none();
    EXPECT_TRUE(none.isNone());
    EXPECT_EQ(none.toString(), "00:00:00:00:00:00");
    EXPECT_FALSE(MacAddress::parse("000000000001")->isNone());
}

TEST(MacAddressTest, ComparesByteForByte) {
    auto a = *MacAddress::parse("000000000001");
    auto b = *MacAddress::parse("000000000002");
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
    EXPECT_EQ(a, *MacAddress::parse("00:00:00:00:00:01"));
}

TEST(MacAddressTest, HashableAndStreamable) {
    std::unordered_set<MacAddress> set;
    set.insert(*MacAddress::parse("aabbccddeeff"));
    set.insert(*MacAddress::parse("AA:BB:CC:DD:EE:FF"));
    set.insert(*MacAddress::parse("112233445566"));
    EXPECT_EQ(set.size(), 2u);

    std::ostringstream oss;
    oss << *MacAddress::parse("112233445566");
    EXPECT_EQ(oss.str(), "11:22:33:44:55:66");
}
