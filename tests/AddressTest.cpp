#include <gtest/gtest.h>

#include <algorithm>

#include "../common/Address.hpp"

using namespace lanwatch::common;

TEST(AddressTest, ParsesAndFormatsIpv4InHostOrder)
{
    auto parsed = ParseIpv4("192.168.1.10");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, 0xC0A8010Au);
    EXPECT_EQ(FormatIpv4(*parsed), "192.168.1.10");

    EXPECT_FALSE(ParseIpv4("192.168.1"));
    EXPECT_FALSE(ParseIpv4("256.1.1.1"));
    EXPECT_FALSE(ParseIpv4(""));
}

TEST(AddressTest, PrefixAndMaskConvert)
{
    EXPECT_EQ(PrefixToMask(24), 0xFFFFFF00u);
    EXPECT_EQ(PrefixToMask(0), 0u);
    EXPECT_EQ(PrefixToMask(32), 0xFFFFFFFFu);
    EXPECT_EQ(MaskToPrefix(0xFFFFF000u), 20);
}

TEST(AddressTest, SubnetHostsSkipsNetworkBroadcastAndSelf)
{
    auto hosts = SubnetHosts("192.168.1.10", "255.255.255.0");
    ASSERT_EQ(hosts.size(), 253u);
    EXPECT_EQ(hosts.front(), "192.168.1.1");
    EXPECT_EQ(hosts.back(), "192.168.1.254");
    EXPECT_EQ(std::find(hosts.begin(), hosts.end(), "192.168.1.10"), hosts.end());
}

TEST(AddressTest, WideSubnetIsClampedToLocal24)
{
    auto hosts = SubnetHosts("10.0.7.5", "255.255.0.0");
    ASSERT_EQ(hosts.size(), 253u);
    EXPECT_EQ(hosts.front(), "10.0.7.1");
    EXPECT_EQ(hosts.back(), "10.0.7.254");
}

TEST(AddressTest, Slash23IsProbedWhole)
{
    auto hosts = SubnetHosts("10.0.0.5", "255.255.254.0");
    EXPECT_EQ(hosts.size(), 509u);
}

TEST(AddressTest, PointToPointHasNoHosts)
{
    EXPECT_TRUE(SubnetHosts("10.0.0.1", "255.255.255.255").empty());
    EXPECT_TRUE(SubnetHosts("bogus", "255.255.255.0").empty());
}

TEST(AddressTest, CanonicalMacNormalizesEveryNotation)
{
    EXPECT_EQ(CanonicalMac("0:1b:63:84:45:e6"), "00:1B:63:84:45:E6");
    EXPECT_EQ(CanonicalMac("aa-bb-cc-dd-ee-ff"), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(CanonicalMac("aabbccddeeff"), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(CanonicalMac("aa:bb:cc:dd:ee"), "");
    EXPECT_EQ(CanonicalMac("aa:bb:cc:dd:ee:gg"), "");
    EXPECT_EQ(CanonicalMac("aaa:bb:cc:dd:ee:ff"), "");
    EXPECT_EQ(CanonicalMac("<incomplete>"), "");
}

TEST(AddressTest, UnusableMacsAreRejected)
{
    EXPECT_TRUE(IsUsableMac("AA:BB:CC:11:22:33"));
    EXPECT_FALSE(IsUsableMac("00:00:00:00:00:00"));
    EXPECT_FALSE(IsUsableMac("FF:FF:FF:FF:FF:FF"));
    EXPECT_FALSE(IsUsableMac("01:00:5E:00:00:FB"));
    EXPECT_FALSE(IsUsableMac(""));
}

TEST(AddressTest, OuiPrefixDropsSeparators)
{
    EXPECT_EQ(OuiPrefix("B8:27:EB:12:34:56"), "B827EB");
    EXPECT_EQ(OuiPrefix(""), "");
}

TEST(AddressTest, HostSlotIsLowSixteenBits)
{
    EXPECT_EQ(HostSlot("192.168.1.50"), std::optional<std::uint16_t>(0x0132));
    EXPECT_EQ(HostSlot("10.0.255.255"), std::optional<std::uint16_t>(0xFFFF));
    EXPECT_EQ(HostSlot("192.168.1.50"), HostSlot("10.20.1.50"));
    EXPECT_FALSE(HostSlot("10.1.0.0"));
    EXPECT_FALSE(HostSlot("not-an-ip"));
}
