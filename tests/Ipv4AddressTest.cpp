#include <gtest/gtest.h>

#include "core/Ipv4Address.hpp"

using IpSift::core::Ipv4Address;
using IpSift::core::NetworkRange;

TEST(Ipv4AddressTest, ParsesDottedQuad)
{
    const auto a = Ipv4Address::parse("192.168.1.20");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->value(), 0xC0A80114u);
    EXPECT_EQ(a->octet(0), 192);
    EXPECT_EQ(a->octet(3), 20);
    EXPECT_EQ(a->toString(), "192.168.1.20");
}

TEST(Ipv4AddressTest, AcceptsBoundsAndLeadingZeros)
{
    EXPECT_EQ(Ipv4Address::parse("0.0.0.0")->value(), 0u);
    EXPECT_EQ(Ipv4Address::parse("255.255.255.255")->value(), 0xFFFFFFFFu);
    // Leading zeros are read as decimal, not octal.
    EXPECT_EQ(Ipv4Address::parse("010.001.0.09")->toString(), "10.1.0.9");
}

TEST(Ipv4AddressTest, RejectsMalformedText)
{
    for (const char *bad : {"", "1.2.3", "1.2.3.4.5", "256.1.1.1", "1.2.3.256", "1..2.3",
                            ".1.2.3", "1.2.3.", "1.2.3.4 ", " 1.2.3.4", "+1.2.3.4",
                            "-1.2.3.4", "1.2.3.0004", "a.b.c.d", "1.2.3.4/8", "1,2,3,4"})
    {
        EXPECT_FALSE(Ipv4Address::parse(bad).has_value()) << bad;
    }
}

TEST(Ipv4AddressTest, SpecialPurposePredicates)
{
    EXPECT_TRUE(Ipv4Address::parse("0.0.0.0")->isUnspecified());
    EXPECT_FALSE(Ipv4Address::parse("0.0.0.1")->isUnspecified());

    EXPECT_TRUE(Ipv4Address::parse("224.0.0.1")->isMulticast());
    EXPECT_TRUE(Ipv4Address::parse("239.255.255.255")->isMulticast());
    EXPECT_FALSE(Ipv4Address::parse("223.255.255.255")->isMulticast());

    EXPECT_TRUE(Ipv4Address::parse("240.0.0.0")->isReserved());
    EXPECT_TRUE(Ipv4Address::parse("255.255.255.255")->isReserved());
    EXPECT_FALSE(Ipv4Address::parse("239.255.255.255")->isReserved());
}

TEST(NetworkRangeTest, ContainsUsesPrefixMask)
{
    const auto range = NetworkRange::fromCidr("172.16.0.0/12");
    ASSERT_TRUE(range.has_value());
    EXPECT_TRUE(range->contains(*Ipv4Address::parse("172.16.0.0")));
    EXPECT_TRUE(range->contains(*Ipv4Address::parse("172.31.255.255")));
    EXPECT_FALSE(range->contains(*Ipv4Address::parse("172.15.255.255")));
    EXPECT_FALSE(range->contains(*Ipv4Address::parse("172.32.0.0")));
}

TEST(NetworkRangeTest, NormalizesBaseAndFormats)
{
    const NetworkRange range(*Ipv4Address::parse("10.1.2.3"), 8);
    EXPECT_EQ(range.toString(), "10.0.0.0/8");

    const NetworkRange everything(Ipv4Address(1, 2, 3, 4), 0);
    EXPECT_TRUE(everything.contains(Ipv4Address(255, 0, 0, 1)));

    const NetworkRange host(Ipv4Address(8, 8, 8, 8), 32);
    EXPECT_TRUE(host.contains(Ipv4Address(8, 8, 8, 8)));
    EXPECT_FALSE(host.contains(Ipv4Address(8, 8, 8, 9)));
}

TEST(NetworkRangeTest, RejectsMalformedCidr)
{
    for (const char *bad : {"10.0.0.0", "10.0.0.0/", "10.0.0.0/33", "10.0.0/8", "10.0.0.0/a", "10.0.0.0/008"})
    {
        EXPECT_FALSE(NetworkRange::fromCidr(bad).has_value()) << bad;
    }
}
