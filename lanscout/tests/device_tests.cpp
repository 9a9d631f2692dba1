/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_tests.cpp
 * @brief Tests of the address helpers and device records
 **/

#include "test_utils.hpp"

using namespace lanscout;
using namespace lanscout::test;

TEST(Ipv4AddressTest, ParsesStrictDottedQuads)
{
    auto octets = Ipv4Address::parse("192.168.1.17");
    ASSERT_TRUE(octets);
    EXPECT_EQ(192, octets.value()[0]);
    EXPECT_EQ(168, octets.value()[1]);
    EXPECT_EQ(1, octets.value()[2]);
    EXPECT_EQ(17, octets.value()[3]);

    EXPECT_TRUE(Ipv4Address::is_valid("0.0.0.0"));
    EXPECT_TRUE(Ipv4Address::is_valid("255.255.255.255"));
    EXPECT_FALSE(Ipv4Address::is_valid("256.1.1.1"));
    EXPECT_FALSE(Ipv4Address::is_valid("1.2.3"));
    EXPECT_FALSE(Ipv4Address::is_valid("1.2.3.4.5"));
    EXPECT_FALSE(Ipv4Address::is_valid("1..3.4"));
    EXPECT_FALSE(Ipv4Address::is_valid("a.b.c.d"));
    EXPECT_FALSE(Ipv4Address::is_valid("1.2.3.-4"));
    EXPECT_FALSE(Ipv4Address::is_valid(""));
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, Ipv4Address::parse("10.0.0").status());
}

TEST(Ipv4AddressTest, SortKeyIsNumericNotLexicographic)
{
    EXPECT_LT(Ipv4Address::sort_key("192.168.1.2"), Ipv4Address::sort_key("192.168.1.10"));
    EXPECT_LT(Ipv4Address::sort_key("192.168.1.99"), Ipv4Address::sort_key("192.168.1.100"));
    EXPECT_LT(Ipv4Address::sort_key("10.0.0.255"), Ipv4Address::sort_key("10.0.1.0"));
    EXPECT_LT(Ipv4Address::sort_key("9.255.255.255"), Ipv4Address::sort_key("10.0.0.0"));
    EXPECT_EQ(192168001017ULL, Ipv4Address::sort_key("192.168.1.17"));
}

TEST(Ipv4AddressTest, SortKeyOfMalformedAddressIsDeterministic)
{
    EXPECT_EQ(0ULL, Ipv4Address::sort_key("garbage"));
    EXPECT_EQ(Ipv4Address::sort_key("10.x.0.1"), Ipv4Address::sort_key("10.0.0.1"));
}

TEST(Ipv4AddressTest, PrefixAndSeparator)
{
    EXPECT_EQ("192.168.1", Ipv4Address::prefix_of("192.168.1.17"));
    EXPECT_EQ("", Ipv4Address::prefix_of("localhost"));
    EXPECT_TRUE(Ipv4Address::has_separator("10.0.0.1"));
    EXPECT_FALSE(Ipv4Address::has_separator("fe80::1"));
    EXPECT_TRUE(Ipv4Address::is_loopback("127.0.0.1"));
    EXPECT_TRUE(Ipv4Address::is_loopback("127.1.2.3"));
    EXPECT_FALSE(Ipv4Address::is_loopback("128.0.0.1"));
}

TEST(Ipv4AddressTest, SortDevicesOrdersByNumericAddress)
{
    ScanResult devices = {
        make_device("192.168.1.100", "c", ""),
        make_device("192.168.1.2", "a", ""),
        make_device("192.168.1.10", "b", ""),
    };
    Ipv4Address::sort_devices(devices);

    ASSERT_EQ(3u, devices.size());
    EXPECT_EQ("192.168.1.2", devices[0].address);
    EXPECT_EQ("192.168.1.10", devices[1].address);
    EXPECT_EQ("192.168.1.100", devices[2].address);
}

TEST(DeviceRecordTest, HardwareAddressPresence)
{
    EXPECT_FALSE(make_device("10.0.0.1", UNRESOLVED_HOSTNAME, "").has_hardware_address());
    EXPECT_TRUE(make_device("10.0.0.1", UNRESOLVED_HOSTNAME, "aa:bb:cc:dd:ee:ff").has_hardware_address());
    EXPECT_EQ("unresolved", UNRESOLVED_HOSTNAME);
}

TEST(DeviceSourceTest, ToString)
{
    EXPECT_EQ("appliance", to_string(DeviceSource::APPLIANCE));
    EXPECT_EQ("probe", to_string(DeviceSource::PROBE));
}

TEST(StatusMessageTest, NamesEveryStatus)
{
    EXPECT_STREQ("LANSCOUT_SUCCESS", lanscout_get_status_message(LANSCOUT_SUCCESS));
    EXPECT_STREQ("LANSCOUT_AUTHORIZATION_DENIED", lanscout_get_status_message(LANSCOUT_AUTHORIZATION_DENIED));
    EXPECT_EQ(nullptr, lanscout_get_status_message(LANSCOUT_STATUS_COUNT));

    lanscout_version_t version = {};
    EXPECT_EQ(LANSCOUT_SUCCESS, lanscout_get_library_version(&version));
    EXPECT_EQ(static_cast<uint32_t>(LANSCOUT_MAJOR_VERSION), version.major);
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, lanscout_get_library_version(nullptr));
}
