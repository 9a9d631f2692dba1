/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file vendor_lookup_tests.cpp
 * @brief Tests of the OUI vendor lookup
 **/

#include "test_utils.hpp"

using namespace lanscout;
using namespace lanscout::test;

static std::shared_ptr<VendorLookup> sample_lookup()
{
    auto lookup = VendorLookup::create_from_json(R"([
        {"oui": "B827EB", "manufacturer": "Raspberry Pi Foundation"},
        {"oui": "f0d1a9", "manufacturer": "Apple, Inc."},
        {"oui": "001122", "manufacturer": "Acme Networks"}
    ])");
    EXPECT_TRUE(lookup);
    return lookup ? lookup.release() : nullptr;
}

TEST(VendorLookupTest, OuiKey)
{
    EXPECT_EQ("b827eb", VendorLookup::oui_key("B8:27:EB:12:34:56"));
    EXPECT_EQ("b827eb", VendorLookup::oui_key("b8:27:eb"));
    EXPECT_EQ("", VendorLookup::oui_key(""));
    EXPECT_EQ("", VendorLookup::oui_key("zz:27:eb:12:34:56"));
    EXPECT_EQ("", VendorLookup::oui_key("b8:27"));
}

TEST(VendorLookupTest, VendorNames)
{
    auto lookup = sample_lookup();
    ASSERT_NE(nullptr, lookup);
    EXPECT_EQ(3u, lookup->size());

    EXPECT_EQ("Raspberry Pi Foundation", lookup->get_vendor_name("b8:27:eb:00:00:01"));
    EXPECT_EQ(VendorLookup::UNKNOWN_MANUFACTURER, lookup->get_vendor_name("aa:bb:cc:00:00:01"));
    EXPECT_EQ(VendorLookup::NOT_AVAILABLE, lookup->get_vendor_name(""));
}

TEST(VendorLookupTest, DeviceCategories)
{
    auto lookup = sample_lookup();
    ASSERT_NE(nullptr, lookup);

    EXPECT_EQ(DeviceCategory::SMART_DEVICE, lookup->get_device_category("b8:27:eb:00:00:01"));
    EXPECT_EQ(DeviceCategory::APPLE_PHONE, lookup->get_device_category("F0:D1:A9:00:00:01"));
    EXPECT_EQ(DeviceCategory::NETWORK, lookup->get_device_category("00:11:22:00:00:01"));
    EXPECT_EQ(DeviceCategory::NETWORK, lookup->get_device_category("aa:bb:cc:00:00:01"));
    EXPECT_EQ(DeviceCategory::UNKNOWN, lookup->get_device_category(""));
    EXPECT_EQ("apple-phone", to_string(DeviceCategory::APPLE_PHONE));
}

TEST(VendorLookupTest, RejectsMalformedDatabase)
{
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, VendorLookup::create_from_json("{}").status());
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, VendorLookup::create_from_json("[{\"oui\": \"b827eb\"}]").status());
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, VendorLookup::create_from_json("not json").status());
}

TEST(VendorLookupTest, LoadsFromFile)
{
    TempDirectory directory;
    const auto path = directory.file("oui.json");
    ASSERT_EQ(LANSCOUT_SUCCESS,
        Filesystem::write_file_atomic(path, R"([{"oui": "001122", "manufacturer": "Acme"}])"));

    auto lookup = VendorLookup::create_from_file(path);
    ASSERT_TRUE(lookup);
    EXPECT_EQ("Acme", lookup.value()->get_vendor_name("00:11:22:33:44:55"));
    EXPECT_FALSE(VendorLookup::create_from_file(Filesystem::join(directory.path(), "missing.json")));
}
