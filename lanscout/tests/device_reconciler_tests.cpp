/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_reconciler_tests.cpp
 * @brief Tests of device reconciliation and of the displayed view
 **/

#include "test_utils.hpp"

using namespace lanscout;
using namespace lanscout::test;

class DeviceReconcilerTest : public ::testing::Test
{
protected:
    DeviceReconcilerTest() :
        m_store(std::make_shared<MemoryDeviceStore>()),
        m_reconciler(m_store, [this]() { return m_now; })
    {}

    int64_t m_now = 1000;
    std::shared_ptr<MemoryDeviceStore> m_store;
    DeviceReconciler m_reconciler;
};

TEST_F(DeviceReconcilerTest, MarksMissingDevicesOffline)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_reconciler.apply_appliance_result({
        make_device("192.168.1.2", "a", "aa:aa:aa:aa:aa:02"),
        make_device("192.168.1.3", "b", "aa:aa:aa:aa:aa:03"),
    }));

    m_now = 2000;
    ASSERT_EQ(LANSCOUT_SUCCESS, m_reconciler.apply_appliance_result({
        make_device("192.168.1.3", "b", "aa:aa:aa:aa:aa:03"),
        make_device("192.168.1.4", "c", "aa:aa:aa:aa:aa:04"),
    }));

    const auto devices = m_store->get_all();
    ASSERT_EQ(3u, devices.size());
    EXPECT_FALSE(devices[0].online);
    EXPECT_EQ(1000, devices[0].last_seen_ms);
    EXPECT_TRUE(devices[1].online);
    EXPECT_EQ(2000, devices[1].last_seen_ms);
    EXPECT_TRUE(devices[2].online);
}

TEST_F(DeviceReconcilerTest, ReapplyingIsIdempotentExceptLastSeen)
{
    const ScanResult observed = {
        make_device("192.168.1.2", "a", "aa:aa:aa:aa:aa:02", false),
        make_device("192.168.1.3", "b", "aa:aa:aa:aa:aa:03", false),
    };
    ASSERT_EQ(LANSCOUT_SUCCESS, m_reconciler.apply_appliance_result(observed));
    const auto first = m_store->get_all();

    // Same clock reading: last_seen still increases
    ASSERT_EQ(LANSCOUT_SUCCESS, m_reconciler.apply_appliance_result(observed));
    const auto second = m_store->get_all();

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(first[i].address, second[i].address);
        EXPECT_EQ(first[i].hostname, second[i].hostname);
        EXPECT_EQ(first[i].hardware_address, second[i].hardware_address);
        EXPECT_TRUE(second[i].online);
        EXPECT_GT(second[i].last_seen_ms, first[i].last_seen_ms);
    }
}

TEST_F(DeviceReconcilerTest, SkipsDevicesWithoutHardwareAddress)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_reconciler.apply_appliance_result({
        make_device("192.168.1.2", "a", ""),
        make_device("192.168.1.3", "b", "aa:aa:aa:aa:aa:03"),
    }));

    const auto devices = m_store->get_all();
    ASSERT_EQ(1u, devices.size());
    EXPECT_EQ("192.168.1.3", devices[0].address);
}

TEST_F(DeviceReconcilerTest, EmptyResultMarksEverythingOffline)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_reconciler.apply_appliance_result({
        make_device("192.168.1.2", "a", "aa:aa:aa:aa:aa:02"),
    }));
    ASSERT_EQ(LANSCOUT_SUCCESS, m_reconciler.apply_appliance_result({}));

    const auto devices = m_store->get_all();
    ASSERT_EQ(1u, devices.size());
    EXPECT_FALSE(devices[0].online);
}

TEST_F(DeviceReconcilerTest, ApplianceViewFiltersAndSorts)
{
    ASSERT_EQ(LANSCOUT_SUCCESS, m_reconciler.apply_appliance_result({
        make_device("192.168.1.100", "c", "aa:aa:aa:aa:aa:03"),
        make_device("fe80::1", "v6", "aa:aa:aa:aa:aa:04"),
        make_device("192.168.1.20", "b", "aa:aa:aa:aa:aa:02"),
    }));

    const auto view = m_reconciler.display_view(DeviceSource::APPLIANCE);
    ASSERT_EQ(2u, view.size());
    EXPECT_EQ("192.168.1.20", view[0].address);
    EXPECT_EQ("192.168.1.100", view[1].address);
    EXPECT_EQ("aa:aa:aa:aa:aa:02", view[0].hardware_address);
}

TEST(DeviceMergeTest, ProbeViewIsTransient)
{
    const ScanResult persisted = {
        make_device("192.168.1.50", "stored", "aa:aa:aa:aa:aa:50"),
    };
    const ScanResult probed = {
        make_device("192.168.1.30", "x", "aa:aa:aa:aa:aa:30", false),
        make_device("192.168.1.4", UNRESOLVED_HOSTNAME, ""),
        make_device("", "empty", ""),
    };

    const auto view = DeviceReconciler::merge(DeviceSource::PROBE, persisted, probed);
    ASSERT_EQ(2u, view.size());
    EXPECT_EQ("192.168.1.4", view[0].address);
    EXPECT_EQ("192.168.1.30", view[1].address);
    for (const auto &device : view) {
        EXPECT_TRUE(device.online);
        EXPECT_TRUE(device.hardware_address.empty());
    }
}

TEST(DeviceMergeTest, ProbeViewDoesNotTouchTheStore)
{
    auto store = std::make_shared<MemoryDeviceStore>();
    ASSERT_EQ(LANSCOUT_SUCCESS, store->upsert(make_device("192.168.1.50", "stored", "aa:aa:aa:aa:aa:50", false)));
    DeviceReconciler reconciler(store);

    const auto view = reconciler.display_view(DeviceSource::PROBE, {make_device("192.168.1.7", "p", "")});
    ASSERT_EQ(1u, view.size());
    EXPECT_EQ("192.168.1.7", view[0].address);

    const auto stored = store->get_all();
    ASSERT_EQ(1u, stored.size());
    EXPECT_FALSE(stored[0].online);
}
