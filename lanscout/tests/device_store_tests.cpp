/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_store_tests.cpp
 * @brief Tests of the in-memory and JSON file device stores
 **/

#include "test_utils.hpp"

#include <nlohmann/json.hpp>

using namespace lanscout;
using namespace lanscout::test;

TEST(MemoryDeviceStoreTest, UpsertReplacesByHardwareAddress)
{
    MemoryDeviceStore store;
    ASSERT_EQ(LANSCOUT_SUCCESS, store.upsert(make_device("192.168.1.10", "old", "aa:aa:aa:aa:aa:01")));
    ASSERT_EQ(LANSCOUT_SUCCESS, store.upsert(make_device("192.168.1.11", "new", "aa:aa:aa:aa:aa:01")));

    const auto devices = store.get_all();
    ASSERT_EQ(1u, devices.size());
    EXPECT_EQ("192.168.1.11", devices[0].address);
    EXPECT_EQ("new", devices[0].hostname);

    auto found = store.find("aa:aa:aa:aa:aa:01");
    ASSERT_TRUE(found);
    EXPECT_EQ("new", found->hostname);
    EXPECT_EQ(LANSCOUT_NOT_FOUND, store.find("aa:aa:aa:aa:aa:02").status());
}

TEST(MemoryDeviceStoreTest, RejectsRecordsWithoutHardwareAddress)
{
    MemoryDeviceStore store;
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, store.upsert(make_device("192.168.1.10", "x", "")));
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, store.upsert_all({
        make_device("192.168.1.10", "x", "aa:aa:aa:aa:aa:01"),
        make_device("192.168.1.11", "y", ""),
    }));
    EXPECT_TRUE(store.get_all().empty());
}

TEST(MemoryDeviceStoreTest, OrdersByAddressAndMarksOffline)
{
    MemoryDeviceStore store;
    ASSERT_EQ(LANSCOUT_SUCCESS, store.upsert_all({
        make_device("192.168.1.100", "c", "aa:aa:aa:aa:aa:03"),
        make_device("192.168.1.9", "a", "aa:aa:aa:aa:aa:01"),
        make_device("192.168.1.20", "b", "aa:aa:aa:aa:aa:02"),
    }));
    ASSERT_EQ(LANSCOUT_SUCCESS, store.mark_all_offline());

    const auto devices = store.get_all();
    ASSERT_EQ(3u, devices.size());
    EXPECT_EQ("192.168.1.9", devices[0].address);
    EXPECT_EQ("192.168.1.20", devices[1].address);
    EXPECT_EQ("192.168.1.100", devices[2].address);
    for (const auto &device : devices) {
        EXPECT_FALSE(device.online);
    }

    ASSERT_EQ(LANSCOUT_SUCCESS, store.clear());
    EXPECT_TRUE(store.get_all().empty());
}

TEST(MemoryDeviceStoreTest, NotifiesSubscribers)
{
    MemoryDeviceStore store;
    std::vector<size_t> notified_sizes;
    const auto id = store.subscribe([&notified_sizes](const ScanResult &devices) {
        notified_sizes.push_back(devices.size());
    });

    ASSERT_EQ(LANSCOUT_SUCCESS, store.upsert_all({
        make_device("192.168.1.1", "a", "aa:aa:aa:aa:aa:01"),
        make_device("192.168.1.2", "b", "aa:aa:aa:aa:aa:02"),
    }));
    ASSERT_EQ(LANSCOUT_SUCCESS, store.mark_all_offline());
    store.unsubscribe(id);
    ASSERT_EQ(LANSCOUT_SUCCESS, store.clear());

    EXPECT_EQ((std::vector<size_t>{2, 2}), notified_sizes);
}

TEST(JsonFileDeviceStoreTest, PersistsAcrossInstances)
{
    TempDirectory directory;
    const auto path = directory.file("devices.json");

    {
        auto store = JsonFileDeviceStore::create(path);
        ASSERT_TRUE(store);
        EXPECT_TRUE(store.value()->get_all().empty());
        ASSERT_EQ(LANSCOUT_SUCCESS,
            store.value()->upsert(make_device("192.168.1.5", "nas", "aa:aa:aa:aa:aa:05", true, 1234)));
    }

    auto reloaded = JsonFileDeviceStore::create(path);
    ASSERT_TRUE(reloaded);
    const auto devices = reloaded.value()->get_all();
    ASSERT_EQ(1u, devices.size());
    EXPECT_EQ("192.168.1.5", devices[0].address);
    EXPECT_EQ("nas", devices[0].hostname);
    EXPECT_EQ("aa:aa:aa:aa:aa:05", devices[0].hardware_address);
    EXPECT_EQ(1234, devices[0].last_seen_ms);
    EXPECT_TRUE(devices[0].online);
}

TEST(JsonFileDeviceStoreTest, UsesDocumentedKeys)
{
    const auto content = JsonFileDeviceStore::serialize({
        make_device("192.168.1.5", "nas", "aa:aa:aa:aa:aa:05", false, 42),
    });
    const auto stored = nlohmann::json::parse(content);
    ASSERT_TRUE(stored.is_array());
    ASSERT_EQ(1u, stored.size());
    EXPECT_EQ("aa:aa:aa:aa:aa:05", stored[0].at("mac").get<std::string>());
    EXPECT_EQ("192.168.1.5", stored[0].at("ip").get<std::string>());
    EXPECT_EQ("nas", stored[0].at("hostname").get<std::string>());
    EXPECT_EQ(42, stored[0].at("lastSeen").get<int64_t>());
    EXPECT_FALSE(stored[0].at("isOnline").get<bool>());
}

TEST(JsonFileDeviceStoreTest, RejectsCorruptFiles)
{
    EXPECT_EQ(LANSCOUT_FILE_OPERATION_FAILURE, JsonFileDeviceStore::deserialize("{").status());
    EXPECT_EQ(LANSCOUT_FILE_OPERATION_FAILURE, JsonFileDeviceStore::deserialize("{}").status());
    EXPECT_EQ(LANSCOUT_FILE_OPERATION_FAILURE, JsonFileDeviceStore::deserialize("[{\"ip\": \"1.2.3.4\"}]").status());
    EXPECT_EQ(LANSCOUT_FILE_OPERATION_FAILURE,
        JsonFileDeviceStore::deserialize("[{\"ip\": \"1.2.3.4\", \"mac\": \"\"}]").status());

    auto minimal = JsonFileDeviceStore::deserialize("[{\"ip\": \"1.2.3.4\", \"mac\": \"aa\"}]");
    ASSERT_TRUE(minimal);
    ASSERT_EQ(1u, minimal->size());
    EXPECT_EQ(UNRESOLVED_HOSTNAME, minimal->at(0).hostname);
    EXPECT_FALSE(minimal->at(0).online);

    TempDirectory directory;
    const auto path = directory.file("devices.json");
    ASSERT_EQ(LANSCOUT_SUCCESS, Filesystem::write_file_atomic(path, "not json"));
    EXPECT_EQ(LANSCOUT_FILE_OPERATION_FAILURE, JsonFileDeviceStore::create(path).status());
    EXPECT_EQ(LANSCOUT_INVALID_ARGUMENT, JsonFileDeviceStore::create("").status());
}
