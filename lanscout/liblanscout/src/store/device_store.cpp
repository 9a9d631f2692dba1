/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_store.cpp
 * @brief In-memory and JSON file device stores
 **/

#include "lanscout/device_store.hpp"

#include "common/utils.hpp"
#include "common/filesystem.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanscout
{

#define JSON_PRINT_INDENTATION (4)

static const std::string MAC_KEY = "mac";
static const std::string IP_KEY = "ip";
static const std::string HOSTNAME_KEY = "hostname";
static const std::string LAST_SEEN_KEY = "lastSeen";
static const std::string IS_ONLINE_KEY = "isOnline";

lanscout_status DeviceStore::upsert_all(const ScanResult &records)
{
    for (const auto &record : records) {
        auto status = upsert(record);
        CHECK_SUCCESS(status);
    }
    return LANSCOUT_SUCCESS;
}

ScanResult MemoryDeviceStore::sorted_records_locked() const
{
    ScanResult devices;
    devices.reserve(m_records.size());
    for (const auto &entry : m_records) {
        devices.push_back(entry.second);
    }
    Ipv4Address::sort_devices(devices);
    return devices;
}

lanscout_status MemoryDeviceStore::commit(std::unique_lock<std::mutex> &lock)
{
    const auto devices = sorted_records_locked();
    // Persisting under the lock keeps the file in change order
    auto status = on_changed(devices);

    std::vector<Observer> observers;
    observers.reserve(m_observers.size());
    for (const auto &entry : m_observers) {
        observers.push_back(entry.second);
    }
    lock.unlock();

    for (const auto &observer : observers) {
        observer(devices);
    }
    return status;
}

lanscout_status MemoryDeviceStore::on_changed(const ScanResult &/*devices*/)
{
    return LANSCOUT_SUCCESS;
}

void MemoryDeviceStore::load_records(const ScanResult &records)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_records.clear();
    for (const auto &record : records) {
        m_records[record.hardware_address] = record;
    }
}

lanscout_status MemoryDeviceStore::upsert(const DeviceRecord &record)
{
    CHECK(record.has_hardware_address(), LANSCOUT_INVALID_ARGUMENT, "Device {} has no hardware address",
        record.address);

    std::unique_lock<std::mutex> lock(m_mutex);
    m_records[record.hardware_address] = record;
    return commit(lock);
}

lanscout_status MemoryDeviceStore::upsert_all(const ScanResult &records)
{
    for (const auto &record : records) {
        CHECK(record.has_hardware_address(), LANSCOUT_INVALID_ARGUMENT, "Device {} has no hardware address",
            record.address);
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    for (const auto &record : records) {
        m_records[record.hardware_address] = record;
    }
    return commit(lock);
}

lanscout_status MemoryDeviceStore::mark_all_offline()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    for (auto &entry : m_records) {
        entry.second.online = false;
    }
    return commit(lock);
}

lanscout_status MemoryDeviceStore::clear()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_records.clear();
    return commit(lock);
}

ScanResult MemoryDeviceStore::get_all() const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return sorted_records_locked();
}

Expected<DeviceRecord> MemoryDeviceStore::find(const std::string &hardware_address) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto record = m_records.find(hardware_address);
    if (m_records.end() == record) {
        return make_unexpected(LANSCOUT_NOT_FOUND);
    }
    return DeviceRecord(record->second);
}

DeviceStore::SubscriptionId MemoryDeviceStore::subscribe(Observer observer)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    const auto id = m_next_subscription_id++;
    m_observers[id] = std::move(observer);
    return id;
}

void MemoryDeviceStore::unsubscribe(SubscriptionId id)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_observers.erase(id);
}

JsonFileDeviceStore::JsonFileDeviceStore(const std::string &file_path) :
    m_file_path(file_path)
{}

Expected<std::shared_ptr<JsonFileDeviceStore>> JsonFileDeviceStore::create(const std::string &file_path)
{
    CHECK_AS_EXPECTED(!file_path.empty(), LANSCOUT_INVALID_ARGUMENT, "Empty device store path");

    auto store = make_shared_nothrow<JsonFileDeviceStore>(file_path);
    CHECK_NOT_NULL_AS_EXPECTED(store, LANSCOUT_OUT_OF_HOST_MEMORY);

    if (Filesystem::does_file_exists(file_path)) {
        TRY(const auto content, Filesystem::read_file(file_path));
        TRY(const auto records, deserialize(content), "Failed loading device store {}", file_path);
        store->load_records(records);
        LOGGER__DEBUG("Loaded {} devices from {}", records.size(), file_path);
    }

    return store;
}

Expected<ScanResult> JsonFileDeviceStore::deserialize(const std::string &content)
{
    ScanResult devices;
    try {
        const auto stored = json::parse(content);
        CHECK_AS_EXPECTED(stored.is_array(), LANSCOUT_FILE_OPERATION_FAILURE, "Device store is not a JSON list");

        for (const auto &entry : stored) {
            CHECK_AS_EXPECTED(entry.is_object(), LANSCOUT_FILE_OPERATION_FAILURE, "Device entry is not an object");
            DeviceRecord record{};
            record.hardware_address = entry.at(MAC_KEY).get<std::string>();
            record.address = entry.at(IP_KEY).get<std::string>();
            record.hostname = entry.value(HOSTNAME_KEY, UNRESOLVED_HOSTNAME);
            record.last_seen_ms = entry.value(LAST_SEEN_KEY, static_cast<int64_t>(0));
            record.online = entry.value(IS_ONLINE_KEY, false);
            CHECK_AS_EXPECTED(record.has_hardware_address(), LANSCOUT_FILE_OPERATION_FAILURE,
                "Device entry {} has an empty mac", record.address);
            devices.emplace_back(std::move(record));
        }
    } catch (const json::exception &e) {
        LOGGER__ERROR("Malformed device store: {}", e.what());
        return make_unexpected(LANSCOUT_FILE_OPERATION_FAILURE);
    }

    Ipv4Address::sort_devices(devices);
    return devices;
}

std::string JsonFileDeviceStore::serialize(const ScanResult &devices)
{
    json stored = json::array();
    for (const auto &device : devices) {
        stored.push_back({
            {MAC_KEY, device.hardware_address},
            {IP_KEY, device.address},
            {HOSTNAME_KEY, device.hostname},
            {LAST_SEEN_KEY, device.last_seen_ms},
            {IS_ONLINE_KEY, device.online},
        });
    }
    return stored.dump(JSON_PRINT_INDENTATION);
}

lanscout_status JsonFileDeviceStore::on_changed(const ScanResult &devices)
{
    auto status = Filesystem::write_file_atomic(m_file_path, serialize(devices));
    CHECK_SUCCESS(status, "Failed persisting device store to {}", m_file_path);
    return LANSCOUT_SUCCESS;
}

} /* namespace lanscout */
