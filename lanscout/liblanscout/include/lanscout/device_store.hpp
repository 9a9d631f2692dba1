/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_store.hpp
 * @brief Persistent device history keyed by hardware address
 **/

#ifndef _LANSCOUT_DEVICE_STORE_HPP_
#define _LANSCOUT_DEVICE_STORE_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/device.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/** lanscout namespace */
namespace lanscout
{

class LANSCOUTAPI DeviceStore
{
public:
    using Observer = std::function<void(const ScanResult &devices)>;
    using SubscriptionId = uint32_t;

    virtual ~DeviceStore() = default;

    /** Inserts or replaces the record with the same hardware address. Records without one are rejected. */
    virtual lanscout_status upsert(const DeviceRecord &record) = 0;

    /** Upserts every record as one change (one notification) */
    virtual lanscout_status upsert_all(const ScanResult &records);

    virtual lanscout_status mark_all_offline() = 0;
    virtual lanscout_status clear() = 0;

    /** All records, ordered ascending by address */
    virtual ScanResult get_all() const = 0;

    /** Returns Unexpected of ::LANSCOUT_NOT_FOUND when no record has @a hardware_address */
    virtual Expected<DeviceRecord> find(const std::string &hardware_address) const = 0;

    /** @a observer is called with the full ordered list after every change */
    virtual SubscriptionId subscribe(Observer observer) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

class LANSCOUTAPI MemoryDeviceStore : public DeviceStore
{
public:
    MemoryDeviceStore() = default;
    virtual ~MemoryDeviceStore() = default;

    MemoryDeviceStore(const MemoryDeviceStore &) = delete;
    MemoryDeviceStore &operator=(const MemoryDeviceStore &) = delete;

    virtual lanscout_status upsert(const DeviceRecord &record) override;
    virtual lanscout_status upsert_all(const ScanResult &records) override;
    virtual lanscout_status mark_all_offline() override;
    virtual lanscout_status clear() override;
    virtual ScanResult get_all() const override;
    virtual Expected<DeviceRecord> find(const std::string &hardware_address) const override;
    virtual SubscriptionId subscribe(Observer observer) override;
    virtual void unsubscribe(SubscriptionId id) override;

protected:
    /** Called with the new contents after every change, before observers are notified */
    virtual lanscout_status on_changed(const ScanResult &devices);

    /** Replaces the contents without notification, used when loading persisted records */
    void load_records(const ScanResult &records);

private:
    ScanResult sorted_records_locked() const;
    lanscout_status commit(std::unique_lock<std::mutex> &lock);

    mutable std::mutex m_mutex;
    std::map<std::string, DeviceRecord> m_records;
    std::map<SubscriptionId, Observer> m_observers;
    SubscriptionId m_next_subscription_id = 0;
};

/**
 * MemoryDeviceStore persisted to a JSON file as a list of {"mac", "ip", "hostname", "lastSeen", "isOnline"}.
 * The file is rewritten atomically after every change.
 */
class LANSCOUTAPI JsonFileDeviceStore final : public MemoryDeviceStore
{
public:
    /** Loads @a file_path when it exists. A missing file starts an empty store. */
    static Expected<std::shared_ptr<JsonFileDeviceStore>> create(const std::string &file_path);

    explicit JsonFileDeviceStore(const std::string &file_path);

    const std::string &file_path() const { return m_file_path; }

    static Expected<ScanResult> deserialize(const std::string &content);
    static std::string serialize(const ScanResult &devices);

protected:
    virtual lanscout_status on_changed(const ScanResult &devices) override;

private:
    const std::string m_file_path;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_DEVICE_STORE_HPP_ */
