/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_reconciler.cpp
 * @brief Device reconciliation
 **/

#include "lanscout/device_reconciler.hpp"

#include "common/utils.hpp"

#include <algorithm>

namespace lanscout
{

DeviceReconciler::DeviceReconciler(std::shared_ptr<DeviceStore> store, Clock clock) :
    m_store(std::move(store)),
    m_clock(clock ? std::move(clock) : Clock(current_epoch_millis))
{}

lanscout_status DeviceReconciler::apply_appliance_result(const ScanResult &observed)
{
    auto status = m_store->mark_all_offline();
    CHECK_SUCCESS(status, "Failed marking devices offline");

    const auto now = m_clock();
    ScanResult updates;
    updates.reserve(observed.size());
    for (const auto &device : observed) {
        if (!device.has_hardware_address()) {
            LOGGER__WARNING("Skipping {} ({}): no hardware address", device.address, device.hostname);
            continue;
        }

        DeviceRecord record = device;
        record.online = true;
        record.last_seen_ms = now;

        auto previous = m_store->find(device.hardware_address);
        if (previous) {
            record.last_seen_ms = std::max(now, previous->last_seen_ms + 1);
        }
        updates.emplace_back(std::move(record));
    }

    status = m_store->upsert_all(updates);
    CHECK_SUCCESS(status, "Failed storing appliance devices");

    LOGGER__DEBUG("Reconciled {} appliance devices", updates.size());
    return LANSCOUT_SUCCESS;
}

ScanResult DeviceReconciler::merge(DeviceSource source, const ScanResult &persisted, const ScanResult &transient)
{
    ScanResult view;
    switch (source) {
    case DeviceSource::APPLIANCE:
        view = persisted;
        break;
    case DeviceSource::PROBE:
        view = transient;
        for (auto &device : view) {
            device.online = true;
            device.hardware_address.clear();
        }
        break;
    }

    // Appliance entries may carry IPv6 or empty addresses
    view.erase(std::remove_if(view.begin(), view.end(),
        [](const DeviceRecord &device) { return !Ipv4Address::has_separator(device.address); }), view.end());
    Ipv4Address::sort_devices(view);
    return view;
}

ScanResult DeviceReconciler::display_view(DeviceSource source, const ScanResult &transient) const
{
    return merge(source, m_store->get_all(), transient);
}

} /* namespace lanscout */
