/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file scan_coordinator.hpp
 * @brief Top level scan flow: appliance first, subnet probe as fallback
 **/

#ifndef _LANSCOUT_SCAN_COORDINATOR_HPP_
#define _LANSCOUT_SCAN_COORDINATOR_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/event.hpp"
#include "lanscout/device.hpp"
#include "lanscout/config.hpp"
#include "lanscout/subnet_prober.hpp"
#include "lanscout/appliance_client.hpp"
#include "lanscout/device_store.hpp"
#include "lanscout/device_reconciler.hpp"

#include <memory>
#include <mutex>

/** lanscout namespace */
namespace lanscout
{

/** Displayed device list and the path that produced it */
struct LANSCOUTAPI DeviceView final
{
    DeviceSource source = DeviceSource::APPLIANCE;
    ScanResult devices;
};

class LANSCOUTAPI ScanCoordinator final
{
public:
    /**
     * Wires the production components from @a config: mDNS (or static host) discovery, libcurl transport, file
     * token store, JSON device store and TCP prober.
     *
     * @param[in] config            Loaded configuration.
     * @param[in] use_appliance     When false, scan() always probes.
     * @param[in] shutdown_event    Shared cancellation signal, see abort().
     */
    static Expected<std::unique_ptr<ScanCoordinator>> create(const LanscoutConfig &config, bool use_appliance,
        EventPtr shutdown_event);

    /**
     * @param[in] appliance_client  May be null, scan() then always probes.
     * @param[in] prober            Fallback discovery path.
     * @param[in] store             Device history.
     * @param[in] fallback_to_probe Whether a failed appliance path falls back to the prober.
     * @param[in] shutdown_event    Signaled by abort().
     */
    ScanCoordinator(std::shared_ptr<ApplianceClient> appliance_client, std::shared_ptr<SubnetProber> prober,
        std::shared_ptr<DeviceStore> store, bool fallback_to_probe, EventPtr shutdown_event,
        DeviceReconciler::Clock clock = nullptr);

    ScanCoordinator(const ScanCoordinator &) = delete;
    ScanCoordinator &operator=(const ScanCoordinator &) = delete;

    /**
     * Refreshes the device list.
     * With an appliance, authorizes (reusing a stored token), fetches its device list, reconciles it into the
     * history and returns the persisted view. When that fails and fallback is enabled, probes the subnet and returns
     * the transient view. Returns Unexpected of ::LANSCOUT_SHUTDOWN_EVENT_SIGNALED when aborted.
     */
    Expected<DeviceView> scan();

    /** The reconciled view of the last active source, without any network access */
    DeviceView current_view() const;

    /** Forgets the appliance authorization and clears the device history */
    lanscout_status forget();

    /**
     * Cancels the scan in progress by signaling the shutdown event shared with the prober and the client.
     * The event is never reset here, an aborted coordinator fails every later scan() with
     * ::LANSCOUT_SHUTDOWN_EVENT_SIGNALED.
     */
    lanscout_status abort();

    std::shared_ptr<ApplianceClient> appliance_client() const { return m_appliance_client; }
    std::shared_ptr<DeviceStore> store() const { return m_store; }

private:
    Expected<DeviceView> scan_appliance();
    Expected<DeviceView> scan_probe();

    std::shared_ptr<ApplianceClient> m_appliance_client;
    std::shared_ptr<SubnetProber> m_prober;
    std::shared_ptr<DeviceStore> m_store;
    DeviceReconciler m_reconciler;
    const bool m_fallback_to_probe;
    EventPtr m_shutdown_event;

    mutable std::mutex m_view_mutex;
    DeviceSource m_last_source;
    ScanResult m_last_probe_result;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_SCAN_COORDINATOR_HPP_ */
