/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_reconciler.hpp
 * @brief Merges discovery results into the device history and builds the displayed list
 *
 * The appliance path is authoritative and persisted: every refresh first marks all known devices offline, then
 * upserts the observed ones by hardware address. The probe path is transient and never touches the history.
 **/

#ifndef _LANSCOUT_DEVICE_RECONCILER_HPP_
#define _LANSCOUT_DEVICE_RECONCILER_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/device.hpp"
#include "lanscout/device_store.hpp"

#include <functional>
#include <memory>

/** lanscout namespace */
namespace lanscout
{

class LANSCOUTAPI DeviceReconciler final
{
public:
    /** Wall clock in milliseconds since the epoch */
    using Clock = std::function<int64_t()>;

    explicit DeviceReconciler(std::shared_ptr<DeviceStore> store, Clock clock = nullptr);

    /**
     * Marks every stored device offline, then upserts each device of @a observed as online and seen now.
     * last_seen of an upserted record always increases, even when the clock did not advance.
     * Devices of @a observed without hardware address are skipped.
     */
    lanscout_status apply_appliance_result(const ScanResult &observed);

    /**
     * Builds the displayed list.
     * APPLIANCE returns @a persisted; PROBE returns @a transient with every record online and without hardware
     * address. Both drop addresses without a '.' separator and sort numerically.
     */
    static ScanResult merge(DeviceSource source, const ScanResult &persisted, const ScanResult &transient);

    /** merge() over the current store contents */
    ScanResult display_view(DeviceSource source, const ScanResult &transient = {}) const;

    std::shared_ptr<DeviceStore> store() const { return m_store; }

private:
    std::shared_ptr<DeviceStore> m_store;
    Clock m_clock;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_DEVICE_RECONCILER_HPP_ */
