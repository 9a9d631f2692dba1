/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file vendor_lookup.hpp
 * @brief Manufacturer and device category lookup by MAC address prefix (OUI)
 **/

#ifndef _LANSCOUT_VENDOR_LOOKUP_HPP_
#define _LANSCOUT_VENDOR_LOOKUP_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include <map>
#include <memory>
#include <string>

/** lanscout namespace */
namespace lanscout
{

enum class DeviceCategory
{
    UNKNOWN,
    ROUTER,
    PC,
    PHONE,
    APPLE_PHONE,
    SMART_DISPLAY,
    TV,
    SMART_DEVICE,
    CONSOLE,
    PRINTER,
    NETWORK,
};

LANSCOUTAPI std::string to_string(DeviceCategory category);

class LANSCOUTAPI VendorLookup final
{
public:
    static const std::string NOT_AVAILABLE;
    static const std::string UNKNOWN_MANUFACTURER;

    /** Loads a JSON list of {"oui": "b827eb", "manufacturer": "..."} */
    static Expected<std::shared_ptr<VendorLookup>> create_from_file(const std::string &file_path);
    static Expected<std::shared_ptr<VendorLookup>> create_from_json(const std::string &content);

    /** An empty database, every valid MAC maps to ::UNKNOWN_MANUFACTURER */
    VendorLookup() = default;
    explicit VendorLookup(std::map<std::string, std::string> oui_to_vendor);

    /** "N/A" for an empty or malformed MAC, "Unknown manufacturer" when the OUI is not listed */
    std::string get_vendor_name(const std::string &hardware_address) const;

    /**
     * UNKNOWN for an empty or malformed MAC. Otherwise the category of the first manufacturer keyword found in the
     * vendor name, or NETWORK when the OUI is not listed or no keyword matches.
     */
    DeviceCategory get_device_category(const std::string &hardware_address) const;

    size_t size() const { return m_oui_to_vendor.size(); }

    /** "B8:27:EB:12:34:56" -> "b827eb", or an empty string when @a hardware_address has no valid OUI */
    static std::string oui_key(const std::string &hardware_address);

private:
    std::map<std::string, std::string> m_oui_to_vendor;
};

} /* namespace lanscout */

#endif /* _LANSCOUT_VENDOR_LOOKUP_HPP_ */
