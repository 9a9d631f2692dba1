/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_table.hpp
 * @brief Prints device lists as a table.
 **/

#ifndef _LANSCOUT_DEVICE_TABLE_HPP_
#define _LANSCOUT_DEVICE_TABLE_HPP_

#include "lanscoutcli.hpp"

#include <memory>
#include <ostream>


class DeviceTablePrinter final {
public:
    // vendor_lookup may be null, the vendor columns are omitted then
    explicit DeviceTablePrinter(std::shared_ptr<VendorLookup> vendor_lookup);

    // Returns a null lookup when the configuration names no database or the database fails to load
    static std::shared_ptr<VendorLookup> load_vendor_lookup(const LanscoutConfig &config);

    void print(const DeviceView &view, std::ostream &out) const;

private:
    void print_header(std::ostream &out) const;
    void print_row(const DeviceRecord &device, std::ostream &out) const;

    std::shared_ptr<VendorLookup> m_vendor_lookup;
};

#endif /* _LANSCOUT_DEVICE_TABLE_HPP_ */
