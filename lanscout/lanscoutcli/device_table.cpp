/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_table.cpp
 * @brief Prints device lists as a table.
 **/

#include "device_table.hpp"

#include "common/filesystem.hpp"

#include <spdlog/fmt/chrono.h>

#include <ctime>
#include <iomanip>

#define ADDRESS_WIDTH (17)
#define HOSTNAME_WIDTH (28)
#define MAC_WIDTH (19)
#define VENDOR_WIDTH (26)
#define CATEGORY_WIDTH (15)
#define STATUS_WIDTH (9)
#define LAST_SEEN_WIDTH (19)

DeviceTablePrinter::DeviceTablePrinter(std::shared_ptr<VendorLookup> vendor_lookup) :
    m_vendor_lookup(std::move(vendor_lookup))
{}

std::shared_ptr<VendorLookup> DeviceTablePrinter::load_vendor_lookup(const LanscoutConfig &config)
{
    if (config.storage.vendor_database.empty()) {
        return nullptr;
    }

    auto lookup = VendorLookup::create_from_file(Filesystem::expand_home(config.storage.vendor_database));
    if (!lookup) {
        LOGGER__WARNING("Vendor database {} not loaded (status {}), vendor names are not shown",
            config.storage.vendor_database, lookup.status());
        return nullptr;
    }
    return lookup.release();
}

static std::string format_last_seen(int64_t last_seen_ms)
{
    if (0 >= last_seen_ms) {
        return "-";
    }
    const std::time_t seconds = static_cast<std::time_t>(last_seen_ms / 1000);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(seconds));
}

void DeviceTablePrinter::print_header(std::ostream &out) const
{
    size_t line_length = ADDRESS_WIDTH + HOSTNAME_WIDTH + MAC_WIDTH + STATUS_WIDTH + LAST_SEEN_WIDTH;
    out << std::setw(ADDRESS_WIDTH) << std::left << "IP Address" <<
        std::setw(HOSTNAME_WIDTH) << std::left << "Hostname" <<
        std::setw(MAC_WIDTH) << std::left << "MAC Address";
    if (nullptr != m_vendor_lookup) {
        out << std::setw(VENDOR_WIDTH) << std::left << "Vendor" <<
            std::setw(CATEGORY_WIDTH) << std::left << "Category";
        line_length += VENDOR_WIDTH + CATEGORY_WIDTH;
    }
    out << std::setw(STATUS_WIDTH) << std::left << "Status" <<
        std::setw(LAST_SEEN_WIDTH) << std::left << "Last Seen" <<
        "\n" << std::string(line_length, '-') << "\n";
}

void DeviceTablePrinter::print_row(const DeviceRecord &device, std::ostream &out) const
{
    const auto mac = device.has_hardware_address() ? device.hardware_address : VendorLookup::NOT_AVAILABLE;
    out << std::setw(ADDRESS_WIDTH) << std::left << device.address <<
        std::setw(HOSTNAME_WIDTH) << std::left << device.hostname <<
        std::setw(MAC_WIDTH) << std::left << mac;
    if (nullptr != m_vendor_lookup) {
        out << std::setw(VENDOR_WIDTH) << std::left << m_vendor_lookup->get_vendor_name(device.hardware_address) <<
            std::setw(CATEGORY_WIDTH) << std::left << to_string(m_vendor_lookup->get_device_category(device.hardware_address));
    }
    out << std::setw(STATUS_WIDTH) << std::left << (device.online ? "online" : "offline") <<
        std::setw(LAST_SEEN_WIDTH) << std::left << format_last_seen(device.last_seen_ms) << "\n";
}

void DeviceTablePrinter::print(const DeviceView &view, std::ostream &out) const
{
    if (view.devices.empty()) {
        out << "No devices found (source: " << to_string(view.source) << ")" << std::endl;
        return;
    }

    out << "Devices (source: " << to_string(view.source) << "):" << "\n";
    print_header(out);
    for (const auto &device : view.devices) {
        print_row(device, out);
    }
    out << std::flush;
}
