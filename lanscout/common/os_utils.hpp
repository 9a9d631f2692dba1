/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file os_utils.hpp
 * @brief Utilities for OS methods
 **/

#ifndef _LANSCOUT_OS_UTILS_HPP_
#define _LANSCOUT_OS_UTILS_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"

#include <string>
#include <cstdint>


namespace lanscout
{

class OsUtils final
{
public:
    OsUtils() = delete;

    static void set_current_thread_name(const std::string &name);
    static Expected<std::string> get_host_name();
    static int64_t get_epoch_millis();
};

} /* namespace lanscout */

#endif /* _LANSCOUT_OS_UTILS_HPP_ */
