/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file os_utils.cpp
 * @brief Utilities for Posix methods
 **/

#include "common/os_utils.hpp"
#include "common/utils.hpp"

#include <unistd.h>
#include <pthread.h>
#include <climits>
#include <chrono>

namespace lanscout
{

void OsUtils::set_current_thread_name(const std::string &name)
{
    // pthread_setname_np name size is limited to 16 chars (including null terminator)
    static const size_t MAX_THREAD_NAME_LENGTH = 15;
    const auto truncated = name.substr(0, MAX_THREAD_NAME_LENGTH);
    (void) pthread_setname_np(pthread_self(), truncated.c_str());
}

Expected<std::string> OsUtils::get_host_name()
{
    char host_name[HOST_NAME_MAX + 1] = {};
    auto ret_val = gethostname(host_name, sizeof(host_name) - 1);
    CHECK_AS_EXPECTED(0 == ret_val, LANSCOUT_INTERNAL_FAILURE, "gethostname failed, errno {}", errno);
    return std::string(host_name);
}

int64_t OsUtils::get_epoch_millis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} /* namespace lanscout */
