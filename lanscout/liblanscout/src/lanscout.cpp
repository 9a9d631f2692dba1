/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file lanscout.cpp
 * @brief Implementation of the lanscout C API
 **/

#include "lanscout/lanscout.h"

#include "common/utils.hpp"
#include "common/logger_macros.hpp"

#include "utils/lanscout_logger.hpp"

#ifndef LANSCOUT_MAJOR_VERSION
#error "LANSCOUT_MAJOR_VERSION is not defined by the build"
#endif

using namespace lanscout;

__attribute__((constructor)) static void lanscout__initialize_logger()
{
    (void) LanscoutLogger::get_instance();
}

static const char *lanscout_status_msg_format[] =
{
#define LANSCOUT_STATUS__X(value, name) #name,
    LANSCOUT_STATUS_VARIABLES
#undef LANSCOUT_STATUS__X
};

const char* lanscout_get_status_message(lanscout_status status)
{
    if (status >= LANSCOUT_STATUS_COUNT) {
        LOGGER__ERROR("Failed to get lanscout_status message because of invalid lanscout_status value. Max lanscout_status value = {}, given value = {}",
            (LANSCOUT_STATUS_COUNT-1), static_cast<int>(status));
        return nullptr;
    }
    return lanscout_status_msg_format[status];
}

lanscout_status lanscout_get_library_version(lanscout_version_t *version)
{
    CHECK_ARG_NOT_NULL(version);
    version->major = LANSCOUT_MAJOR_VERSION;
    version->minor = LANSCOUT_MINOR_VERSION;
    version->revision = LANSCOUT_REVISION_VERSION;
    return LANSCOUT_SUCCESS;
}
