/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file lanscoutcli.hpp
 * @brief lanscout CLI.
 **/

#ifndef _LANSCOUT_LANSCOUTCLI_HPP_
#define _LANSCOUT_LANSCOUTCLI_HPP_

#include "lanscout/lanscout.hpp"
#include "common/logger_macros.hpp"
#include "common/utils.hpp"
#include "CLI/CLI.hpp"
#include <string>

using namespace lanscout;

#define PARSE_CHECK(cond, message) \
    do {                                                                        \
        if (!(cond)) {                                                          \
            throw CLI::ParseError(message, CLI::ExitCodes::InvalidError);       \
        }                                                                       \
    } while (0)

struct lanscout_config_params {
    std::string config_path;
    std::string interface_name;
};

void add_config_options(CLI::App *app, lanscout_config_params &config_params);

/** Loads the configuration file and applies the command line overrides */
Expected<LanscoutConfig> load_config(const lanscout_config_params &config_params);

/**
 * Returns the process wide shutdown event, signaled on SIGINT and SIGTERM.
 * The handlers are installed on first call.
 */
Expected<EventPtr> get_shutdown_event();

#endif /* _LANSCOUT_LANSCOUTCLI_HPP_ */
