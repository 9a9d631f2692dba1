/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file env_vars.hpp
 * @brief: defines a set of environment variables used in lanscout
 * **/

#ifndef LANSCOUT_ENV_VARS_HPP_
#define LANSCOUT_ENV_VARS_HPP_


namespace lanscout
{

#define LANSCOUT_LOGGER_PATH_ENV_VAR ("LANSCOUT_LOGGER_PATH")

#define LANSCOUT_CONSOLE_LOGGER_LEVEL_ENV_VAR ("LANSCOUT_CONSOLE_LOGGER_LEVEL")

#define LANSCOUT_CONFIG_PATH_ENV_VAR ("LANSCOUT_CONFIG_PATH")

} /* namespace lanscout */

#endif /* LANSCOUT_ENV_VARS_HPP_ */
