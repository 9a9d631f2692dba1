/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file lanscout.hpp
 * @brief C++ API for the lanscout library.
 *
 * C++ API for lanscout, a local network device discovery library.
 **/

#ifndef _LANSCOUT_HPP_
#define _LANSCOUT_HPP_

#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "lanscout/event.hpp"
#include "lanscout/device.hpp"
#include "lanscout/network_state.hpp"
#include "lanscout/subnet_prober.hpp"
#include "lanscout/authorization.hpp"
#include "lanscout/service_discovery.hpp"
#include "lanscout/http_transport.hpp"
#include "lanscout/appliance_api.hpp"
#include "lanscout/token_store.hpp"
#include "lanscout/appliance_client.hpp"
#include "lanscout/device_store.hpp"
#include "lanscout/device_reconciler.hpp"
#include "lanscout/vendor_lookup.hpp"
#include "lanscout/config.hpp"
#include "lanscout/scan_coordinator.hpp"

#endif /* _LANSCOUT_HPP_ */
