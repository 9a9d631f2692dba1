/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file lanscout.h
 * @brief C API definitions for the lanscout library.
 *
 * Return codes and constants shared by every lanscout component (subnet prober, appliance client,
 * device reconciler and the lanscoutcli tool).
 **/

#ifndef _LANSCOUT_H_
#define _LANSCOUT_H_

#ifdef __cplusplus
extern "C" {
#endif

#include "platform.h"

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>
#include <limits.h>


/** @defgroup group_defines lanscout API definitions
 *  @{
 */

#define LANSCOUT_MAX_ENUM (INT_MAX)

#define LANSCOUT_DEFAULT_PROBE_PORT (135)
#define LANSCOUT_DEFAULT_PROBE_TIMEOUT_MS (50)
#define LANSCOUT_FIRST_HOST_OCTET (1)
#define LANSCOUT_LAST_HOST_OCTET (254)
#define LANSCOUT_MAX_SUBNET_HOSTS (LANSCOUT_LAST_HOST_OCTET - LANSCOUT_FIRST_HOST_OCTET + 1)

#define LANSCOUT_DEFAULT_APPLIANCE_SERVICE_TYPE ("_fbx-api._tcp.local")
#define LANSCOUT_DEFAULT_APPLIANCE_HTTPS_PORT (443)
#define LANSCOUT_DEFAULT_DISCOVERY_TIMEOUT_MS (3000)
#define LANSCOUT_DEFAULT_POLL_INTERVAL_MS (1000)
#define LANSCOUT_DEFAULT_HTTP_TIMEOUT_MS (5000)


#define LANSCOUT_UNRESOLVED_HOSTNAME ("unresolved")

/** lanscout return codes */
#define LANSCOUT_STATUS_VARIABLES\
    LANSCOUT_STATUS__X(0,  LANSCOUT_SUCCESS                              /*!< Success - No error */)\
    LANSCOUT_STATUS__X(1,  LANSCOUT_UNINITIALIZED                        /*!< No error code was initialized */)\
    LANSCOUT_STATUS__X(2,  LANSCOUT_INVALID_ARGUMENT                     /*!< Invalid argument passed to function */)\
    LANSCOUT_STATUS__X(3,  LANSCOUT_OUT_OF_HOST_MEMORY                   /*!< Cannot allocate more memory at host */)\
    LANSCOUT_STATUS__X(4,  LANSCOUT_TIMEOUT                              /*!< Received a timeout */)\
    LANSCOUT_STATUS__X(5,  LANSCOUT_INVALID_OPERATION                    /*!< Invalid operation */)\
    LANSCOUT_STATUS__X(6,  LANSCOUT_INTERNAL_FAILURE                     /*!< Unexpected internal failure */)\
    LANSCOUT_STATUS__X(7,  LANSCOUT_OPEN_FILE_FAILURE                    /*!< Failed to open file */)\
    LANSCOUT_STATUS__X(8,  LANSCOUT_FILE_OPERATION_FAILURE               /*!< File operation failure */)\
    LANSCOUT_STATUS__X(9,  LANSCOUT_CLOSE_FAILURE                        /*!< Failed to close fd */)\
    LANSCOUT_STATUS__X(10, LANSCOUT_ETH_FAILURE                          /*!< Ethernet operation has failed */)\
    LANSCOUT_STATUS__X(11, LANSCOUT_NO_IPV4_INTERFACES_FOUND             /*!< No interfaces found with an IPv4 address */)\
    LANSCOUT_STATUS__X(12, LANSCOUT_CONNECTION_REFUSED                   /*!< Connection was refused by other side */)\
    LANSCOUT_STATUS__X(13, LANSCOUT_NOT_FOUND                            /*!< Could not find element */)\
    LANSCOUT_STATUS__X(14, LANSCOUT_SHUTDOWN_EVENT_SIGNALED              /*!< A shutdown event has been signaled */)\
    LANSCOUT_STATUS__X(15, LANSCOUT_HTTP_FAILURE                         /*!< HTTP transport failure */)\
    LANSCOUT_STATUS__X(16, LANSCOUT_INVALID_APPLIANCE_RESPONSE           /*!< Appliance returned an error or a malformed response */)\
    LANSCOUT_STATUS__X(17, LANSCOUT_APPLIANCE_NOT_FOUND                  /*!< No appliance answered the service discovery query */)\
    LANSCOUT_STATUS__X(18, LANSCOUT_AUTHORIZATION_DENIED                 /*!< Authorization request was denied on the appliance */)\
    LANSCOUT_STATUS__X(19, LANSCOUT_AUTHORIZATION_TIMEOUT                /*!< Authorization request was not answered on the appliance in time */)\
    LANSCOUT_STATUS__X(20, LANSCOUT_SESSION_FAILURE                      /*!< Challenge-response login was rejected */)\
    LANSCOUT_STATUS__X(21, LANSCOUT_NOT_AUTHORIZED                       /*!< Operation requires an authorized appliance session */)\
    LANSCOUT_STATUS__X(22, LANSCOUT_CRYPTO_FAILURE                       /*!< Cryptographic primitive failure */)\
    LANSCOUT_STATUS__X(23, LANSCOUT_INVALID_CONFIG                       /*!< Configuration file is malformed */)\

typedef enum {
#define LANSCOUT_STATUS__X(value, name) name = value,
    LANSCOUT_STATUS_VARIABLES
#undef LANSCOUT_STATUS__X

    /** Must be last! */
    LANSCOUT_STATUS_COUNT,

    /** Max enum value to maintain ABI Integrity */
    LANSCOUT_STATUS_MAX_ENUM                    = LANSCOUT_MAX_ENUM
} lanscout_status;

/** @} */ // end of group_defines

/**
 * Returns a string format of @a status.
 *
 * @param[in] status        A ::lanscout_status to be converted to string format.
 * @return Upon success, returns @a status as a string format. Otherwise, returns @a nullptr.
 */
LANSCOUTAPI const char* lanscout_get_status_message(lanscout_status status);

/** lanscout library version */
typedef struct {
    uint32_t major;
    uint32_t minor;
    uint32_t revision;
} lanscout_version_t;

/**
 * Returns the lanscout library version.
 *
 * @param[out] version        Will be filled with the library version.
 * @return Upon success, returns ::LANSCOUT_SUCCESS. Otherwise, returns a ::lanscout_status error.
 */
LANSCOUTAPI lanscout_status lanscout_get_library_version(lanscout_version_t *version);

#ifdef __cplusplus
}
#endif

#endif /* _LANSCOUT_H_ */
