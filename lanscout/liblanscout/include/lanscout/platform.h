/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file platform.h
 * @brief Platform dependent includes and definitions
 **/

#ifndef _LANSCOUT_PLATFORM_H_
#define _LANSCOUT_PLATFORM_H_

#if !defined(__GNUC__)
#error "Only POSIX toolchains are supported"
#endif


/** Exported symbols define */
#define LANSCOUTAPI __attribute__ ((visibility ("default")))


/** Includes */
#include <unistd.h>
#include <sys/time.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>


/** Typedefs */

// underlying_handle_t
#ifndef underlying_handle_t
typedef int underlying_handle_t;
#endif

// socket_t
#ifndef socket_t
typedef int socket_t;
#endif


/** Defines and Macros */

#if !defined(INVALID_SOCKET)
#define INVALID_SOCKET (socket_t)(-1)
#endif

#if !defined(SOCKET_ERROR)
#define SOCKET_ERROR (int)(-1)
#endif


#endif /* _LANSCOUT_PLATFORM_H_ */
