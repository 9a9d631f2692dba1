/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file socket.hpp
 * @brief RAII wrapper over a POSIX socket fd
 **/

#ifndef __OS_SOCKET_H__
#define __OS_SOCKET_H__

#include "lanscout/platform.h"
#include "lanscout/lanscout.h"
#include "lanscout/expected.hpp"
#include "common/utils.hpp"
#include "lanscout/event.hpp"

#include <chrono>
#include <string>

namespace lanscout
{

// Dotted quad plus the terminating null
#define IPV4_STRING_MAX_LENGTH (16)

#define CHECK_VALID_SOCKET_AS_EXPECTED(sock) CHECK((sock) != INVALID_SOCKET, make_unexpected(LANSCOUT_ETH_FAILURE), "Invalid socket")

class Socket final {
public:
    static Expected<Socket> create(int af, int type, int protocol);
    ~Socket();
    Socket(const Socket &other) = delete;
    Socket &operator=(const Socket &other) = delete;
    Socket &operator=(Socket &&other) = delete;
    Socket(Socket &&other) noexcept :
        m_socket_fd(std::exchange(other.m_socket_fd, INVALID_SOCKET))
    {};

    socket_t get_fd() const { return m_socket_fd; }

    static lanscout_status ntop(int af, const void *src, char *dst, socklen_t size);
    static lanscout_status pton(int af, const char *src, void *dst);

    // Non-blocking connect bounded by timeout. Waits on the socket and on shutdown_event (may be null):
    // * LANSCOUT_SUCCESS - connection established
    // * LANSCOUT_CONNECTION_REFUSED - the peer answered with a reset
    // * LANSCOUT_TIMEOUT - no answer before the deadline
    // * LANSCOUT_SHUTDOWN_EVENT_SIGNALED - shutdown_event was signaled while waiting
    // * LANSCOUT_ETH_FAILURE - any other socket error
    lanscout_status connect_with_timeout(const sockaddr *addr, socklen_t len, std::chrono::milliseconds timeout,
        EventPtr shutdown_event);

    lanscout_status set_nonblocking(bool nonblocking);
    lanscout_status close_socket_fd();

private:
    explicit Socket(const socket_t socket_fd);
    static Expected<socket_t> create_socket_fd(int af, int type, int protocol);

    lanscout_status poll_with_shutdown(short events, std::chrono::milliseconds timeout, EventPtr shutdown_event);

    socket_t m_socket_fd;
};

} /* namespace lanscout */

#endif /* __OS_SOCKET_H__ */
