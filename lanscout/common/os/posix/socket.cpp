/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file socket.cpp
 * @brief Socket wrapper for Unix
 **/

#include "common/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <climits>
#include <array>

namespace lanscout
{

Expected<Socket> Socket::create(int af, int type, int protocol)
{
    TRY(const auto socket_fd, create_socket_fd(af, type, protocol));

    auto obj = Socket(socket_fd);
    return obj;
}

Socket::Socket(const socket_t socket_fd) :
    m_socket_fd(socket_fd)
{
}

Socket::~Socket()
{
    auto status = close_socket_fd();
    if (LANSCOUT_SUCCESS != status) {
        LOGGER__ERROR("Failed to free socket fd with status {}", status);
    }
}

Expected<socket_t> Socket::create_socket_fd(int af, int type, int protocol)
{
    socket_t local_socket = INVALID_SOCKET;

    local_socket = socket(af, type | SOCK_CLOEXEC, protocol);
    CHECK_VALID_SOCKET_AS_EXPECTED(local_socket);

    return local_socket;
}

lanscout_status Socket::close_socket_fd()
{
    if (INVALID_SOCKET != m_socket_fd) {
        int socket_rc = close(m_socket_fd);
        m_socket_fd = INVALID_SOCKET;
        CHECK(0 == socket_rc, LANSCOUT_CLOSE_FAILURE, "Failed to close socket. errno={}", errno);
    }

    return LANSCOUT_SUCCESS;
}

lanscout_status Socket::poll_with_shutdown(short events, std::chrono::milliseconds timeout, EventPtr shutdown_event)
{
    static const size_t SOCKET_INDEX = 0;
    static const size_t SHUTDOWN_INDEX = 1;

    std::array<pollfd, 2> fds{};
    fds[SOCKET_INDEX] = pollfd{m_socket_fd, events, 0};
    nfds_t fds_count = 1;
    if (nullptr != shutdown_event) {
        fds[SHUTDOWN_INDEX] = pollfd{shutdown_event->get_underlying_handle(), POLLIN, 0};
        fds_count = 2;
    }

    const auto poll_timeout = static_cast<int>(std::min<int64_t>(timeout.count(), INT_MAX));
    int poll_ret = -1;
    do {
        poll_ret = poll(fds.data(), fds_count, poll_timeout);
    } while ((0 > poll_ret) && (EINTR == errno));

    if (0 == poll_ret) {
        return LANSCOUT_TIMEOUT;
    }
    CHECK(0 < poll_ret, LANSCOUT_ETH_FAILURE, "poll failed with errno={}", errno);

    // Shutdown wins when both are ready
    if ((fds_count > SHUTDOWN_INDEX) && (fds[SHUTDOWN_INDEX].revents & POLLIN)) {
        return LANSCOUT_SHUTDOWN_EVENT_SIGNALED;
    }

    return LANSCOUT_SUCCESS;
}

lanscout_status Socket::connect_with_timeout(const sockaddr *addr, socklen_t len, std::chrono::milliseconds timeout,
    EventPtr shutdown_event)
{
    CHECK_ARG_NOT_NULL(addr);

    auto status = set_nonblocking(true);
    CHECK_SUCCESS(status);

    int ret = ::connect(m_socket_fd, addr, len);
    if (0 == ret) {
        return LANSCOUT_SUCCESS;
    }
    if (ECONNREFUSED == errno) {
        return LANSCOUT_CONNECTION_REFUSED;
    }
    if (EINPROGRESS != errno) {
        LOGGER__DEBUG("connect failed with errno={}", errno);
        return LANSCOUT_ETH_FAILURE;
    }

    status = poll_with_shutdown(POLLOUT, timeout, shutdown_event);
    if (LANSCOUT_SUCCESS != status) {
        return status;
    }

    int socket_error = 0;
    socklen_t socket_error_len = sizeof(socket_error);
    ret = getsockopt(m_socket_fd, SOL_SOCKET, SO_ERROR, &socket_error, &socket_error_len);
    CHECK(0 == ret, LANSCOUT_ETH_FAILURE, "getsockopt(SO_ERROR) failed with errno={}", errno);

    switch (socket_error) {
    case 0:
        return LANSCOUT_SUCCESS;
    case ECONNREFUSED:
        return LANSCOUT_CONNECTION_REFUSED;
    default:
        LOGGER__TRACE("connect completed with error {}", socket_error);
        return LANSCOUT_ETH_FAILURE;
    }
}

lanscout_status Socket::set_nonblocking(bool nonblocking)
{
    int flags = fcntl(m_socket_fd, F_GETFL, 0);
    CHECK(-1 != flags, LANSCOUT_ETH_FAILURE, "fcntl(F_GETFL) failed with errno={}", errno);

    flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    CHECK(-1 != fcntl(m_socket_fd, F_SETFL, flags), LANSCOUT_ETH_FAILURE, "fcntl(F_SETFL) failed with errno={}", errno);

    return LANSCOUT_SUCCESS;
}

lanscout_status Socket::ntop(int af, const void *src, char *dst, socklen_t size)
{
    CHECK_ARG_NOT_NULL(src);
    CHECK_ARG_NOT_NULL(dst);

    CHECK(nullptr != inet_ntop(af, src, dst, size), LANSCOUT_ETH_FAILURE,
        "Could not convert sockaddr struct to string ip address");

    return LANSCOUT_SUCCESS;
}

lanscout_status Socket::pton(int af, const char *src, void *dst)
{
    int inet_rc = 0;

    CHECK_ARG_NOT_NULL(src);
    CHECK_ARG_NOT_NULL(dst);

    inet_rc = inet_pton(af, src, dst);
    CHECK(0 != inet_rc, LANSCOUT_INVALID_ARGUMENT,
        "Failed to run 'inet_pton'. {} is not a valid network address in the specified address family", src);
    CHECK(1 == inet_rc, LANSCOUT_ETH_FAILURE, "Failed to run 'inet_pton', errno = {}.", errno);

    return LANSCOUT_SUCCESS;
}

} /* namespace lanscout */
