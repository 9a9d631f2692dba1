/**
 * Copyright (c) 2025 lanscout contributors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file event.cpp
 * @brief Event wrapper for linux using eventfd
 **/

#include "lanscout/event.hpp"
#include "common/utils.hpp"

#include <sys/eventfd.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <climits>
#include <utility>


namespace lanscout
{

Event::Event(underlying_handle_t handle) :
    m_handle(handle)
{}

Event::~Event()
{
    if (-1 != m_handle) {
        (void) close(m_handle);
    }
}

Event::Event(Event &&other) :
    m_handle(std::exchange(other.m_handle, -1))
{}

Expected<Event> Event::create(const State &initial_state)
{
    const auto handle = open_event_handle(initial_state);
    CHECK_AS_EXPECTED(-1 != handle, LANSCOUT_INTERNAL_FAILURE, "Failed creating event");
    return Event(handle);
}

Expected<EventPtr> Event::create_shared(const State &initial_state)
{
    const auto handle = open_event_handle(initial_state);
    CHECK_AS_EXPECTED(-1 != handle, LANSCOUT_INTERNAL_FAILURE, "Failed creating event");

    auto res = make_shared_nothrow<Event>(handle);
    if (nullptr == res) {
        (void) close(handle);
        return make_unexpected(LANSCOUT_OUT_OF_HOST_MEMORY);
    }

    return res;
}

lanscout_status Event::wait(std::chrono::milliseconds timeout)
{
    auto status = eventfd_poll(m_handle, timeout);
    if (LANSCOUT_TIMEOUT == status) {
        LOGGER__TRACE("eventfd_poll failed with timeout (timeout={}ms)", timeout.count());
        return status;
    }
    CHECK_SUCCESS(status);

    return LANSCOUT_SUCCESS;
}

lanscout_status Event::signal()
{
    return eventfd_write(m_handle);
}

bool Event::is_signalled()
{
    return (LANSCOUT_SUCCESS == eventfd_poll(m_handle, std::chrono::milliseconds(0)));
}

underlying_handle_t Event::open_event_handle(const State &initial_state)
{
    const int state = initial_state == State::signalled ? 1 : 0;
    const auto handle = eventfd(state, EFD_CLOEXEC);
    if (-1 == handle) {
        LOGGER__ERROR("Call to eventfd failed with errno={}", errno);
    }
    return handle;
}

lanscout_status Event::eventfd_poll(underlying_handle_t fd, std::chrono::milliseconds timeout)
{
    struct pollfd pfd{};
    int poll_ret = -1;

    CHECK(-1 != fd, LANSCOUT_INVALID_OPERATION, "Event was moved from");

    if (INT_MAX < timeout.count()) {
        timeout = std::chrono::milliseconds(INT_MAX);
    }

    pfd.fd = fd;
    pfd.events = POLLIN;
    do {
        poll_ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while ((0 > poll_ret) && (EINTR == errno));

    if (0 == poll_ret) {
        return LANSCOUT_TIMEOUT;
    }
    CHECK(0 < poll_ret, LANSCOUT_INTERNAL_FAILURE, "poll failed with errno={}", errno);
    CHECK(0 != (pfd.revents & POLLIN), LANSCOUT_INTERNAL_FAILURE, "pfd not in read state. revents={}", pfd.revents);

    return LANSCOUT_SUCCESS;
}

lanscout_status Event::eventfd_write(underlying_handle_t fd)
{
    uint64_t buffer = 1;

    const auto write_ret = write(fd, &buffer, sizeof(buffer));
    CHECK(static_cast<ssize_t>(sizeof(buffer)) == write_ret, LANSCOUT_INTERNAL_FAILURE, "write failed. bytes_written={}, expected={}, errno={}",
        write_ret, sizeof(buffer), errno);

    return LANSCOUT_SUCCESS;
}

} /* namespace lanscout */
