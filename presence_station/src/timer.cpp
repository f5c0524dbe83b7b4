#include "timer.hpp"
#include <cstdint>
#include <poll.h>
#include <stdexcept>
#include <sys/timerfd.h>
#include <unistd.h>

Timer::Timer():
m_fd(-1)
{
}

Timer::~Timer()
{
    if (m_fd >= 0)
        close(m_fd);
}

void Timer::start(unsigned int period_ms, bool periodic)
{
    if (m_fd < 0) {
        m_fd = timerfd_create(CLOCK_MONOTONIC, 0);
        if (m_fd < 0)
            throw std::runtime_error("Failed to create timer");
    }

    struct itimerspec val;
    val.it_value.tv_sec = period_ms / 1000;
    val.it_value.tv_nsec = (period_ms - val.it_value.tv_sec * 1000) * 1000 * 1000;
    if (periodic) {
        val.it_interval.tv_nsec = val.it_value.tv_nsec;
        val.it_interval.tv_sec = val.it_value.tv_sec;
    } else {
        val.it_interval.tv_nsec = 0;
        val.it_interval.tv_sec = 0;
    }

    if (timerfd_settime(m_fd, 0, &val, NULL) < 0)
        throw std::runtime_error("Failed to arm timer");
}

void Timer::stop()
{
    if (m_fd < 0)
        return;

    struct itimerspec val;
    val.it_interval.tv_nsec = 0;
    val.it_interval.tv_sec = 0;
    val.it_value.tv_nsec = 0;
    val.it_value.tv_sec = 0;
    timerfd_settime(m_fd, 0, &val, NULL);
}

bool Timer::expired(int timeout_ms)
{
    if (m_fd < 0)
        return false;

    struct pollfd fds[1];
    fds[0].fd = m_fd;
    fds[0].events = POLLIN;

    int ret = poll(fds, 1, timeout_ms);
    if (ret <= 0 || !(fds[0].revents & POLLIN))
        return false;

    /* Read expiration count to clear event */
    uint64_t count;
    if (read(m_fd, &count, sizeof(count)) != sizeof(count))
        return false;

    return count > 0;
}

int Timer::getFD() const
{
    return m_fd;
}
