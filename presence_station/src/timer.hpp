#ifndef TIMER_HPP
#define TIMER_HPP

class Timer {
public:
    Timer();
    virtual ~Timer();

    Timer(const Timer &t) = delete;
    Timer& operator=(const Timer &t) = delete;

    void start(unsigned int period_ms, bool periodic = false);
    void stop();

    /**
     * @brief Check whether the timer fired
     *
     * Waits at most timeout_ms for the timer to expire and
     * clears the pending expiration count.
     *
     * @param timeout_ms 0 to return immediately
     * @return true if the timer expired at least once since last call
     */
    bool expired(int timeout_ms = 0);

    int getFD() const;

private:
    int m_fd;
};

#endif
