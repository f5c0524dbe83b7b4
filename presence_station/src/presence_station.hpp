#ifndef PRESENCE_STATION_HPP
#define PRESENCE_STATION_HPP

#include "notification_policy.hpp"
#include "presence_engine.hpp"
#include "timer.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

typedef std::function<void(const PresenceChange&)> ChangeObserver;

/* "14:02:11 NEW Apple (33:44:55)" with + for arrivals and - for departures */
std::string format_change(const PresenceChange &change, time_t now);

/*
 * Periodically runs a reconciliation cycle and forwards the changes
 * to the observers and to the notification policy.
 */
class PresenceStation {
public:
    /**
     * @param engine
     * @param policy may be NULL, nothing is then notified
     * @param interval_s time between two scans
     */
    PresenceStation(PresenceEngine &engine, NotificationPolicy *policy, unsigned int interval_s);
    ~PresenceStation() = default;

    void addObserver(const ChangeObserver &observer);

    /**
     * @brief Run one cycle
     *
     * @param notify false to only report changes to observers
     * @return false if the scan failed
     */
    bool runOnce(bool notify);

    /**
     * @brief Scan until stop is requested
     *
     * The first scan discovers the devices already present and
     * notifies nothing.
     *
     * @param notify false to never notify
     */
    void run(bool notify);

    /* Safe to call from a signal handler */
    void requestStop();

private:
    PresenceEngine &m_engine;
    NotificationPolicy *m_policy;
    unsigned int m_interval;
    std::vector<ChangeObserver> m_observers;
    Timer m_scan_timer;
    std::atomic<bool> m_stop;
};

#endif
