#include "logger.hpp"
#include "presence_station.hpp"
#include <sstream>

#define STOP_CHECK_PERIOD   (100)   /* in ms */

std::string format_change(const PresenceChange &change, time_t now)
{
    std::stringstream ss;
    ss << format_timestamp(now, "%T") << ' ';
    switch (change.kind) {
    case CHANGE_NEW: ss << "NEW"; break;
    case CHANGE_ARRIVED: ss << '+'; break;
    case CHANGE_LEFT: ss << '-'; break;
    }
    ss << ' ' << device_display_name(change.device);
    return ss.str();
}

PresenceStation::PresenceStation(PresenceEngine &engine, NotificationPolicy *policy, unsigned int interval_s):
m_engine(engine),
m_policy(policy),
m_interval(interval_s),
m_observers(),
m_scan_timer(),
m_stop(false)
{
}

void PresenceStation::addObserver(const ChangeObserver &observer)
{
    m_observers.push_back(observer);
}

bool PresenceStation::runOnce(bool notify)
{
    std::vector<PresenceChange> changes;
    if (!m_engine.runCycle(changes))
        return false;

    for (auto &change : changes) {
        std::stringstream ss;
        ss << "Device " << change.device.mac << ' ' << change_kind_to_str(change.kind);
        Logger::info(ss.str());

        for (auto &observer : m_observers)
            observer(change);

        if (notify && m_policy)
            m_policy->handle(change);
    }

    return true;
}

void PresenceStation::run(bool notify)
{
    {
        std::stringstream ss;
        ss << "Starting presence detection, scanning every " << m_interval << "s";
        Logger::info(ss.str());
    }

    /* Initial discovery */
    runOnce(false);
    {
        EngineState state = m_engine.getState();
        std::stringstream ss;
        ss << state.online_count << " devices online, " << state.known_count << " known";
        Logger::info(ss.str());
    }

    m_scan_timer.start(m_interval * 1000, true);
    while (!m_stop) {
        if (!m_scan_timer.expired(STOP_CHECK_PERIOD))
            continue;

        runOnce(notify);
    }
    m_scan_timer.stop();

    Logger::info("Presence detection stopped");
}

void PresenceStation::requestStop()
{
    m_stop = true;
}
