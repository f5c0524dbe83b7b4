#ifndef PRESENCE_ENGINE_HPP
#define PRESENCE_ENGINE_HPP

#include "device.hpp"
#include "device_registry.hpp"
#include "snapshot_source.hpp"
#include <mutex>
#include <string>
#include <time.h>
#include <vector>

/* Statistics of the engine, rebuilt after each cycle */
struct EngineState {
    unsigned long scans = 0;
    unsigned long failed_scans = 0;
    unsigned int online_count = 0;
    unsigned int known_count = 0;
    time_t last_scan = 0;
};

/*
 * Turns successive scan snapshots into device transitions.
 *
 *            seen                 absent for device_ttl
 *   OFFLINE ------> ONLINE ---------------------------> OFFLINE
 *
 * A device absent from a snapshot stays online until device_ttl
 * seconds elapsed since it was last seen. Each transition is written
 * to the registry, with its event, before it is reported.
 */
class PresenceEngine {
public:
    PresenceEngine(DeviceRegistry &registry, SnapshotSource &source, unsigned int device_ttl);
    ~PresenceEngine() = default;

    PresenceEngine(const PresenceEngine &e) = delete;
    PresenceEngine& operator=(const PresenceEngine &e) = delete;

    /**
     * @brief Reconcile a snapshot against the registry
     *
     * The scan time of the snapshot is used as the current time.
     *
     * @return changes, new devices first, then arrivals, then
     * departures, each sorted by MAC address
     */
    std::vector<PresenceChange> reconcile(const ScanResult &snapshot);

    /**
     * @brief Scan the network and reconcile the result
     *
     * @param[out] changes
     * @return false if the scan failed, in which case the registry
     * is not modified
     */
    bool runCycle(std::vector<PresenceChange> &changes);

    EngineState getState();

    /* Online devices, named ones first */
    std::vector<Device> whoIsHome();

    /* "Nobody's home" or "Home: Alice, Bob\n+ 2 other device(s)" */
    std::string summary();

private:
    std::vector<PresenceChange> doReconcile(const ScanResult &snapshot);

    DeviceRegistry &m_registry;
    SnapshotSource &m_source;
    unsigned int m_device_ttl;      /* in seconds */

    std::mutex m_cycle_mutex;       /* one cycle at a time */
    std::mutex m_state_mutex;
    EngineState m_state;
};

#endif
