#include "logger.hpp"
#include "presence_engine.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace {

bool by_mac(const PresenceChange &a, const PresenceChange &b)
{
    return a.device.mac < b.device.mac;
}

}

PresenceEngine::PresenceEngine(DeviceRegistry &registry, SnapshotSource &source, unsigned int device_ttl):
m_registry(registry),
m_source(source),
m_device_ttl(device_ttl),
m_cycle_mutex(),
m_state_mutex(),
m_state()
{
}

std::vector<PresenceChange> PresenceEngine::reconcile(const ScanResult &snapshot)
{
    std::lock_guard<std::mutex> guard(m_cycle_mutex);
    return doReconcile(snapshot);
}

bool PresenceEngine::runCycle(std::vector<PresenceChange> &changes)
{
    std::lock_guard<std::mutex> guard(m_cycle_mutex);

    ScanResult snapshot;
    if (!m_source.scan(snapshot)) {
        Logger::warn("Scan failed, skipping cycle");
        std::lock_guard<std::mutex> state_guard(m_state_mutex);
        m_state.failed_scans++;
        return false;
    }

    changes = doReconcile(snapshot);
    return true;
}

std::vector<PresenceChange> PresenceEngine::doReconcile(const ScanResult &snapshot)
{
    time_t now = snapshot.scan_time;

    /* Merge duplicate MAC addresses */
    std::map<std::string, ScannedDevice> seen;
    for (auto &d : snapshot.devices) {
        std::string mac;
        if (!normalize_mac(d.mac, mac)) {
            std::stringstream ss;
            ss << "Ignoring scanned device with invalid MAC address \"" << d.mac << '\"';
            Logger::warn(ss.str());
            continue;
        }

        ScannedDevice &merged = seen[mac];
        merged.mac = mac;
        if (!d.ip.empty())
            merged.ip = d.ip;
        if (!d.vendor.empty())
            merged.vendor = d.vendor;
    }

    std::vector<PresenceChange> new_devices;
    std::vector<PresenceChange> arrivals;
    std::vector<PresenceChange> departures;
    std::vector<Device> refreshes;

    for (auto &e : seen) {
        const ScannedDevice &s = e.second;

        /* name and group are left empty so that user edits are kept */
        Device update;
        update.mac = s.mac;
        update.ip = s.ip;
        update.vendor = s.vendor;
        update.last_seen = now;
        update.is_online = true;

        Device stored;
        bool known = m_registry.get(s.mac, stored);
        if (known && stored.is_online) {
            refreshes.push_back(update);
            continue;
        }

        if (!known)
            update.first_seen = now;

        if (!m_registry.recordTransition(update, EVENT_ARRIVED, now)) {
            std::stringstream ss;
            ss << "Failed to record arrival of " << s.mac << ", will retry on next scan";
            Logger::err(ss.str());
            continue;
        }

        PresenceChange change;
        if (!m_registry.get(s.mac, change.device))
            change.device = update;
        change.kind = known ? CHANGE_ARRIVED : CHANGE_NEW;
        if (known)
            arrivals.push_back(change);
        else
            new_devices.push_back(change);
    }

    /* Devices already online, stored at once */
    if (!refreshes.empty() && !m_registry.upsertAll(refreshes)) {
        std::stringstream ss;
        ss << "Failed to refresh " << refreshes.size() << " online devices";
        Logger::err(ss.str());
    }

    for (auto &d : m_registry.listOnline()) {
        if (seen.find(d.mac) != seen.end())
            continue;

        if (now - d.last_seen < static_cast<time_t>(m_device_ttl))
            continue;

        Device update;
        update.mac = d.mac;
        update.is_online = false;
        if (!m_registry.recordTransition(update, EVENT_LEFT, now)) {
            std::stringstream ss;
            ss << "Failed to record departure of " << d.mac << ", will retry on next scan";
            Logger::err(ss.str());
            continue;
        }

        PresenceChange change;
        change.device = d;
        change.device.is_online = false;
        change.kind = CHANGE_LEFT;
        departures.push_back(change);
    }

    std::sort(new_devices.begin(), new_devices.end(), by_mac);
    std::sort(arrivals.begin(), arrivals.end(), by_mac);
    std::sort(departures.begin(), departures.end(), by_mac);

    std::vector<PresenceChange> changes;
    changes.insert(changes.end(), new_devices.begin(), new_devices.end());
    changes.insert(changes.end(), arrivals.begin(), arrivals.end());
    changes.insert(changes.end(), departures.begin(), departures.end());

    unsigned int online_count = m_registry.listOnline().size();
    unsigned int known_count = m_registry.listAll().size();
    {
        std::lock_guard<std::mutex> guard(m_state_mutex);
        m_state.scans++;
        m_state.last_scan = now;
        m_state.online_count = online_count;
        m_state.known_count = known_count;
    }

    return changes;
}

EngineState PresenceEngine::getState()
{
    std::lock_guard<std::mutex> guard(m_state_mutex);
    return m_state;
}

std::vector<Device> PresenceEngine::whoIsHome()
{
    std::vector<Device> devices = m_registry.listOnline();
    std::stable_partition(devices.begin(), devices.end(),
        [] (const Device &d) { return !d.name.empty(); });
    return devices;
}

std::string PresenceEngine::summary()
{
    std::vector<Device> devices = whoIsHome();
    if (devices.empty())
        return "Nobody's home";

    std::stringstream ss;
    unsigned int unnamed = 0;
    bool first = true;
    for (auto &d : devices) {
        if (d.name.empty()) {
            ++unnamed;
            continue;
        }

        ss << (first ? "Home: " : ", ") << d.name;
        first = false;
    }

    if (unnamed) {
        if (!first)
            ss << '\n';
        ss << "+ " << unnamed << " other device(s)";
    }

    return ss.str();
}
