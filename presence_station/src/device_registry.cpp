#include "device_registry.hpp"
#include "logger.hpp"
#include <algorithm>
#include <sstream>

void merge_device(Device &stored, const Device &update)
{
    if (!update.name.empty())
        stored.name = update.name;
    if (!update.vendor.empty())
        stored.vendor = update.vendor;
    if (!update.group.empty())
        stored.group = update.group;
    if (!update.ip.empty())
        stored.ip = update.ip;
    if (stored.first_seen == 0 && update.first_seen)
        stored.first_seen = update.first_seen;
    if (update.last_seen)
        stored.last_seen = update.last_seen;
    stored.is_online = update.is_online;
}

namespace {

Device new_device(const std::string &mac, const Device &update)
{
    Device d;
    d.mac = mac;
    merge_device(d, update);
    if (d.first_seen == 0)
        d.first_seen = d.last_seen;
    return d;
}

}

DeviceRegistry::DeviceRegistry():
m_mutex(),
m_devices(),
m_events(),
m_next_event_id(1)
{
}

bool DeviceRegistry::get(const std::string &mac, Device &device)
{
    std::string key;
    if (!normalize_mac(mac, key))
        return false;

    std::lock_guard<std::mutex> guard(m_mutex);

    auto it = m_devices.find(key);
    if (it == m_devices.end())
        return false;

    device = it->second;
    return true;
}

std::vector<Device> DeviceRegistry::listAll()
{
    std::vector<Device> devices;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        for (auto &e : m_devices)
            devices.push_back(e.second);
    }

    std::stable_sort(devices.begin(), devices.end(),
        [] (const Device &a, const Device &b) { return a.last_seen > b.last_seen; });

    return devices;
}

std::vector<Device> DeviceRegistry::listOnline()
{
    std::vector<Device> devices;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        for (auto &e : m_devices) {
            if (e.second.is_online)
                devices.push_back(e.second);
        }
    }

    std::sort(devices.begin(), devices.end(),
        [] (const Device &a, const Device &b) {
            if (a.name != b.name)
                return a.name < b.name;
            return a.mac < b.mac;
        });

    return devices;
}

bool DeviceRegistry::upsert(const Device &device)
{
    std::string key;
    if (!normalize_mac(device.mac, key)) {
        std::stringstream ss;
        ss << "Refusing to store device with invalid MAC address \"" << device.mac << '\"';
        Logger::warn(ss.str());
        return false;
    }

    return upsertAll(std::vector<Device>(1, device));
}

bool DeviceRegistry::upsertAll(const std::vector<Device> &updates)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    std::map<std::string, Device> devices = m_devices;
    for (auto &update : updates) {
        std::string key;
        if (!normalize_mac(update.mac, key)) {
            std::stringstream ss;
            ss << "Refusing to store device with invalid MAC address \"" << update.mac << '\"';
            Logger::warn(ss.str());
            continue;
        }

        auto it = devices.find(key);
        if (it == devices.end()) {
            devices[key] = new_device(key, update);
        } else {
            merge_device(it->second, update);
        }
    }

    if (!storeDevices(devices))
        return false;

    m_devices.swap(devices);
    return true;
}

bool DeviceRegistry::appendEvent(const std::string &mac, enum EventKind kind, time_t timestamp, uint64_t *id)
{
    PresenceEvent event;
    if (!normalize_mac(mac, event.mac))
        return false;
    event.kind = kind;
    event.timestamp = timestamp;

    std::lock_guard<std::mutex> guard(m_mutex);

    event.id = m_next_event_id;
    if (!storeEvent(event))
        return false;

    m_next_event_id++;
    m_events.push_back(event);
    if (id)
        *id = event.id;

    return true;
}

/*
 * The event is stored first: once it is written the transition is
 * committed. If storing the devices fails afterwards, the device
 * state can be rebuilt from the event log.
 */
bool DeviceRegistry::recordTransition(const Device &device, enum EventKind kind, time_t timestamp)
{
    PresenceEvent event;
    if (!normalize_mac(device.mac, event.mac)) {
        std::stringstream ss;
        ss << "Refusing to record transition of invalid MAC address \"" << device.mac << '\"';
        Logger::warn(ss.str());
        return false;
    }
    event.kind = kind;
    event.timestamp = timestamp;

    std::lock_guard<std::mutex> guard(m_mutex);

    event.id = m_next_event_id;
    if (!storeEvent(event))
        return false;

    m_next_event_id++;
    m_events.push_back(event);

    auto it = m_devices.find(event.mac);
    if (it == m_devices.end()) {
        m_devices[event.mac] = new_device(event.mac, device);
    } else {
        merge_device(it->second, device);
    }

    if (!storeDevices(m_devices)) {
        std::stringstream ss;
        ss << "Could not store devices after " << event_kind_to_str(kind)
           << " event of " << event.mac << ", state will be rebuilt from the event log";
        Logger::warn(ss.str());
    }

    return true;
}

std::vector<PresenceEvent> DeviceRegistry::listEvents(const std::string &mac, time_t since, unsigned int limit)
{
    std::string key;
    if (!mac.empty() && !normalize_mac(mac, key))
        return std::vector<PresenceEvent>();

    std::vector<PresenceEvent> events;
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        for (auto &e : m_events) {
            if (!key.empty() && e.mac != key)
                continue;
            if (since && e.timestamp < since)
                continue;
            events.push_back(e);
        }
    }

    std::sort(events.begin(), events.end(),
        [] (const PresenceEvent &a, const PresenceEvent &b) {
            if (a.timestamp != b.timestamp)
                return a.timestamp > b.timestamp;
            return a.id > b.id;
        });

    if (limit && events.size() > limit)
        events.resize(limit);

    return events;
}

unsigned int DeviceRegistry::countEvents(enum EventKind kind, time_t since)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    unsigned int count = 0;
    for (auto &e : m_events) {
        if (e.kind == kind && e.timestamp >= since)
            ++count;
    }

    return count;
}

bool DeviceRegistry::setName(const std::string &mac, const std::string &name)
{
    return editDevice(mac, &name, NULL);
}

bool DeviceRegistry::setGroup(const std::string &mac, const std::string &group)
{
    return editDevice(mac, NULL, &group);
}

bool DeviceRegistry::editDevice(const std::string &mac, const std::string *name, const std::string *group)
{
    std::string key;
    if (!normalize_mac(mac, key))
        return false;

    std::lock_guard<std::mutex> guard(m_mutex);

    auto it = m_devices.find(key);
    if (it == m_devices.end())
        return false;

    std::map<std::string, Device> devices = m_devices;
    Device &d = devices[key];
    if (name)
        d.name = *name;
    if (group)
        d.group = *group;

    if (!storeDevices(devices))
        return false;

    m_devices.swap(devices);
    return true;
}

bool DeviceRegistry::reset()
{
    std::lock_guard<std::mutex> guard(m_mutex);

    if (!storeReset())
        return false;

    m_devices.clear();
    m_events.clear();
    m_next_event_id = 1;

    Logger::info("Device registry reset");
    return true;
}

bool DeviceRegistry::storeEvent(const PresenceEvent &)
{
    return true;
}

bool DeviceRegistry::storeDevices(const std::map<std::string, Device> &)
{
    return true;
}

bool DeviceRegistry::storeReset()
{
    return true;
}

void DeviceRegistry::load(const std::map<std::string, Device> &devices, const std::vector<PresenceEvent> &events)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    m_devices = devices;
    m_events = events;
    m_next_event_id = 1;
    for (auto &e : m_events) {
        if (e.id >= m_next_event_id)
            m_next_event_id = e.id + 1;
    }
}
