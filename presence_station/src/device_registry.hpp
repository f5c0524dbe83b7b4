#ifndef DEVICE_REGISTRY_HPP
#define DEVICE_REGISTRY_HPP

#include "device.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const std::string &what):
    std::runtime_error(what)
    {
    }
};

/**
 * @brief Merge a partial device record into a stored one
 *
 * Empty name, vendor and group keep the stored values, as does
 * an empty ip. first_seen is only set if the stored record has
 * none and the update carries one. A non-zero last_seen and
 * is_online are always overwritten.
 *
 * A device created from an update without first_seen is first
 * seen at its last_seen.
 */
void merge_device(Device &stored, const Device &update);

/*
 * Registry of known devices and log of presence events.
 *
 * Every operation is atomic with respect to the others: a reader
 * never sees a device half updated. The lock is only held for
 * the duration of one operation.
 *
 * This class keeps everything in memory. Subclasses make it
 * durable by overriding the store hooks, which are called with
 * the lock held.
 */
class DeviceRegistry {
public:
    DeviceRegistry();
    virtual ~DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry &r) = delete;
    DeviceRegistry& operator=(const DeviceRegistry &r) = delete;

    bool get(const std::string &mac, Device &device);

    /* Most recently seen first */
    std::vector<Device> listAll();

    /* Sorted by name then MAC */
    std::vector<Device> listOnline();

    /**
     * @brief Insert or update a device
     *
     * See merge_device for the update rules.
     *
     * @return false if the change could not be stored, in which
     * case the registry is left unchanged
     */
    bool upsert(const Device &device);

    /**
     * @brief Upsert several devices with a single store
     *
     * Devices with an invalid MAC address are skipped. Either all
     * the others are applied or none of them.
     */
    bool upsertAll(const std::vector<Device> &devices);

    /**
     * @brief Append an event to the log
     *
     * @param[out] id of the new event, may be NULL
     */
    bool appendEvent(const std::string &mac, enum EventKind kind, time_t timestamp, uint64_t *id = NULL);

    /**
     * @brief Upsert a device and log the matching event as one unit
     *
     * Either both changes are applied or none of them.
     */
    bool recordTransition(const Device &device, enum EventKind kind, time_t timestamp);

    /**
     * @brief List events, newest first
     *
     * @param mac only events of this device, all devices if empty
     * @param since only events at or after since, 0 for no bound
     * @param limit maximum number of events, 0 for no limit
     */
    std::vector<PresenceEvent> listEvents(const std::string &mac, time_t since, unsigned int limit);

    unsigned int countEvents(enum EventKind kind, time_t since);

    /* User edits. Return false if the device is unknown. */
    bool setName(const std::string &mac, const std::string &name);
    bool setGroup(const std::string &mac, const std::string &group);

    /* Forget all devices and events */
    bool reset();

protected:
    virtual bool storeEvent(const PresenceEvent &event);
    virtual bool storeDevices(const std::map<std::string, Device> &devices);
    virtual bool storeReset();

    /* Replace content, used when loading persisted state */
    void load(const std::map<std::string, Device> &devices, const std::vector<PresenceEvent> &events);

    std::mutex m_mutex;

private:
    bool editDevice(const std::string &mac, const std::string *name, const std::string *group);

    std::map<std::string, Device> m_devices;    /* MAC -> device */
    std::vector<PresenceEvent> m_events;        /* in commit order */
    uint64_t m_next_event_id;
};

#endif
