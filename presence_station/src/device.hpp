#ifndef DEVICE_HPP
#define DEVICE_HPP

#include <array>
#include <cstdint>
#include <string>
#include <time.h>

typedef std::array<uint8_t, 6> MacAddress;

/*
 * Network device identified by its MAC address.
 *
 * Empty strings and zero timestamps mean "not set".
 * name, group and first_seen are sticky: only user edits
 * change them once set. ip, last_seen and is_online are
 * owned by the scans.
 *
 * is_online stays true for device_ttl seconds after the
 * last sighting, so it does not mean the device answered
 * the most recent scan.
 */
struct Device {
    std::string mac;
    std::string name;
    std::string vendor;
    std::string ip;
    time_t first_seen = 0;
    time_t last_seen = 0;
    bool is_online = false;
    std::string group;
};

enum EventKind {
    EVENT_ARRIVED,
    EVENT_LEFT,
};

struct PresenceEvent {
    uint64_t id = 0;
    std::string mac;
    enum EventKind kind = EVENT_ARRIVED;
    time_t timestamp = 0;
};

enum ChangeKind {
    CHANGE_NEW,
    CHANGE_ARRIVED,
    CHANGE_LEFT,
};

/* Output of one reconciliation cycle, never persisted */
struct PresenceChange {
    Device device;
    enum ChangeKind kind;
};

/**
 * @brief Parse a MAC address
 *
 * Accepts ':', '-' or '.' separated forms as well as 12 hex
 * digits without separator, in any case.
 *
 * @param[in] str
 * @param[out] mac
 * @return true if str is a valid MAC address
 */
bool parse_mac(const std::string &str, MacAddress &mac);

/* AA:BB:CC:DD:EE:FF */
std::string mac_to_string(const MacAddress &mac);

/**
 * @brief Convert a MAC address to its canonical form
 *
 * @param[in] str
 * @param[out] canonical upper case, colon separated
 * @return false if str is not a MAC address
 */
bool normalize_mac(const std::string &str, std::string &canonical);

std::string device_display_name(const Device &d);

const char *event_kind_to_str(enum EventKind kind);
bool parse_event_kind(const std::string &str, enum EventKind &kind);

const char *change_kind_to_str(enum ChangeKind kind);

/* Format using local time, "-" for unset timestamps */
std::string format_timestamp(time_t ts, const char *fmt = "%F %T");

/* Midnight of the current local day */
time_t start_of_day(time_t now);

#endif
