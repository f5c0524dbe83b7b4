#include "device.hpp"
#include <cctype>
#include <cstdio>
#include <sstream>

namespace {

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}

bool parse_mac(const std::string &str, MacAddress &mac)
{
    std::string digits;
    char separator = '\0';

    for (unsigned int i = 0; i < str.length(); ++i) {
        char c = str[i];
        if (c == ':' || c == '-' || c == '.') {
            /* Do not accept mixed separators */
            if (separator != '\0' && separator != c)
                return false;
            separator = c;
            continue;
        }
        if (hex_value(c) < 0)
            return false;
        digits += c;
    }

    if (digits.length() != 12)
        return false;

    for (unsigned int i = 0; i < 6; ++i)
        mac[i] = (hex_value(digits[2 * i]) << 4) | hex_value(digits[2 * i + 1]);

    return true;
}

std::string mac_to_string(const MacAddress &mac)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
             mac[0],
             mac[1],
             mac[2],
             mac[3],
             mac[4],
             mac[5]);
    return std::string(buf);
}

bool normalize_mac(const std::string &str, std::string &canonical)
{
    MacAddress mac;
    if (!parse_mac(str, mac))
        return false;

    canonical = mac_to_string(mac);
    return true;
}

std::string device_display_name(const Device &d)
{
    if (!d.name.empty())
        return d.name;

    if (!d.vendor.empty()) {
        std::stringstream ss;
        ss << d.vendor << " (";
        if (d.mac.length() > 8)
            ss << d.mac.substr(d.mac.length() - 8);
        else
            ss << d.mac;
        ss << ')';
        return ss.str();
    }

    return d.mac;
}

const char *event_kind_to_str(enum EventKind kind)
{
    switch (kind) {
    case EVENT_ARRIVED: return "arrived";
    case EVENT_LEFT: return "left";
    }

    return "unknown";
}

bool parse_event_kind(const std::string &str, enum EventKind &kind)
{
    if (str == "arrived")
        kind = EVENT_ARRIVED;
    else if (str == "left")
        kind = EVENT_LEFT;
    else
        return false;

    return true;
}

const char *change_kind_to_str(enum ChangeKind kind)
{
    switch (kind) {
    case CHANGE_NEW: return "new";
    case CHANGE_ARRIVED: return "arrived";
    case CHANGE_LEFT: return "left";
    }

    return "unknown";
}

std::string format_timestamp(time_t ts, const char *fmt)
{
    if (ts == 0)
        return "-";

    struct tm tm_ts;
    localtime_r(&ts, &tm_ts);

    char buf[128];
    if (strftime(buf, sizeof(buf), fmt, &tm_ts) == 0)
        return "-";

    return std::string(buf);
}

time_t start_of_day(time_t now)
{
    struct tm tm_now;
    localtime_r(&now, &tm_now);
    tm_now.tm_hour = 0;
    tm_now.tm_min = 0;
    tm_now.tm_sec = 0;
    tm_now.tm_isdst = -1;
    return mktime(&tm_now);
}
