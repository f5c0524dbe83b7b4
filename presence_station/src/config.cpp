#include "arp_scanner.hpp"
#include "config.hpp"
#include "device.hpp"
#include "file_registry.hpp"
#include "version.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#define PANIC_MESSAGE_PREFIX    "panic_message_"

namespace {

std::string trim(const std::string &str)
{
    std::string s = str;
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
        [] (unsigned char c){ return !std::isspace(c); }));
    s.erase(std::find_if(s.rbegin(), s.rend(),
        [] (unsigned char c){ return !std::isspace(c); }).base(), s.end());
    return s;
}

std::string home_dir()
{
    const char *home = getenv("HOME");
    if (home == NULL || home[0] == '\0')
        return ".";
    return std::string(home);
}

bool parse_bool(const std::string &key, const std::string &val)
{
    std::string v = val;
    for (auto &c : v) c = tolower(c);

    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;

    std::stringstream ss;
    ss << "Invalid boolean \"" << val << "\" for key " << key;
    throw ConfigError(ss.str());
}

long parse_number(const std::string &key, const std::string &val)
{
    char *end = NULL;
    errno = 0;
    long n = strtol(val.c_str(), &end, 10);
    if (val.empty() || end == NULL || *end != '\0' || errno == ERANGE) {
        std::stringstream ss;
        ss << "Invalid number \"" << val << "\" for key " << key;
        throw ConfigError(ss.str());
    }

    return n;
}

unsigned int parse_positive(const std::string &key, const std::string &val)
{
    long n = parse_number(key, val);
    if (n <= 0) {
        std::stringstream ss;
        ss << "Value of " << key << " must be positive, got " << n;
        throw ConfigError(ss.str());
    }
    if (static_cast<unsigned long>(n) > UINT_MAX) {
        std::stringstream ss;
        ss << "Value of " << key << " is too large, got " << n;
        throw ConfigError(ss.str());
    }

    return n;
}

int parse_hour(const std::string &key, const std::string &val)
{
    long n = parse_number(key, val);
    if (n < 0 || n > 23) {
        std::stringstream ss;
        ss << "Value of " << key << " must be an hour between 0 and 23, got " << n;
        throw ConfigError(ss.str());
    }

    return n;
}

}

std::string default_config_path()
{
    return home_dir() + "/.config/presence_station/presence_station.conf";
}

std::string default_state_dir()
{
    return home_dir() + "/.local/share/presence_station";
}

Config default_config()
{
    Config cfg;
    cfg.state_dir = default_state_dir();
    return cfg;
}

Config load_config(const std::string &path)
{
    Config cfg = default_config();

    std::ifstream file(path);
    if (!file) {
        std::stringstream ss;
        ss << "No configuration file " << path << ", using defaults";
        Logger::info(ss.str());
        return cfg;
    }

    parse_config(file, cfg);
    validate_config(cfg);

    std::stringstream ss;
    ss << "Loaded configuration from " << path;
    Logger::debug(ss.str());

    return cfg;
}

void parse_config(std::istream &in, Config &cfg)
{
    std::string line;
    unsigned int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;

        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t ret = line.find('=');
        if (ret == std::string::npos) {
            std::stringstream ss;
            ss << "Ignoring line " << line_no << " without '='";
            Logger::warn(ss.str());
            continue;
        }

        std::string key = trim(line.substr(0, ret));
        std::string val = trim(line.substr(ret + 1));

        if (key == "network") {
            cfg.network = val;
        } else if (key == "interval") {
            cfg.interval = parse_positive(key, val);
        } else if (key == "device_ttl") {
            cfg.device_ttl = parse_positive(key, val);
        } else if (key == "state_dir") {
            cfg.state_dir = val;
        } else if (key == "log_dir") {
            cfg.log_dir = val;
        } else if (key == "log_level") {
            if (!parse_log_level(val, cfg.log_level)) {
                std::stringstream ss;
                ss << "Invalid log level \"" << val << '\"';
                throw ConfigError(ss.str());
            }
        } else if (key == "web_host") {
            cfg.web_host = val;
        } else if (key == "web_port") {
            cfg.web_port = parse_positive(key, val);
        } else if (key == "vendor_db") {
            cfg.vendor_db = val;
        } else if (key == "notify_sound") {
            cfg.notify.sound = parse_bool(key, val);
        } else if (key == "notify_desktop") {
            cfg.notify.desktop = parse_bool(key, val);
        } else if (key == "sound_file") {
            cfg.notify.sound_file = val;
        } else if (key == "telegram_token") {
            cfg.notify.telegram_token = val;
        } else if (key == "telegram_chat_id") {
            cfg.notify.telegram_chat_id = val;
        } else if (key == "webhook_url") {
            cfg.notify.webhook_url = val;
        } else if (key == "sms_phone") {
            cfg.notify.sms_phone = val;
        } else if (key == "channel_timeout") {
            cfg.notify.channel_timeout = parse_positive(key, val);
        } else if (key == "quiet_hours_start") {
            cfg.notify.quiet_hours_start = val.empty() ? -1 : parse_hour(key, val);
        } else if (key == "quiet_hours_end") {
            cfg.notify.quiet_hours_end = val.empty() ? -1 : parse_hour(key, val);
        } else if (key == "panic_enabled") {
            cfg.panic.enabled = parse_bool(key, val);
        } else if (key == "panic_message") {
            cfg.panic.message = val;
        } else if (key == "panic_sound_loops") {
            long n = parse_number(key, val);
            if (n < 0 || n > MAX_PANIC_SOUND_LOOPS) {
                std::stringstream ss;
                ss << "Value of " << key << " must be between 0 and " << MAX_PANIC_SOUND_LOOPS << ", got " << n;
                throw ConfigError(ss.str());
            }
            cfg.panic.sound_loops = n;
        } else if (key == "panic_only_unknown") {
            cfg.panic.only_unknown = parse_bool(key, val);
        } else if (key.rfind(PANIC_MESSAGE_PREFIX, 0) == 0) {
            std::string mac;
            if (!normalize_mac(key.substr(strlen(PANIC_MESSAGE_PREFIX)), mac)) {
                std::stringstream ss;
                ss << "Invalid MAC address in key \"" << key << '\"';
                throw ConfigError(ss.str());
            }
            cfg.panic.custom_messages[mac] = val;
        } else {
            std::stringstream ss;
            ss << "Invalid key \"" << key << '\"';
            Logger::warn(ss.str());
        }
    }
}

void validate_config(const Config &cfg)
{
    NetworkRange range;
    if (!parse_network_range(cfg.network, range)) {
        std::stringstream ss;
        ss << "Invalid network range \"" << cfg.network << "\", expected CIDR notation such as " DEFAULT_NETWORK;
        throw ConfigError(ss.str());
    }

    if (cfg.interval == 0)
        throw ConfigError("Scan interval must be positive");

    if (cfg.device_ttl == 0)
        throw ConfigError("Device TTL must be positive");

    struct in_addr host;
    if (inet_pton(AF_INET, cfg.web_host.c_str(), &host) != 1) {
        std::stringstream ss;
        ss << "Invalid web host \"" << cfg.web_host << "\", expected an IPv4 address";
        throw ConfigError(ss.str());
    }

    if (cfg.web_port > 65535) {
        std::stringstream ss;
        ss << "Invalid web port " << cfg.web_port;
        throw ConfigError(ss.str());
    }

    if (cfg.panic.sound_loops > MAX_PANIC_SOUND_LOOPS) {
        std::stringstream ss;
        ss << "Too many panic sound loops " << cfg.panic.sound_loops;
        throw ConfigError(ss.str());
    }

    const NotifyConfig &n = cfg.notify;
    if ((n.quiet_hours_start < 0) != (n.quiet_hours_end < 0))
        throw ConfigError("quiet_hours_start and quiet_hours_end must be set together");

    if (n.quiet_hours_start > 23 || n.quiet_hours_end > 23)
        throw ConfigError("Quiet hours must be between 0 and 23");

    if (n.telegram_token.empty() != n.telegram_chat_id.empty())
        Logger::warn("Telegram channel needs both telegram_token and telegram_chat_id, disabling it");

    if (cfg.state_dir.empty())
        throw ConfigError("state_dir cannot be empty");
}

void write_config(std::ostream &out, const Config &cfg)
{
    const NotifyConfig &n = cfg.notify;
    const PanicConfig &p = cfg.panic;

    out << "# " PROGRAM_NAME " configuration\n";
    out << "network = " << cfg.network << '\n';
    out << "interval = " << cfg.interval << '\n';
    out << "device_ttl = " << cfg.device_ttl << '\n';
    out << "state_dir = " << cfg.state_dir << '\n';
    out << "log_dir = " << cfg.log_dir << '\n';
    out << "log_level = " << log_level_name(cfg.log_level) << '\n';
    out << "web_host = " << cfg.web_host << '\n';
    out << "web_port = " << cfg.web_port << '\n';
    out << "vendor_db = " << cfg.vendor_db << '\n';

    out << "\n# Notifications\n";
    out << "notify_sound = " << (n.sound ? "true" : "false") << '\n';
    out << "notify_desktop = " << (n.desktop ? "true" : "false") << '\n';
    out << "sound_file = " << n.sound_file << '\n';
    out << "telegram_token = " << n.telegram_token << '\n';
    out << "telegram_chat_id = " << n.telegram_chat_id << '\n';
    out << "webhook_url = " << n.webhook_url << '\n';
    out << "sms_phone = " << n.sms_phone << '\n';
    out << "channel_timeout = " << n.channel_timeout << '\n';

    /* Empty when disabled */
    out << "quiet_hours_start = ";
    if (n.quiet_hours_start >= 0)
        out << n.quiet_hours_start;
    out << '\n';
    out << "quiet_hours_end = ";
    if (n.quiet_hours_end >= 0)
        out << n.quiet_hours_end;
    out << '\n';

    out << "\n# Panic mode\n";
    out << "panic_enabled = " << (p.enabled ? "true" : "false") << '\n';
    out << "panic_message = " << p.message << '\n';
    out << "panic_sound_loops = " << p.sound_loops << '\n';
    out << "panic_only_unknown = " << (p.only_unknown ? "true" : "false") << '\n';
    for (auto &e : p.custom_messages)
        out << PANIC_MESSAGE_PREFIX << e.first << " = " << e.second << '\n';
}

bool save_config(const std::string &path, const Config &cfg)
{
    size_t slash = path.rfind('/');
    if (slash != std::string::npos && slash > 0 && !make_dirs(path.substr(0, slash))) {
        std::stringstream ss;
        ss << "Cannot create directory of " << path << ": " << strerror(errno);
        Logger::err(ss.str());
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        std::stringstream ss;
        ss << "Could not open " << path << " for writing";
        Logger::err(ss.str());
        return false;
    }

    write_config(file, cfg);
    file.close();
    if (file.fail()) {
        std::stringstream ss;
        ss << "Failed to write configuration to " << path;
        Logger::err(ss.str());
        return false;
    }

    std::stringstream ss;
    ss << "Saved configuration to " << path;
    Logger::info(ss.str());

    return true;
}
