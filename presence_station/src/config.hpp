#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "arp_scanner.hpp"
#include "logger.hpp"
#include <istream>
#include <ostream>
#include <map>
#include <stdexcept>
#include <string>

#define DEFAULT_SCAN_INTERVAL       (30)        /* in seconds */
#define DEFAULT_DEVICE_TTL          (180)       /* in seconds */
#define DEFAULT_WEB_HOST            "0.0.0.0"
#define DEFAULT_WEB_PORT            (8080)
#define DEFAULT_CHANNEL_TIMEOUT     (10)        /* in seconds */
#define DEFAULT_VENDOR_DB           "/usr/share/ieee-data/oui.txt"
#define DEFAULT_SOUND_FILE          "/usr/share/sounds/freedesktop/stereo/bell.oga"
#define MAX_PANIC_SOUND_LOOPS       (100)
#define DEFAULT_PANIC_MESSAGE       "OHSHITOHSHITOHSHITOHSHITOHSHIT!"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &what):
    std::runtime_error(what)
    {
    }
};

struct NotifyConfig {
    bool sound = true;
    bool desktop = false;
    std::string sound_file = DEFAULT_SOUND_FILE;
    std::string telegram_token;
    std::string telegram_chat_id;
    std::string webhook_url;
    std::string sms_phone;
    unsigned int channel_timeout = DEFAULT_CHANNEL_TIMEOUT;

    /* Hours of day, -1 when quiet hours are disabled */
    int quiet_hours_start = -1;
    int quiet_hours_end = -1;
};

struct PanicConfig {
    bool enabled = false;
    std::string message = DEFAULT_PANIC_MESSAGE;
    unsigned int sound_loops = 1;
    bool only_unknown = true;
    std::map<std::string, std::string> custom_messages; /* MAC -> message */
};

struct Config {
    std::string network = DEFAULT_NETWORK;
    unsigned int interval = DEFAULT_SCAN_INTERVAL;
    unsigned int device_ttl = DEFAULT_DEVICE_TTL;
    std::string state_dir;
    std::string log_dir = ".";
    enum LogLevel log_level = LOG_INFO;
    std::string web_host = DEFAULT_WEB_HOST;
    unsigned int web_port = DEFAULT_WEB_PORT;
    std::string vendor_db = DEFAULT_VENDOR_DB;
    NotifyConfig notify;
    PanicConfig panic;
};

std::string default_config_path();
std::string default_state_dir();

/* Defaults with paths resolved against $HOME */
Config default_config();

/**
 * @brief Load configuration file
 *
 * A missing file is not an error, defaults are used instead.
 *
 * @throw ConfigError if the file contains invalid values
 */
Config load_config(const std::string &path);

/**
 * @brief Parse key=value lines into cfg
 *
 * Unknown keys are logged and ignored.
 *
 * @throw ConfigError on malformed values
 */
void parse_config(std::istream &in, Config &cfg);

/* @throw ConfigError */
void validate_config(const Config &cfg);

/* Write every key in the format read by parse_config */
void write_config(std::ostream &out, const Config &cfg);

/**
 * @brief Write configuration file, creating its directory if needed
 *
 * @return true on success, false otherwise
 */
bool save_config(const std::string &path, const Config &cfg);

#endif
