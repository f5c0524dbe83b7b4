#include "file_registry.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#define DEVICE_FIELD_COUNT  (8)
#define EVENT_FIELD_COUNT   (4)

namespace {

std::vector<std::string> split_fields(const std::string &line)
{
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, ','))
        fields.push_back(unescape_field(field));

    /* getline drops a trailing empty field */
    if (!line.empty() && line[line.length() - 1] == ',')
        fields.push_back(std::string());

    return fields;
}

/* A crash while appending can leave a line without its newline */
bool ends_with_newline(const std::string &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return true;

    file.seekg(0, std::ios::end);
    if (file.tellg() <= 0)
        return true;

    file.seekg(-1, std::ios::end);
    char c = '\0';
    file.get(c);
    return c == '\n';
}

off_t file_size(const std::string &path)
{
    struct stat st;
    if (stat(path.c_str(), &st) < 0)
        return -1;
    return st.st_size;
}

bool parse_time(const std::string &str, time_t &ts)
{
    char *end = NULL;
    long long val = strtoll(str.c_str(), &end, 10);
    if (str.empty() || *end != '\0' || val < 0)
        return false;
    ts = val;
    return true;
}

}

std::string escape_field(const std::string &field)
{
    std::string escaped;
    for (auto c : field) {
        switch (c) {
        case '%': escaped += "%25"; break;
        case ',': escaped += "%2C"; break;
        case '\n': escaped += "%0A"; break;
        case '\r': escaped += "%0D"; break;
        default: escaped += c; break;
        }
    }
    return escaped;
}

std::string unescape_field(const std::string &field)
{
    std::string s;
    for (unsigned int i = 0; i < field.length(); ++i) {
        if (field[i] == '%' && i + 2 < field.length()) {
            std::string hex = field.substr(i + 1, 2);
            char *end = NULL;
            long c = strtol(hex.c_str(), &end, 16);
            if (*end == '\0') {
                s += static_cast<char>(c);
                i += 2;
                continue;
            }
        }
        s += field[i];
    }
    return s;
}

bool make_dirs(const std::string &path)
{
    std::string current;
    std::istringstream iss(path);
    std::string part;

    if (!path.empty() && path[0] == '/')
        current = "/";

    while (std::getline(iss, part, '/')) {
        if (part.empty())
            continue;
        current += part;
        if (mkdir(current.c_str(), 0755) < 0 && errno != EEXIST)
            return false;
        current += '/';
    }

    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

FileRegistry::FileRegistry(const std::string &dir):
DeviceRegistry(),
m_dir(dir),
m_events_file(),
m_events_size(0)
{
}

FileRegistry::~FileRegistry()
{
    m_events_file.close();
}

std::string FileRegistry::getDevicesPath() const
{
    return m_dir + "/" DEVICES_FILE_NAME;
}

std::string FileRegistry::getEventsPath() const
{
    return m_dir + "/" EVENTS_FILE_NAME;
}

void FileRegistry::open()
{
    if (!make_dirs(m_dir)) {
        std::stringstream ss;
        ss << "Cannot create state directory " << m_dir << ": " << strerror(errno);
        throw RegistryError(ss.str());
    }

    std::map<std::string, Device> devices;
    std::vector<PresenceEvent> events;
    if (!loadDevices(devices)) {
        std::stringstream ss;
        ss << "Cannot read " << getDevicesPath();
        throw RegistryError(ss.str());
    }
    if (!loadEvents(events)) {
        std::stringstream ss;
        ss << "Cannot read " << getEventsPath();
        throw RegistryError(ss.str());
    }

    unsigned int repaired = repairFromEvents(devices, events);

    if (!reopenEventsFile()) {
        std::stringstream ss;
        ss << "Cannot open " << getEventsPath() << " for writing";
        throw RegistryError(ss.str());
    }

    /* Make sure devices file can be written now rather than during a scan */
    if (!storeDevices(devices)) {
        std::stringstream ss;
        ss << "Cannot write " << getDevicesPath();
        throw RegistryError(ss.str());
    }

    load(devices, events);

    std::stringstream ss;
    ss << "Loaded " << devices.size() << " devices and " << events.size()
       << " events from " << m_dir;
    if (repaired)
        ss << " (" << repaired << " devices repaired from event log)";
    Logger::info(ss.str());
}

bool FileRegistry::loadDevices(std::map<std::string, Device> &devices)
{
    std::ifstream file(getDevicesPath());
    if (!file) {
        /* First start */
        return access(getDevicesPath().c_str(), F_OK) != 0;
    }

    std::string line;
    unsigned int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty())
            continue;

        std::vector<std::string> fields = split_fields(line);
        Device d;
        if (fields.size() != DEVICE_FIELD_COUNT
        ||  !normalize_mac(fields[0], d.mac)
        ||  !parse_time(fields[4], d.first_seen)
        ||  !parse_time(fields[5], d.last_seen)
        ||  (fields[6] != "0" && fields[6] != "1")) {
            std::stringstream ss;
            ss << "Ignoring malformed line " << line_no << " of " << getDevicesPath();
            Logger::warn(ss.str());
            continue;
        }

        d.name = fields[1];
        d.vendor = fields[2];
        d.ip = fields[3];
        d.is_online = fields[6] == "1";
        d.group = fields[7];
        devices[d.mac] = d;
    }

    return true;
}

bool FileRegistry::loadEvents(std::vector<PresenceEvent> &events)
{
    std::ifstream file(getEventsPath());
    if (!file)
        return access(getEventsPath().c_str(), F_OK) != 0;

    std::string line;
    unsigned int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty())
            continue;

        std::vector<std::string> fields = split_fields(line);
        PresenceEvent e;
        char *end = NULL;
        if (fields.size() == EVENT_FIELD_COUNT)
            e.id = strtoull(fields[0].c_str(), &end, 10);

        if (fields.size() != EVENT_FIELD_COUNT
        ||  fields[0].empty() || *end != '\0' || e.id == 0
        ||  !normalize_mac(fields[1], e.mac)
        ||  !parse_event_kind(fields[2], e.kind)
        ||  !parse_time(fields[3], e.timestamp)) {
            /* A crash while appending leaves a truncated last line */
            std::stringstream ss;
            ss << "Ignoring malformed line " << line_no << " of " << getEventsPath();
            Logger::warn(ss.str());
            continue;
        }

        events.push_back(e);
    }

    return true;
}

unsigned int FileRegistry::repairFromEvents(std::map<std::string, Device> &devices,
                                            const std::vector<PresenceEvent> &events)
{
    std::map<std::string, const PresenceEvent*> first;
    std::map<std::string, const PresenceEvent*> last;
    for (auto &e : events) {
        if (first.find(e.mac) == first.end())
            first[e.mac] = &e;
        last[e.mac] = &e;
    }

    unsigned int repaired = 0;
    for (auto &it : last) {
        const PresenceEvent &e = *it.second;
        bool online = e.kind == EVENT_ARRIVED;

        auto d = devices.find(e.mac);
        if (d == devices.end()) {
            Device device;
            device.mac = e.mac;
            device.first_seen = first[e.mac]->timestamp;
            device.last_seen = e.timestamp;
            device.is_online = online;
            devices[e.mac] = device;
        } else if (d->second.is_online != online) {
            d->second.is_online = online;
            if (online && e.timestamp > d->second.last_seen)
                d->second.last_seen = e.timestamp;
        } else {
            continue;
        }

        std::stringstream ss;
        ss << "Repaired state of device " << e.mac << " from event " << e.id;
        Logger::warn(ss.str());
        ++repaired;
    }

    return repaired;
}

bool FileRegistry::openEventsFile(bool truncate)
{
    m_events_file.close();
    m_events_file.clear();
    m_events_file.open(getEventsPath(), std::fstream::out | (truncate ? std::fstream::trunc : std::fstream::app));
    if (!m_events_file.is_open())
        return false;

    m_events_size = truncate ? 0 : file_size(getEventsPath());
    return m_events_size >= 0;
}

bool FileRegistry::reopenEventsFile()
{
    if (!openEventsFile(false))
        return false;

    if (ends_with_newline(getEventsPath()))
        return true;

    m_events_file << '\n';
    m_events_file.flush();
    if (!m_events_file)
        return false;

    m_events_size++;
    return true;
}

bool FileRegistry::storeEvent(const PresenceEvent &event)
{
    if (!m_events_file.is_open() && !reopenEventsFile())
        return false;

    std::stringstream line;
    line << event.id << ','
         << escape_field(event.mac) << ','
         << event_kind_to_str(event.kind) << ','
         << static_cast<long long>(event.timestamp) << '\n';

    m_events_file << line.str();
    m_events_file.flush();

    if (!m_events_file) {
        std::stringstream ss;
        ss << "Failed to append event " << event.id << " to " << getEventsPath();
        Logger::err(ss.str());

        /* Drop the partial line, the file is reopened on next attempt */
        m_events_file.close();
        m_events_file.clear();
        if (::truncate(getEventsPath().c_str(), m_events_size) < 0) {
            std::stringstream msg;
            msg << "Could not truncate " << getEventsPath() << ": " << strerror(errno);
            Logger::warn(msg.str());
        }
        return false;
    }

    m_events_size += line.str().length();
    return true;
}

bool FileRegistry::storeDevices(const std::map<std::string, Device> &devices)
{
    std::string tmp_path = getDevicesPath() + ".tmp";

    {
        std::ofstream file(tmp_path, std::fstream::out | std::fstream::trunc);
        if (!file) {
            Logger::err("Could not create " + tmp_path);
            return false;
        }

        for (auto &e : devices) {
            const Device &d = e.second;
            file << escape_field(d.mac) << ','
                 << escape_field(d.name) << ','
                 << escape_field(d.vendor) << ','
                 << escape_field(d.ip) << ','
                 << static_cast<long long>(d.first_seen) << ','
                 << static_cast<long long>(d.last_seen) << ','
                 << (d.is_online ? '1' : '0') << ','
                 << escape_field(d.group) << '\n';
        }

        file.flush();
        if (!file) {
            Logger::err("Could not write " + tmp_path);
            file.close();
            unlink(tmp_path.c_str());
            return false;
        }
    }

    if (rename(tmp_path.c_str(), getDevicesPath().c_str()) < 0) {
        std::stringstream ss;
        ss << "Failed to replace " << getDevicesPath() << ": " << strerror(errno);
        Logger::err(ss.str());
        unlink(tmp_path.c_str());
        return false;
    }

    return true;
}

bool FileRegistry::storeReset()
{
    if (!openEventsFile(true)) {
        Logger::err("Could not truncate " + getEventsPath());
        return false;
    }

    return storeDevices(std::map<std::string, Device>());
}
