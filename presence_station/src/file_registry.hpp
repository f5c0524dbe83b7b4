#ifndef FILE_REGISTRY_HPP
#define FILE_REGISTRY_HPP

#include "device_registry.hpp"
#include <fstream>
#include <string>
#include <sys/types.h>

#define DEVICES_FILE_NAME   "devices.csv"
#define EVENTS_FILE_NAME    "events.csv"

/*
 * Device registry stored in two files of a state directory:
 *
 * devices.csv  mac,name,vendor,ip,first_seen,last_seen,online,group
 *              rewritten as a whole on every change
 * events.csv   id,mac,kind,timestamp
 *              appended to, never rewritten except on reset
 *
 * An event line is the commit record of a transition. When loading,
 * the last event of a device overrides a devices.csv line that was
 * not updated after it.
 */
class FileRegistry : public DeviceRegistry {
public:
    explicit FileRegistry(const std::string &dir);
    virtual ~FileRegistry();

    /**
     * @brief Create state directory if needed and load its content
     *
     * @throw RegistryError if files cannot be read or created
     */
    void open();

    std::string getDevicesPath() const;
    std::string getEventsPath() const;

protected:
    bool storeEvent(const PresenceEvent &event) override;
    bool storeDevices(const std::map<std::string, Device> &devices) override;
    bool storeReset() override;

private:
    bool loadDevices(std::map<std::string, Device> &devices);
    bool loadEvents(std::vector<PresenceEvent> &events);
    unsigned int repairFromEvents(std::map<std::string, Device> &devices,
                                  const std::vector<PresenceEvent> &events);
    bool openEventsFile(bool truncate);

    /* Open for appending, completing a truncated last line */
    bool reopenEventsFile();

    std::string m_dir;
    std::ofstream m_events_file;
    off_t m_events_size;    /* up to the last complete event */
};

/* Percent-escape '%', ',', CR and LF */
std::string escape_field(const std::string &field);
std::string unescape_field(const std::string &field);

/* mkdir -p */
bool make_dirs(const std::string &path);

#endif
