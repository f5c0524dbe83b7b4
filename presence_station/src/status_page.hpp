#ifndef STATUS_PAGE_HPP
#define STATUS_PAGE_HPP

#include "device_registry.hpp"
#include "presence_engine.hpp"
#include <string>
#include <time.h>

#define STATUS_HISTORY_LENGTH   (10)

std::string html_escape(const std::string &s);

/*
 * Content served by the web server. Kept apart from the HTTP
 * layer so that it can be built without a running daemon.
 */
class StatusPage {
public:
    StatusPage(DeviceRegistry &registry, PresenceEngine &engine);

    std::string buildWebpage();

    /* Counters, online devices and the last events */
    std::string buildStatusJson();

    /* {"summary": "..."} */
    std::string buildWhoJson();

    /**
     * @brief Apply a user edit
     *
     * @param mac
     * @param name new name, NULL to keep it
     * @param group new group, NULL to keep it
     * @param[out] json response body
     * @return HTTP status code
     */
    unsigned int editDevice(const std::string &mac, const char *name, const char *group, std::string &json);

private:
    unsigned int arrivalsToday();

    DeviceRegistry &m_registry;
    PresenceEngine &m_engine;
    time_t m_started_at;
};

#endif
