#include "http_client.hpp"
#include "logger.hpp"
#include "status_page.hpp"
#include "version.hpp"
#include <sstream>

namespace {

std::string event_device_name(DeviceRegistry &registry, const std::string &mac)
{
    Device d;
    if (!registry.get(mac, d))
        return mac;
    return device_display_name(d);
}

}

std::string html_escape(const std::string &s)
{
    std::string escaped;
    for (auto c : s) {
        switch (c) {
        case '&': escaped += "&amp;"; break;
        case '<': escaped += "&lt;"; break;
        case '>': escaped += "&gt;"; break;
        case '"': escaped += "&quot;"; break;
        case '\'': escaped += "&#39;"; break;
        default: escaped += c; break;
        }
    }
    return escaped;
}

StatusPage::StatusPage(DeviceRegistry &registry, PresenceEngine &engine):
m_registry(registry),
m_engine(engine),
m_started_at(time(NULL))
{
}

unsigned int StatusPage::arrivalsToday()
{
    return m_registry.countEvents(EVENT_ARRIVED, start_of_day(time(NULL)));
}

std::string StatusPage::buildWebpage()
{
    EngineState state = m_engine.getState();
    std::vector<Device> online = m_registry.listOnline();
    std::vector<PresenceEvent> history = m_registry.listEvents("", 0, STATUS_HISTORY_LENGTH);

    std::stringstream ss;

    ss << "<html><head>\
        <meta http-equiv=\"refresh\" content=\"30\">\
        <style>\
        table, td, th {\
        border: 1px solid black;\
        }\
        table {\
        width: 100%;\
        border-collapse: collapse;\
        }\
        </style>\
        <title>Presence station</title>\
        </head><body>";

    ss << "<h1>Presence station</h1>";
    ss << "<p>" << html_escape(m_engine.summary()) << "</p>";
    ss << "<h2>Status</h2>";
    ss << "Software version: " << get_version_str();
    ss << "<br>";
    ss << "Started: " << format_timestamp(m_started_at);
    ss << "<br>";
    ss << "Last scan: " << format_timestamp(state.last_scan);
    ss << "<br>";
    ss << "Scans: " << state.scans;
    if (state.failed_scans)
        ss << " (<span style=\"color:red\">" << state.failed_scans << " failed</span>)";
    ss << "<br>";
    ss << "Online: " << online.size() << " / " << m_registry.listAll().size() << " known";
    ss << "<br>";
    ss << "Arrivals today: " << arrivalsToday();

    ss << "<h2>Online devices</h2>";
    ss << "<table>";
    ss << "<tr>";
    ss << "<th>Name</th>";
    ss << "<th>Group</th>";
    ss << "<th>MAC address</th>";
    ss << "<th>IP address</th>";
    ss << "<th>Vendor</th>";
    ss << "<th>Last seen</th>";
    ss << "</tr>";
    for (auto &d : online) {
        ss << "<tr>";
        if (!d.name.empty())
            ss << "<td>" << html_escape(d.name) << "</td>";
        else
            ss << "<td><i>unknown</i></td>";
        ss << "<td>" << html_escape(d.group) << "</td>";
        ss << "<td>" << d.mac << "</td>";
        ss << "<td>" << html_escape(d.ip) << "</td>";
        ss << "<td>" << html_escape(d.vendor) << "</td>";
        ss << "<td>" << format_timestamp(d.last_seen) << "</td>";
        ss << "</tr>";
    }
    ss << "</table>";

    ss << "<h2>History</h2>";
    ss << "<table>";
    ss << "<tr>";
    ss << "<th>Time</th>";
    ss << "<th>Device</th>";
    ss << "<th>Event</th>";
    ss << "</tr>";
    for (auto &e : history) {
        ss << "<tr>";
        ss << "<td>" << format_timestamp(e.timestamp) << "</td>";
        ss << "<td>" << html_escape(event_device_name(m_registry, e.mac)) << "</td>";
        if (e.kind == EVENT_ARRIVED)
            ss << "<td style=\"color:green\">arrived</td>";
        else
            ss << "<td style=\"color:red\">left</td>";
        ss << "</tr>";
    }
    ss << "</table>";

    ss << "</body></html>";

    return ss.str();
}

std::string StatusPage::buildStatusJson()
{
    std::vector<Device> online = m_registry.listOnline();
    std::vector<PresenceEvent> history = m_registry.listEvents("", 0, STATUS_HISTORY_LENGTH);

    std::stringstream ss;
    ss << '{';
    ss << "\"online_count\":" << online.size() << ',';
    ss << "\"known_count\":" << m_registry.listAll().size() << ',';
    ss << "\"arrivals_today\":" << arrivalsToday() << ',';
    ss << "\"started_at\":" << static_cast<long long>(m_started_at) << ',';
    ss << "\"last_scan\":" << static_cast<long long>(m_engine.getState().last_scan) << ',';

    ss << "\"devices\":[";
    for (unsigned int i = 0; i < online.size(); ++i) {
        const Device &d = online[i];
        if (i)
            ss << ',';
        ss << "{\"mac\":\"" << d.mac << "\","
           << "\"name\":\"" << json_escape(d.name) << "\","
           << "\"vendor\":\"" << json_escape(d.vendor) << "\","
           << "\"ip\":\"" << json_escape(d.ip) << "\","
           << "\"group\":\"" << json_escape(d.group) << "\"}";
    }
    ss << "],";

    ss << "\"history\":[";
    for (unsigned int i = 0; i < history.size(); ++i) {
        const PresenceEvent &e = history[i];
        if (i)
            ss << ',';
        ss << "{\"mac\":\"" << e.mac << "\","
           << "\"event_type\":\"" << event_kind_to_str(e.kind) << "\","
           << "\"time\":\"" << format_timestamp(e.timestamp, "%H:%M") << "\","
           << "\"device_name\":\"" << json_escape(event_device_name(m_registry, e.mac)) << "\"}";
    }
    ss << "]}";

    return ss.str();
}

std::string StatusPage::buildWhoJson()
{
    return "{\"summary\":\"" + json_escape(m_engine.summary()) + "\"}";
}

unsigned int StatusPage::editDevice(const std::string &mac, const char *name, const char *group, std::string &json)
{
    std::string key;
    if (!normalize_mac(mac, key)) {
        json = "{\"status\":\"error\",\"error\":\"invalid MAC address\"}";
        return 400;
    }

    if ((name && !m_registry.setName(key, name))
    ||  (group && !m_registry.setGroup(key, group))) {
        Device d;
        if (!m_registry.get(key, d)) {
            json = "{\"status\":\"error\",\"error\":\"unknown device\"}";
            return 404;
        }

        json = "{\"status\":\"error\",\"error\":\"could not store device\"}";
        return 500;
    }

    std::stringstream ss;
    ss << "Device " << key << " edited from web interface";
    Logger::info(ss.str());

    json = "{\"status\":\"ok\"}";
    return 200;
}
