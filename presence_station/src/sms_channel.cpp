#include "logger.hpp"
#include "sms_channel.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

SMSChannel::SMSChannel(const std::string &phone):
NotificationChannel("sms"),
m_phone(phone),
m_mutex(),
m_counter(0)
{
}

bool SMSChannel::deliver(const std::string &title, const std::string &body, const Device *)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    /* Do not queue messages while the modem is unplugged, they would
     * all be sent at once when it comes back. */
    if (access(MODULE_3G_DEVPATH, F_OK) != 0) {
        std::stringstream ss;
        ss << "3G module not detected (no " << MODULE_3G_DEVPATH
           << " found). Discarding text message.";
        Logger::err(ss.str());
        return false;
    }

    std::stringstream filename;
    filename << "presence_" << getpid() << "_" << m_counter;
    m_counter++;

    std::string tmp_path = "/tmp/" + filename.str();
    std::ofstream file(tmp_path);
    if (!file) {
        Logger::err("Could not create " + tmp_path);
        return false;
    }

    file << "To: " << m_phone << '\n';
    file << '\n';
    file << title << '\n';
    file << body << '\n';
    file.close();
    if (!file) {
        Logger::err("Could not write " + tmp_path);
        remove(tmp_path.c_str());
        return false;
    }

    std::string path = SMS_OUTGOING_DIR + filename.str();
    if (rename(tmp_path.c_str(), path.c_str()) < 0) {
        Logger::err("Failed to move text message to " SMS_OUTGOING_DIR);
        remove(tmp_path.c_str());
        return false;
    }

    return true;
}
