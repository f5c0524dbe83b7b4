#ifndef SMS_CHANNEL_HPP
#define SMS_CHANNEL_HPP

#include "notification_channel.hpp"
#include <mutex>

#define MODULE_3G_DEVPATH   "/dev/ttyUSB2"
#define SMS_OUTGOING_DIR    "/var/spool/sms/outgoing/"

/*
 * Text message sent through smstools: a message file is moved
 * to the outgoing spool directory and smsd sends it.
 */
class SMSChannel : public NotificationChannel {
public:
    explicit SMSChannel(const std::string &phone);

    bool deliver(const std::string &title, const std::string &body, const Device *device) override;

private:
    std::string m_phone;
    std::mutex m_mutex;
    unsigned int m_counter;
};

#endif
