#ifndef DESKTOP_CHANNEL_HPP
#define DESKTOP_CHANNEL_HPP

#include "notification_channel.hpp"

/* Desktop toast through notify-send */
class DesktopChannel : public NotificationChannel {
public:
    explicit DesktopChannel(unsigned int timeout_s);

    bool deliver(const std::string &title, const std::string &body, const Device *device) override;

private:
    unsigned int m_timeout;
};

#endif
