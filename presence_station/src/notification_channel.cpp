#include "notification_channel.hpp"

NotificationChannel::NotificationChannel(const std::string &name):
m_name(name)
{
}

std::string NotificationChannel::getName() const
{
    return m_name;
}
