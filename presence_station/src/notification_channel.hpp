#ifndef NOTIFICATION_CHANNEL_HPP
#define NOTIFICATION_CHANNEL_HPP

#include "device.hpp"
#include <string>

/*
 * One-way notification sink.
 *
 * deliver() is called from the dispatcher thread and must return
 * within a bounded time. It reports failures by returning false,
 * never by throwing.
 */
class NotificationChannel {
public:
    explicit NotificationChannel(const std::string &name);
    virtual ~NotificationChannel() = default;

    std::string getName() const;

    /**
     * @param title
     * @param body
     * @param device the device concerned, may be NULL
     * @return true if the notification was handed over
     */
    virtual bool deliver(const std::string &title, const std::string &body, const Device *device) = 0;

private:
    std::string m_name;
};

#endif
