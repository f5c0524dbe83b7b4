#ifndef WEBHOOK_CHANNEL_HPP
#define WEBHOOK_CHANNEL_HPP

#include "notification_channel.hpp"
#include <time.h>

class WebhookChannel : public NotificationChannel {
public:
    WebhookChannel(const std::string &url, unsigned int timeout_s);

    bool deliver(const std::string &title, const std::string &body, const Device *device) override;

    /**
     * @brief Build the JSON document posted to the webhook
     *
     * {"title":..,"message":..,"timestamp":..,"device":{"mac":..,"name":..,"vendor":..,"ip":..}}
     * Empty device fields are sent as null, the device object is
     * omitted when there is no device.
     */
    static std::string buildPayload(const std::string &title, const std::string &body,
                                    const Device *device, time_t now);

private:
    std::string m_url;
    unsigned int m_timeout;
};

#endif
