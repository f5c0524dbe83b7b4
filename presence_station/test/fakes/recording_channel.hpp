#ifndef RECORDING_CHANNEL_HPP
#define RECORDING_CHANNEL_HPP

#include "notification_channel.hpp"
#include <mutex>
#include <vector>

struct Delivery {
    std::string title;
    std::string body;
    std::string mac;
};

class RecordingChannel : public NotificationChannel {
public:
    explicit RecordingChannel(const std::string &name, bool succeed = true);

    bool deliver(const std::string &title, const std::string &body, const Device *device) override;

    std::vector<Delivery> getDeliveries();

private:
    bool m_succeed;
    std::mutex m_mutex;
    std::vector<Delivery> m_deliveries;
};

#endif
