#ifndef NOTIFICATION_POLICY_HPP
#define NOTIFICATION_POLICY_HPP

#include "config.hpp"
#include "device.hpp"
#include "notification_channel.hpp"
#include "notification_dispatcher.hpp"
#include "panic_alert.hpp"
#include <memory>
#include <string>
#include <vector>

enum DecisionKind {
    DECISION_SUPPRESSED,
    DECISION_PANIC,
    DECISION_NORMAL,
};

/*
 * Outcome of the policy for one change.
 * title and body are set for DECISION_NORMAL,
 * message for DECISION_PANIC.
 */
struct Decision {
    enum DecisionKind kind = DECISION_SUPPRESSED;
    std::string title;
    std::string body;
    std::string message;
};

/**
 * @brief Check whether hour falls in the quiet window [start, end)
 *
 * The window wraps around midnight when start > end. It is empty
 * when start == end or when either bound is negative.
 */
bool in_quiet_hours(int start, int end, int hour);

/**
 * @brief Create the channels enabled in the configuration
 *
 * The Telegram channel needs both a token and a chat id.
 */
std::vector<std::shared_ptr<NotificationChannel>> create_channels(const NotifyConfig &cfg);

/*
 * Decides which changes are notified and how.
 *
 * Quiet hours silence everything, panic included. Otherwise a
 * panic alert replaces the ordinary channels for arrivals and new
 * devices. Departures always go through the channels.
 */
class NotificationPolicy {
public:
    NotificationPolicy(const NotifyConfig &notify, const PanicConfig &panic,
                       NotificationDispatcher &dispatcher, PanicAlert &panic_alert);

    void addChannel(const std::shared_ptr<NotificationChannel> &channel);
    unsigned int getChannelCount() const;

    Decision decide(const PresenceChange &change, int hour) const;

    /* Decide using the current local hour and queue the deliveries */
    void handle(const PresenceChange &change);

private:
    std::string panicMessage(const Device &device) const;

    NotifyConfig m_notify;
    PanicConfig m_panic;
    NotificationDispatcher &m_dispatcher;
    PanicAlert &m_panic_alert;
    std::vector<std::shared_ptr<NotificationChannel>> m_channels;
};

#endif
