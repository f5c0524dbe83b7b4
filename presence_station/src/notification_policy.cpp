#include "desktop_channel.hpp"
#include "logger.hpp"
#include "notification_policy.hpp"
#include "sms_channel.hpp"
#include "sound_channel.hpp"
#include "telegram_channel.hpp"
#include "webhook_channel.hpp"
#include <sstream>
#include <time.h>

bool in_quiet_hours(int start, int end, int hour)
{
    if (start < 0 || end < 0 || start == end)
        return false;

    if (start < end)
        return hour >= start && hour < end;

    return hour >= start || hour < end;
}

std::vector<std::shared_ptr<NotificationChannel>> create_channels(const NotifyConfig &cfg)
{
    std::vector<std::shared_ptr<NotificationChannel>> channels;

    if (cfg.desktop)
        channels.push_back(std::make_shared<DesktopChannel>(cfg.channel_timeout));
    if (cfg.sound)
        channels.push_back(std::make_shared<SoundChannel>(cfg.sound_file, cfg.channel_timeout));
    if (!cfg.telegram_token.empty() && !cfg.telegram_chat_id.empty())
        channels.push_back(std::make_shared<TelegramChannel>(cfg.telegram_token, cfg.telegram_chat_id, cfg.channel_timeout));
    if (!cfg.webhook_url.empty())
        channels.push_back(std::make_shared<WebhookChannel>(cfg.webhook_url, cfg.channel_timeout));
    if (!cfg.sms_phone.empty())
        channels.push_back(std::make_shared<SMSChannel>(cfg.sms_phone));

    return channels;
}

NotificationPolicy::NotificationPolicy(const NotifyConfig &notify, const PanicConfig &panic,
                                       NotificationDispatcher &dispatcher, PanicAlert &panic_alert):
m_notify(notify),
m_panic(panic),
m_dispatcher(dispatcher),
m_panic_alert(panic_alert),
m_channels()
{
}

void NotificationPolicy::addChannel(const std::shared_ptr<NotificationChannel> &channel)
{
    std::stringstream ss;
    ss << "Notification channel " << channel->getName() << " enabled";
    Logger::info(ss.str());

    m_channels.push_back(channel);
}

unsigned int NotificationPolicy::getChannelCount() const
{
    return m_channels.size();
}

std::string NotificationPolicy::panicMessage(const Device &device) const
{
    auto it = m_panic.custom_messages.find(device.mac);
    if (it != m_panic.custom_messages.end())
        return it->second;

    return m_panic.message;
}

Decision NotificationPolicy::decide(const PresenceChange &change, int hour) const
{
    Decision decision;

    if (in_quiet_hours(m_notify.quiet_hours_start, m_notify.quiet_hours_end, hour)) {
        decision.kind = DECISION_SUPPRESSED;
        return decision;
    }

    const Device &d = change.device;
    if (m_panic.enabled
    &&  (change.kind == CHANGE_NEW || change.kind == CHANGE_ARRIVED)
    &&  (!m_panic.only_unknown || d.name.empty())) {
        decision.kind = DECISION_PANIC;
        decision.message = panicMessage(d);
        return decision;
    }

    decision.kind = DECISION_NORMAL;
    std::stringstream body;
    switch (change.kind) {
    case CHANGE_NEW:
        decision.title = "New Device";
        body << "Unknown device";
        if (!d.vendor.empty())
            body << " (" << d.vendor << ')';
        body << "\nMAC: " << d.mac;
        break;
    case CHANGE_ARRIVED:
        decision.title = "Arrival";
        body << device_display_name(d) << " is now home";
        break;
    case CHANGE_LEFT:
        decision.title = "Departure";
        body << device_display_name(d) << " has left";
        break;
    }
    decision.body = body.str();

    return decision;
}

void NotificationPolicy::handle(const PresenceChange &change)
{
    time_t now = time(NULL);
    struct tm tm;
    localtime_r(&now, &tm);

    Decision decision = decide(change, tm.tm_hour);
    switch (decision.kind) {
    case DECISION_SUPPRESSED:
    {
        std::stringstream ss;
        ss << "Quiet hours, not notifying " << change_kind_to_str(change.kind)
           << " of " << change.device.mac;
        Logger::debug(ss.str());
        break;
    }
    case DECISION_PANIC:
    {
        PanicAlert *panic_alert = &m_panic_alert;
        Device device = change.device;
        std::string message = decision.message;
        unsigned int loops = m_panic.sound_loops;
        m_dispatcher.post([panic_alert, device, message, loops] {
            panic_alert->alert(message, &device, loops);
        });
        break;
    }
    case DECISION_NORMAL:
        for (auto &channel : m_channels) {
            std::shared_ptr<NotificationChannel> c = channel;
            Device device = change.device;
            std::string title = decision.title;
            std::string body = decision.body;
            m_dispatcher.post([c, device, title, body] {
                if (!c->deliver(title, body, &device)) {
                    std::stringstream ss;
                    ss << "Failed to deliver \"" << title << "\" through " << c->getName();
                    Logger::warn(ss.str());
                }
            });
        }
        break;
    }
}
