#ifndef TELEGRAM_CHANNEL_HPP
#define TELEGRAM_CHANNEL_HPP

#include "notification_channel.hpp"

#define TELEGRAM_API_URL    "https://api.telegram.org/bot"

/* Message sent by a Telegram bot to one chat */
class TelegramChannel : public NotificationChannel {
public:
    TelegramChannel(const std::string &token, const std::string &chat_id, unsigned int timeout_s);

    bool deliver(const std::string &title, const std::string &body, const Device *device) override;

    /* Markdown text: bold title, body and vendor of the device if known */
    static std::string buildText(const std::string &title, const std::string &body, const Device *device);

private:
    std::string m_token;
    std::string m_chat_id;
    unsigned int m_timeout;
};

#endif
