#include "http_client.hpp"
#include "logger.hpp"
#include "telegram_channel.hpp"
#include <sstream>

TelegramChannel::TelegramChannel(const std::string &token, const std::string &chat_id, unsigned int timeout_s):
NotificationChannel("telegram"),
m_token(token),
m_chat_id(chat_id),
m_timeout(timeout_s)
{
}

std::string TelegramChannel::buildText(const std::string &title, const std::string &body, const Device *device)
{
    std::stringstream ss;
    ss << '*' << title << "*\n" << body;
    if (device && !device->vendor.empty())
        ss << "\nDevice: " << device->vendor;
    return ss.str();
}

bool TelegramChannel::deliver(const std::string &title, const std::string &body, const Device *device)
{
    std::stringstream json;
    json << "{\"chat_id\":\"" << json_escape(m_chat_id) << "\","
         << "\"text\":\"" << json_escape(buildText(title, body, device)) << "\","
         << "\"parse_mode\":\"Markdown\"}";

    long status;
    if (!post_json(TELEGRAM_API_URL + m_token + "/sendMessage", json.str(), m_timeout, status))
        return false;

    if (status != 200) {
        std::stringstream ss;
        ss << "Telegram API answered with status " << status;
        Logger::warn(ss.str());
        return false;
    }

    return true;
}
