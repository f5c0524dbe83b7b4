#include "http_client.hpp"
#include "logger.hpp"
#include "webhook_channel.hpp"
#include <sstream>

namespace {

std::string json_string_or_null(const std::string &s)
{
    if (s.empty())
        return "null";
    return "\"" + json_escape(s) + "\"";
}

}

WebhookChannel::WebhookChannel(const std::string &url, unsigned int timeout_s):
NotificationChannel("webhook"),
m_url(url),
m_timeout(timeout_s)
{
}

std::string WebhookChannel::buildPayload(const std::string &title, const std::string &body,
                                         const Device *device, time_t now)
{
    std::stringstream json;
    json << "{\"title\":\"" << json_escape(title) << "\","
         << "\"message\":\"" << json_escape(body) << "\","
         << "\"timestamp\":\"" << format_timestamp(now, "%FT%T") << '\"';

    if (device) {
        json << ",\"device\":{"
             << "\"mac\":" << json_string_or_null(device->mac) << ','
             << "\"name\":" << json_string_or_null(device->name) << ','
             << "\"vendor\":" << json_string_or_null(device->vendor) << ','
             << "\"ip\":" << json_string_or_null(device->ip) << '}';
    }

    json << '}';
    return json.str();
}

bool WebhookChannel::deliver(const std::string &title, const std::string &body, const Device *device)
{
    long status;
    if (!post_json(m_url, buildPayload(title, body, device, time(NULL)), m_timeout, status))
        return false;

    if (status < 200 || status >= 300) {
        std::stringstream ss;
        ss << "Webhook " << m_url << " answered with status " << status;
        Logger::warn(ss.str());
        return false;
    }

    return true;
}
