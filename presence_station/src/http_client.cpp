#include "http_client.hpp"
#include "logger.hpp"
#include "version.hpp"
#include <cstdio>
#include <curl/curl.h>
#include <sstream>

namespace {

size_t write_response(void *data, size_t size, size_t nmemb, void *userp)
{
    static_cast<std::string*>(userp)->append(static_cast<char*>(data), size * nmemb);
    return size * nmemb;
}

}

std::string json_escape(const std::string &s)
{
    std::string escaped;
    escaped.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
        case '"':  escaped += "\\\""; break;
        case '\\': escaped += "\\\\"; break;
        case '\n': escaped += "\\n"; break;
        case '\r': escaped += "\\r"; break;
        case '\t': escaped += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                escaped += buf;
            } else {
                escaped += c;
            }
        }
    }
    return escaped;
}

bool post_json(const std::string &url, const std::string &json, unsigned int timeout_s, long &status)
{
    status = 0;

    CURL *curl = curl_easy_init();
    if (!curl) {
        Logger::err("curl_easy_init failed");
        return false;
    }

    std::string response;
    std::string user_agent = get_user_agent_str();
    struct curl_slist *headers = NULL;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_response);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_s));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        std::stringstream ss;
        ss << "POST request failed: " << curl_easy_strerror(rc);
        Logger::warn(ss.str());
        return false;
    }

    if (status < 200 || status >= 300) {
        std::stringstream ss;
        ss << "POST request returned " << status << ": " << response.substr(0, 200);
        Logger::debug(ss.str());
    }

    return true;
}
