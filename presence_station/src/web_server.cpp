#include <arpa/inet.h>
#include <cstdlib>
#include <cstring>
#include <microhttpd.h>
#include <netinet/in.h>
#include <stdexcept>
#include <sstream>
#include "logger.hpp"
#include "web_server.hpp"

#define DEVICE_API_PREFIX   "/api/device/"

#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MHDResult;
#else
typedef int MHDResult;
#endif

namespace {

/* Marks a POST request whose body was already skipped */
int post_marker;

MHDResult sendResponse(struct MHD_Connection *connection, unsigned int status,
                       const std::string &body, const char *content_type)
{
    struct MHD_Response *response;
    MHDResult ret;

    char *buf = (char *)malloc(body.length() + 1);
    if (!buf)
        return MHD_NO;
    strcpy(buf, body.c_str());
    response = MHD_create_response_from_buffer(body.length(), buf, MHD_RESPMEM_MUST_FREE);
    MHD_add_response_header(response, MHD_HTTP_HEADER_CONTENT_TYPE, content_type);
    ret = MHD_queue_response(connection, status, response);
    MHD_destroy_response(response);

    return ret;
}

MHDResult answerConnection(void *cls, struct MHD_Connection *connection,
                           const char *url, const char *method,
                           const char *version, const char *upload_data,
                           size_t *upload_data_size, void **con_cls)
{
    StatusPage *page = reinterpret_cast<StatusPage*>(cls);
    std::string path(url);
    (void) version;           /* Unused. Silent compiler warning. */
    (void) upload_data;       /* Unused. Silent compiler warning. */

    if (!strcmp(method, MHD_HTTP_METHOD_GET)) {
        if (path == "/")
            return sendResponse(connection, MHD_HTTP_OK, page->buildWebpage(), "text/html; charset=utf-8");
        if (path == "/api/status")
            return sendResponse(connection, MHD_HTTP_OK, page->buildStatusJson(), "application/json");
        if (path == "/api/who")
            return sendResponse(connection, MHD_HTTP_OK, page->buildWhoJson(), "application/json");
    } else if (!strcmp(method, MHD_HTTP_METHOD_POST) && path.rfind(DEVICE_API_PREFIX, 0) == 0) {
        /* The first call only carries the headers */
        if (*con_cls == NULL) {
            *con_cls = &post_marker;
            return MHD_YES;
        }

        /* Parameters are passed in the query, ignore the body */
        if (*upload_data_size != 0) {
            *upload_data_size = 0;
            return MHD_YES;
        }

        std::string mac = path.substr(strlen(DEVICE_API_PREFIX));
        const char *name = MHD_lookup_connection_value(connection, MHD_GET_ARGUMENT_KIND, "name");
        const char *group = MHD_lookup_connection_value(connection, MHD_GET_ARGUMENT_KIND, "group");

        std::string json;
        unsigned int status = page->editDevice(mac, name, group, json);
        return sendResponse(connection, status, json, "application/json");
    }

    {
        std::stringstream ss;
        ss << "No route for " << method << ' ' << path;
        Logger::debug(ss.str());
    }

    return sendResponse(connection, MHD_HTTP_NOT_FOUND, "{\"error\":\"not found\"}", "application/json");
}

}

WebServer::WebServer(StatusPage &page, const std::string &host, unsigned int port):
m_page(page),
m_host(host),
m_port(port),
m_daemon(nullptr)
{

}

WebServer::~WebServer()
{
    if (m_daemon)
        stop();
}

void WebServer::start()
{
    if (m_daemon) {
        Logger::warn("Attempted to start already running web server");
        return;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(m_port);
    if (inet_pton(AF_INET, m_host.c_str(), &addr.sin_addr) != 1) {
        std::stringstream ss;
        ss << "Invalid web server address " << m_host;
        Logger::err(ss.str());
        throw std::runtime_error(ss.str());
    }

    m_daemon = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                               m_port, NULL, NULL,
                               &answerConnection, &m_page,
                               MHD_OPTION_SOCK_ADDR, reinterpret_cast<struct sockaddr*>(&addr),
                               MHD_OPTION_END);

    if (!m_daemon) {
        std::stringstream ss;
        ss << "Failed to start web server on " << m_host << ':' << m_port;
        Logger::err(ss.str());
        throw std::runtime_error(ss.str());
    } else {
        std::stringstream ss;
        ss << "Web server started. Listening on " << m_host << ':' << m_port;
        Logger::info(ss.str());
    }
}

void WebServer::stop()
{
    if (!m_daemon) {
        Logger::warn("Attempted to stop already stopped web server");
        return;
    }

    MHD_stop_daemon(m_daemon);
    m_daemon = nullptr;
    Logger::info("Web server stopped");
}
