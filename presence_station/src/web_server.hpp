#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include <microhttpd.h>
#include "status_page.hpp"
#include <string>

/*
 * Routes:
 *   GET  /                  HTML status page
 *   GET  /api/status        JSON status
 *   GET  /api/who           JSON summary of who is home
 *   POST /api/device/<mac>  set name and/or group from query arguments
 */
class WebServer {
public:
    /* host is an IPv4 address, 0.0.0.0 for every interface */
    WebServer(StatusPage &page, const std::string &host, unsigned int port);
    ~WebServer();

    void start();
    void stop();

private:
    StatusPage &m_page;
    std::string m_host;
    unsigned int m_port;
    struct MHD_Daemon *m_daemon;
};

#endif
