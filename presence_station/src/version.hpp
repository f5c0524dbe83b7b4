#ifndef VERSION_HPP
#define VERSION_HPP

#include <string>

#define PROGRAM_NAME    "presence_station"

/* presence_station-<git hash>.<build time> */
std::string get_version_str();

/* Sent as User-Agent by the HTTP based channels */
std::string get_user_agent_str();

#endif
