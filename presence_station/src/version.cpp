#include "version.hpp"
#include <sstream>

#ifndef GIT_HASH
#define GIT_HASH        "development"
#endif

#ifndef BUILD_TIME
#define BUILD_TIME      "unknown-time"
#endif

std::string get_version_str()
{
    std::stringstream ss;
    ss << PROGRAM_NAME << '-' << GIT_HASH << '.' << BUILD_TIME;
    return ss.str();
}

std::string get_user_agent_str()
{
    std::stringstream ss;
    ss << PROGRAM_NAME << '/' << GIT_HASH;
    return ss.str();
}
