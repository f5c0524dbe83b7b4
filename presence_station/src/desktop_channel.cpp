#include "desktop_channel.hpp"
#include "process.hpp"
#include "version.hpp"

DesktopChannel::DesktopChannel(unsigned int timeout_s):
NotificationChannel("desktop"),
m_timeout(timeout_s)
{
}

bool DesktopChannel::deliver(const std::string &title, const std::string &body, const Device *)
{
    std::vector<std::string> args;
    args.push_back("notify-send");
    args.push_back(title);
    args.push_back(body);
    args.push_back("-a");
    args.push_back(PROGRAM_NAME);

    return run_process(args, m_timeout);
}
