#include "process.hpp"
#include "sound_channel.hpp"

SoundChannel::SoundChannel(const std::string &sound_file, unsigned int timeout_s):
NotificationChannel("sound"),
m_sound_file(sound_file),
m_timeout(timeout_s)
{
}

bool SoundChannel::deliver(const std::string &, const std::string &, const Device *)
{
    std::vector<std::string> args;
    args.push_back("paplay");
    args.push_back(m_sound_file);

    return run_process(args, m_timeout);
}
