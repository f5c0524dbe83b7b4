#ifndef SOUND_CHANNEL_HPP
#define SOUND_CHANNEL_HPP

#include "notification_channel.hpp"

/* Plays a sound file with paplay, ignores the text */
class SoundChannel : public NotificationChannel {
public:
    SoundChannel(const std::string &sound_file, unsigned int timeout_s);

    bool deliver(const std::string &title, const std::string &body, const Device *device) override;

private:
    std::string m_sound_file;
    unsigned int m_timeout;
};

#endif
