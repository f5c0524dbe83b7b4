#ifndef PANIC_ALERT_HPP
#define PANIC_ALERT_HPP

#include "device.hpp"
#include <mutex>
#include <ostream>
#include <string>

#define PANIC_BEEP_DELAY    (200)   /* in ms */

/* Big red banner on the terminal followed by a few beeps */
class PanicAlert {
public:
    explicit PanicAlert(std::ostream &out, unsigned int beep_delay_ms = PANIC_BEEP_DELAY);

    void alert(const std::string &message, const Device *device, unsigned int loops);

    /* Banner and device details, without the beeps */
    static std::string render(const std::string &message, const Device *device);

private:
    std::ostream &m_out;
    unsigned int m_beep_delay;
    std::mutex m_mutex;
};

#endif
