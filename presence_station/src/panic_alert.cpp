#include "panic_alert.hpp"
#include <chrono>
#include <sstream>
#include <thread>

#define ANSI_RED        "\033[91m"
#define ANSI_YELLOW     "\033[93m"
#define ANSI_CYAN       "\033[96m"
#define ANSI_RESET      "\033[0m"

#define BANNER_PADDING  (4)

namespace {

std::string repeat(const char *s, unsigned int n)
{
    std::string r;
    for (unsigned int i = 0; i < n; ++i)
        r += s;
    return r;
}

}

PanicAlert::PanicAlert(std::ostream &out, unsigned int beep_delay_ms):
m_out(out),
m_beep_delay(beep_delay_ms),
m_mutex()
{
}

std::string PanicAlert::render(const std::string &message, const Device *device)
{
    unsigned int width = message.length() + BANNER_PADDING * 2;
    unsigned int left = (width - message.length()) / 2;
    unsigned int right = width - message.length() - left;

    std::stringstream ss;
    ss << '\n';
    ss << ANSI_RED "┌" << repeat("─", width) << "┐" ANSI_RESET "\n";
    ss << ANSI_RED "│" ANSI_YELLOW << std::string(left, ' ') << message
       << std::string(right, ' ') << ANSI_RED "│" ANSI_RESET "\n";
    ss << ANSI_RED "└" << repeat("─", width) << "┘" ANSI_RESET "\n";
    ss << '\n';

    if (device) {
        ss << ANSI_CYAN ">>> " << device_display_name(*device) << ANSI_RESET "\n";
        if (!device->vendor.empty() || !device->ip.empty()) {
            ss << "    " << device->vendor;
            if (!device->vendor.empty() && !device->ip.empty())
                ss << " · ";
            ss << device->ip << '\n';
        }
        ss << '\n';
    }

    return ss.str();
}

void PanicAlert::alert(const std::string &message, const Device *device, unsigned int loops)
{
    std::lock_guard<std::mutex> guard(m_mutex);

    m_out << render(message, device) << std::flush;
    for (unsigned int i = 0; i < loops; ++i) {
        m_out << '\a' << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(m_beep_delay));
    }
}
