#include "arp_scanner.hpp"
#include "device.hpp"
#include "logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

#define DISCARD_PORT            (9)
#define ARP_SETTLE_TIME         (1500)      /* in milliseconds */
#define ATF_COMPLETE            (0x2)
#define MIN_PREFIX              (16)
#define MAX_PREFIX              (30)
#define ROUTE_TEST_ADDR         "8.8.8.8"
#define ROUTE_TEST_PORT         (80)

namespace {

void wait_ms(unsigned int ms)
{
    struct timespec req, rem;
    req.tv_sec = ms / 1000;
    req.tv_nsec = (ms - req.tv_sec * 1000) * 1000 * 1000;
    while (nanosleep(&req, &rem))
        req = rem;
}

}

uint32_t NetworkRange::netmask() const
{
    if (prefix == 0)
        return 0;
    return 0xFFFFFFFFU << (32 - prefix);
}

uint32_t NetworkRange::firstHost() const
{
    return network + 1;
}

uint32_t NetworkRange::lastHost() const
{
    return (network | ~netmask()) - 1;
}

bool NetworkRange::contains(uint32_t addr) const
{
    return (addr & netmask()) == network;
}

bool parse_network_range(const std::string &cidr, NetworkRange &range)
{
    size_t slash = cidr.find('/');
    if (slash == std::string::npos)
        return false;

    std::string addr_str = cidr.substr(0, slash);
    std::string prefix_str = cidr.substr(slash + 1);

    struct in_addr addr;
    if (inet_pton(AF_INET, addr_str.c_str(), &addr) != 1)
        return false;

    char *end = NULL;
    long prefix = strtol(prefix_str.c_str(), &end, 10);
    if (prefix_str.empty() || *end != '\0')
        return false;
    if (prefix < MIN_PREFIX || prefix > MAX_PREFIX)
        return false;

    range.prefix = prefix;
    range.network = ntohl(addr.s_addr) & range.netmask();
    return true;
}

/*
 * Connecting a datagram socket sends nothing but selects the
 * interface of the default route, and its address.
 */
std::string detect_local_network()
{
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        std::stringstream ss;
        ss << "Failed to create socket to detect local network: " << strerror(errno);
        Logger::warn(ss.str());
        return DEFAULT_NETWORK;
    }

    struct sockaddr_in remote;
    memset(&remote, 0, sizeof(remote));
    remote.sin_family = AF_INET;
    remote.sin_port = htons(ROUTE_TEST_PORT);
    inet_pton(AF_INET, ROUTE_TEST_ADDR, &remote.sin_addr);

    struct sockaddr_in local;
    socklen_t len = sizeof(local);
    memset(&local, 0, sizeof(local));
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&remote), sizeof(remote)) < 0
    ||  getsockname(fd, reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        std::stringstream ss;
        ss << "Could not detect local network, using " DEFAULT_NETWORK ": " << strerror(errno);
        Logger::warn(ss.str());
        close(fd);
        return DEFAULT_NETWORK;
    }

    close(fd);

    /* Assume a /24 */
    uint32_t addr = ntohl(local.sin_addr.s_addr);
    std::stringstream ss;
    ss << ((addr >> 24) & 0xFF) << '.'
       << ((addr >> 16) & 0xFF) << '.'
       << ((addr >> 8) & 0xFF) << ".0/24";
    return ss.str();
}

ArpScanner::ArpScanner(const std::string &network, const std::string &vendor_db_path):
m_range(),
m_vendor_db_path(vendor_db_path),
m_vendor_db_loaded(false),
m_vendors()
{
    if (!parse_network_range(network, m_range)) {
        std::stringstream ss;
        ss << "Invalid network range \"" << network << '\"';
        throw std::invalid_argument(ss.str());
    }
}

bool ArpScanner::scan(ScanResult &result)
{
    auto start = std::chrono::steady_clock::now();

    if (!sweep())
        return false;

    std::ifstream file(ARP_TABLE_PATH);
    if (!file) {
        Logger::err("Could not read ARP table " ARP_TABLE_PATH);
        return false;
    }

    result.devices.clear();
    parseArpTable(file, m_range, result.devices);
    for (auto &d : result.devices)
        d.vendor = lookupVendor(d.mac);

    result.scan_time = time(NULL);
    result.duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    std::stringstream ss;
    ss << "Scan found " << result.devices.size() << " devices in " << result.duration << 's';
    Logger::debug(ss.str());

    return true;
}

/*
 * Send one datagram to the discard port of every host. Most hosts
 * do not listen on it, it does not matter: the kernel has to resolve
 * the MAC address of each destination before sending anything.
 */
bool ArpScanner::sweep()
{
    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        std::stringstream ss;
        ss << "Failed to create socket for network sweep: " << strerror(errno);
        Logger::err(ss.str());
        return false;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        Logger::err("Failed to set network sweep socket non blocking");
        close(fd);
        return false;
    }

    const uint8_t payload = 0;
    unsigned int failures = 0;
    for (uint32_t host = m_range.firstHost(); host <= m_range.lastHost(); ++host) {
        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(DISCARD_PORT);
        addr.sin_addr.s_addr = htonl(host);

        ssize_t ret = sendto(fd, &payload, sizeof(payload), 0,
                             reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        if (ret < 0 && (errno == EAGAIN || errno == ENOBUFS)) {
            /* Give the kernel some time to flush its queue */
            wait_ms(1);
            ret = sendto(fd, &payload, sizeof(payload), 0,
                         reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        }
        if (ret < 0)
            ++failures;
    }

    close(fd);

    if (failures) {
        std::stringstream ss;
        ss << "Network sweep could not reach " << failures << " addresses";
        Logger::debug(ss.str());
    }

    wait_ms(ARP_SETTLE_TIME);

    return true;
}

void ArpScanner::parseArpTable(std::istream &in, const NetworkRange &range,
                               std::vector<ScannedDevice> &devices)
{
    std::string line;

    /* Skip header */
    if (!std::getline(in, line))
        return;

    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string ip, hw_type, flags_str, hw_addr, mask, iface;
        if (!(iss >> ip >> hw_type >> flags_str >> hw_addr >> mask >> iface))
            continue;

        unsigned long flags = strtoul(flags_str.c_str(), NULL, 16);
        if (!(flags & ATF_COMPLETE))
            continue;

        std::string mac;
        if (!normalize_mac(hw_addr, mac) || mac == "00:00:00:00:00:00")
            continue;

        struct in_addr addr;
        if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
            continue;
        if (!range.contains(ntohl(addr.s_addr)))
            continue;

        ScannedDevice d;
        d.mac = mac;
        d.ip = ip;
        devices.push_back(d);
    }
}

void ArpScanner::parseVendorDatabase(std::istream &in, std::map<uint32_t, std::string> &vendors)
{
    std::string line;
    while (std::getline(in, line)) {
        size_t pos = line.find("(hex)");
        if (pos == std::string::npos)
            continue;

        std::istringstream iss(line.substr(0, pos));
        std::string prefix;
        if (!(iss >> prefix) || prefix.length() != 8)
            continue;

        MacAddress mac;
        if (!parse_mac(prefix + "-00-00-00", mac))
            continue;

        std::string vendor = line.substr(pos + 5);
        size_t first = vendor.find_first_not_of(" \t");
        size_t last = vendor.find_last_not_of(" \t\r");
        if (first == std::string::npos)
            continue;

        uint32_t oui = (mac[0] << 16) | (mac[1] << 8) | mac[2];
        vendors[oui] = vendor.substr(first, last - first + 1);
    }
}

void ArpScanner::loadVendorDatabase()
{
    m_vendor_db_loaded = true;

    if (m_vendor_db_path.empty())
        return;

    std::ifstream file(m_vendor_db_path);
    if (!file) {
        std::stringstream ss;
        ss << "Vendor database " << m_vendor_db_path << " not found, vendors will not be reported";
        Logger::warn(ss.str());
        return;
    }

    parseVendorDatabase(file, m_vendors);

    std::stringstream ss;
    ss << "Loaded " << m_vendors.size() << " vendors from " << m_vendor_db_path;
    Logger::debug(ss.str());
}

std::string ArpScanner::lookupVendor(const std::string &mac)
{
    if (!m_vendor_db_loaded)
        loadVendorDatabase();

    MacAddress addr;
    if (!parse_mac(mac, addr))
        return std::string();

    uint32_t oui = (addr[0] << 16) | (addr[1] << 8) | addr[2];
    auto it = m_vendors.find(oui);
    if (it == m_vendors.end())
        return std::string();

    return it->second;
}
