#ifndef ARP_SCANNER_HPP
#define ARP_SCANNER_HPP

#include "snapshot_source.hpp"
#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

#define ARP_TABLE_PATH      "/proc/net/arp"
#define DEFAULT_NETWORK     "192.168.1.0/24"

/* IPv4 range in host byte order */
struct NetworkRange {
    uint32_t network = 0;
    unsigned int prefix = 0;

    uint32_t netmask() const;
    uint32_t firstHost() const;
    uint32_t lastHost() const;
    bool contains(uint32_t addr) const;
};

/**
 * @brief Parse a range in CIDR notation, e.g. 192.168.1.0/24
 *
 * Only prefixes between /16 and /30 are accepted. Host bits
 * set in the address are ignored.
 */
bool parse_network_range(const std::string &cidr, NetworkRange &range);

/**
 * @brief Guess the /24 range of the interface used by the default route
 *
 * Falls back to DEFAULT_NETWORK when there is no route.
 */
std::string detect_local_network();

/*
 * Detects devices by sending a datagram to every address of the
 * range, which makes the kernel resolve their MAC address, and
 * then reading the ARP table.
 */
class ArpScanner : public SnapshotSource {
public:
    ArpScanner(const std::string &network, const std::string &vendor_db_path);
    virtual ~ArpScanner() = default;

    bool scan(ScanResult &result) override;

    /* Empty string if unknown */
    std::string lookupVendor(const std::string &mac);

    /**
     * @brief Extract complete entries of an ARP table in /proc/net/arp format
     *
     * Entries outside range, incomplete or with a null MAC
     * address are skipped.
     */
    static void parseArpTable(std::istream &in, const NetworkRange &range,
                              std::vector<ScannedDevice> &devices);

    /* Load "XX-XX-XX   (hex)   Vendor" lines of IEEE oui.txt */
    static void parseVendorDatabase(std::istream &in, std::map<uint32_t, std::string> &vendors);

private:
    bool sweep();
    void loadVendorDatabase();

    NetworkRange m_range;
    std::string m_vendor_db_path;
    bool m_vendor_db_loaded;
    std::map<uint32_t, std::string> m_vendors; /* OUI -> vendor */
};

#endif
