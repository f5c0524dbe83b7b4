#include <unity.h>

#include "arp_scanner.hpp"
#include <arpa/inet.h>
#include <sstream>

static uint32_t ip(const char *s)
{
    struct in_addr addr;
    inet_pton(AF_INET, s, &addr);
    return ntohl(addr.s_addr);
}

void test_network_range_parsing()
{
    NetworkRange range;
    TEST_ASSERT_TRUE(parse_network_range("192.168.1.17/24", range));
    TEST_ASSERT_EQUAL_UINT32(ip("192.168.1.0"), range.network);
    TEST_ASSERT_EQUAL_UINT32(ip("192.168.1.1"), range.firstHost());
    TEST_ASSERT_EQUAL_UINT32(ip("192.168.1.254"), range.lastHost());
    TEST_ASSERT_TRUE(range.contains(ip("192.168.1.200")));
    TEST_ASSERT_FALSE(range.contains(ip("192.168.2.1")));

    TEST_ASSERT_FALSE(parse_network_range("192.168.1.0", range));
    TEST_ASSERT_FALSE(parse_network_range("10.0.0.0/8", range));
    TEST_ASSERT_FALSE(parse_network_range("192.168.1.0/31", range));
    TEST_ASSERT_FALSE(parse_network_range("192.168.1/24", range));
}

void test_arp_table_keeps_complete_entries_in_range()
{
    std::istringstream table(
        "IP address       HW type     Flags       HW address            Mask     Device\n"
        "192.168.1.10     0x1         0x2         aa:bb:cc:dd:ee:01     *        wlan0\n"
        "192.168.1.11     0x1         0x0         00:00:00:00:00:00     *        wlan0\n"
        "192.168.1.12     0x1         0x2         00:00:00:00:00:00     *        wlan0\n"
        "10.0.0.5         0x1         0x2         aa:bb:cc:dd:ee:02     *        eth0\n"
        "192.168.1.13     0x1         0x6         aa:bb:cc:dd:ee:03     *        wlan0\n");

    NetworkRange range;
    TEST_ASSERT_TRUE(parse_network_range("192.168.1.0/24", range));

    std::vector<ScannedDevice> devices;
    ArpScanner::parseArpTable(table, range, devices);

    TEST_ASSERT_EQUAL(2, devices.size());
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:01", devices[0].mac.c_str());
    TEST_ASSERT_EQUAL_STRING("192.168.1.10", devices[0].ip.c_str());
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:03", devices[1].mac.c_str());
}

void test_vendor_database_parsing()
{
    std::istringstream db(
        "OUI/MA-L                                                    Organization\n"
        "company_id                                                  Organization\n"
        "\n"
        "00-1B-63   (hex)\t\tApple, Inc.\r\n"
        "001B63     (base 16)\t\tApple, Inc.\n"
        "\t\t\t\t1 Infinite Loop\n"
        "B8-27-EB   (hex)\t\tRaspberry Pi Foundation\n");

    std::map<uint32_t, std::string> vendors;
    ArpScanner::parseVendorDatabase(db, vendors);

    TEST_ASSERT_EQUAL(2, vendors.size());
    TEST_ASSERT_EQUAL_STRING("Apple, Inc.", vendors[0x001B63].c_str());
    TEST_ASSERT_EQUAL_STRING("Raspberry Pi Foundation", vendors[0xB827EB].c_str());
}

void test_detected_network_is_a_valid_range()
{
    std::string network = detect_local_network();

    NetworkRange range;
    TEST_ASSERT_TRUE(parse_network_range(network, range));
    TEST_ASSERT_EQUAL(24, range.prefix);
    TEST_ASSERT_EQUAL_STRING(".0/24", network.substr(network.length() - 5).c_str());
}
