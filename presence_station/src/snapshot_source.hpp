#ifndef SNAPSHOT_SOURCE_HPP
#define SNAPSHOT_SOURCE_HPP

#include <string>
#include <time.h>
#include <vector>

/* A device seen up during a scan. ip and vendor may be empty. */
struct ScannedDevice {
    std::string mac;
    std::string ip;
    std::string vendor;
};

struct ScanResult {
    std::vector<ScannedDevice> devices;   /* no ordering guarantee */
    time_t scan_time = 0;                 /* always set by the source */
    double duration = 0.;                 /* in seconds */
};

class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;

    /**
     * @brief Scan the network
     *
     * May block for the duration of the scan.
     *
     * @param[out] result
     * @return false if no snapshot could be produced
     */
    virtual bool scan(ScanResult &result) = 0;
};

#endif
