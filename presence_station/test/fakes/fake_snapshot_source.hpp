#ifndef FAKE_SNAPSHOT_SOURCE_HPP
#define FAKE_SNAPSHOT_SOURCE_HPP

#include "snapshot_source.hpp"

/* Returns the devices it was given, at the time it was given */
class FakeSnapshotSource : public SnapshotSource {
public:
    FakeSnapshotSource();

    bool scan(ScanResult &result) override;

    void add(const std::string &mac, const std::string &ip = "", const std::string &vendor = "");
    void clear();

    time_t now;
    bool fail;
    unsigned int calls;

private:
    std::vector<ScannedDevice> m_devices;
};

#endif
