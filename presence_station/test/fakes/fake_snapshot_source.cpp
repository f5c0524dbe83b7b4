#include "fakes/fake_snapshot_source.hpp"

FakeSnapshotSource::FakeSnapshotSource():
now(0),
fail(false),
calls(0),
m_devices()
{
}

bool FakeSnapshotSource::scan(ScanResult &result)
{
    calls++;
    if (fail)
        return false;

    result.devices = m_devices;
    result.scan_time = now;
    result.duration = 0.;
    return true;
}

void FakeSnapshotSource::add(const std::string &mac, const std::string &ip, const std::string &vendor)
{
    ScannedDevice d;
    d.mac = mac;
    d.ip = ip;
    d.vendor = vendor;
    m_devices.push_back(d);
}

void FakeSnapshotSource::clear()
{
    m_devices.clear();
}
