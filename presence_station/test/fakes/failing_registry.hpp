#ifndef FAILING_REGISTRY_HPP
#define FAILING_REGISTRY_HPP

#include "device_registry.hpp"
#include <set>

/* In-memory registry refusing to store events of some devices */
class FailingRegistry : public DeviceRegistry {
public:
    std::set<std::string> failing_macs;

protected:
    bool storeEvent(const PresenceEvent &event) override
    {
        return failing_macs.find(event.mac) == failing_macs.end();
    }
};

#endif
