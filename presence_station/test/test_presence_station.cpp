#include <unity.h>

#include "fakes/fake_snapshot_source.hpp"
#include "fakes/recording_channel.hpp"
#include "presence_station.hpp"
#include <memory>
#include <sstream>

#define MAC_A   "AA:AA:AA:AA:AA:01"

void test_change_formatting()
{
    PresenceChange change;
    change.kind = CHANGE_ARRIVED;
    change.device.mac = MAC_A;
    change.device.name = "Alice";

    std::string line = format_change(change, 1000);
    TEST_ASSERT_EQUAL(8, line.find(' '));
    TEST_ASSERT_EQUAL_STRING(" + Alice", line.substr(8).c_str());

    change.kind = CHANGE_NEW;
    TEST_ASSERT_EQUAL_STRING(" NEW Alice", format_change(change, 1000).substr(8).c_str());
    change.kind = CHANGE_LEFT;
    TEST_ASSERT_EQUAL_STRING(" - Alice", format_change(change, 1000).substr(8).c_str());
}

void test_changes_reach_observers_and_policy()
{
    DeviceRegistry registry;
    FakeSnapshotSource source;
    PresenceEngine engine(registry, source, 180);

    NotifyConfig notify;
    PanicConfig panic;
    NotificationDispatcher dispatcher;
    std::ostringstream out;
    PanicAlert panic_alert(out, 0);
    NotificationPolicy policy(notify, panic, dispatcher, panic_alert);
    std::shared_ptr<RecordingChannel> channel = std::make_shared<RecordingChannel>("recording");
    policy.addChannel(channel);

    PresenceStation station(engine, &policy, 30);
    std::vector<PresenceChange> observed;
    station.addObserver([&observed] (const PresenceChange &c) { observed.push_back(c); });

    dispatcher.start();

    /* Silent cycle still reports to observers */
    source.now = 1000;
    source.add(MAC_A);
    TEST_ASSERT_TRUE(station.runOnce(false));

    source.clear();
    source.now = 2000;
    TEST_ASSERT_TRUE(station.runOnce(true));

    source.fail = true;
    TEST_ASSERT_FALSE(station.runOnce(true));

    dispatcher.stop();

    TEST_ASSERT_EQUAL(2, observed.size());
    TEST_ASSERT_EQUAL(CHANGE_NEW, observed[0].kind);
    TEST_ASSERT_EQUAL(CHANGE_LEFT, observed[1].kind);

    std::vector<Delivery> deliveries = channel->getDeliveries();
    TEST_ASSERT_EQUAL(1, deliveries.size());
    TEST_ASSERT_EQUAL_STRING("Departure", deliveries[0].title.c_str());
}

void test_station_without_policy_only_scans()
{
    DeviceRegistry registry;
    FakeSnapshotSource source;
    PresenceEngine engine(registry, source, 180);
    PresenceStation station(engine, NULL, 1);

    source.now = 1000;
    source.add(MAC_A);
    TEST_ASSERT_TRUE(station.runOnce(true));

    /* Stop requested before running: only the initial scan happens */
    station.requestStop();
    station.run(true);
    TEST_ASSERT_EQUAL(2, source.calls);
    TEST_ASSERT_EQUAL(1, registry.listOnline().size());
}
