#include <unity.h>

#include "fakes/recording_channel.hpp"
#include "notification_policy.hpp"
#include <algorithm>
#include <memory>
#include <sstream>

#define MAC_A   "AA:AA:AA:AA:AA:01"

static PresenceChange make_change(enum ChangeKind kind, const std::string &name, const std::string &vendor)
{
    PresenceChange change;
    change.kind = kind;
    change.device.mac = MAC_A;
    change.device.name = name;
    change.device.vendor = vendor;
    change.device.ip = "192.168.1.20";
    change.device.is_online = kind != CHANGE_LEFT;
    return change;
}

void test_quiet_hours_window()
{
    TEST_ASSERT_TRUE(in_quiet_hours(22, 6, 23));
    TEST_ASSERT_TRUE(in_quiet_hours(22, 6, 0));
    TEST_ASSERT_TRUE(in_quiet_hours(22, 6, 5));
    TEST_ASSERT_FALSE(in_quiet_hours(22, 6, 6));
    TEST_ASSERT_FALSE(in_quiet_hours(22, 6, 10));
    TEST_ASSERT_TRUE(in_quiet_hours(23, 7, 2));

    TEST_ASSERT_TRUE(in_quiet_hours(1, 5, 1));
    TEST_ASSERT_FALSE(in_quiet_hours(1, 5, 5));

    /* Empty or disabled window */
    TEST_ASSERT_FALSE(in_quiet_hours(8, 8, 8));
    TEST_ASSERT_FALSE(in_quiet_hours(-1, -1, 3));
}

void test_quiet_hours_suppress_everything()
{
    NotifyConfig notify;
    notify.quiet_hours_start = 22;
    notify.quiet_hours_end = 6;
    PanicConfig panic;
    panic.enabled = true;

    NotificationDispatcher dispatcher;
    std::ostringstream out;
    PanicAlert panic_alert(out, 0);
    NotificationPolicy policy(notify, panic, dispatcher, panic_alert);

    TEST_ASSERT_EQUAL(DECISION_SUPPRESSED, policy.decide(make_change(CHANGE_NEW, "", "Apple"), 23).kind);
    TEST_ASSERT_EQUAL(DECISION_SUPPRESSED, policy.decide(make_change(CHANGE_LEFT, "Alice", ""), 3).kind);
    TEST_ASSERT_EQUAL(DECISION_PANIC, policy.decide(make_change(CHANGE_NEW, "", "Apple"), 10).kind);
    TEST_ASSERT_EQUAL(DECISION_NORMAL, policy.decide(make_change(CHANGE_LEFT, "Alice", ""), 10).kind);
}

void test_panic_takes_precedence()
{
    NotifyConfig notify;
    PanicConfig panic;
    panic.enabled = true;
    panic.only_unknown = true;
    panic.custom_messages["AA:AA:AA:AA:AA:02"] = "Bob is here";

    NotificationDispatcher dispatcher;
    std::ostringstream out;
    PanicAlert panic_alert(out, 0);
    NotificationPolicy policy(notify, panic, dispatcher, panic_alert);

    Decision decision = policy.decide(make_change(CHANGE_ARRIVED, "", "Apple"), 12);
    TEST_ASSERT_EQUAL(DECISION_PANIC, decision.kind);
    TEST_ASSERT_EQUAL_STRING(DEFAULT_PANIC_MESSAGE, decision.message.c_str());

    /* Named devices are not panic worthy with only_unknown */
    decision = policy.decide(make_change(CHANGE_ARRIVED, "Alice", "Apple"), 12);
    TEST_ASSERT_EQUAL(DECISION_NORMAL, decision.kind);

    /* Departures never panic */
    decision = policy.decide(make_change(CHANGE_LEFT, "", "Apple"), 12);
    TEST_ASSERT_EQUAL(DECISION_NORMAL, decision.kind);

    PresenceChange bob = make_change(CHANGE_NEW, "", "");
    bob.device.mac = "AA:AA:AA:AA:AA:02";
    decision = policy.decide(bob, 12);
    TEST_ASSERT_EQUAL(DECISION_PANIC, decision.kind);
    TEST_ASSERT_EQUAL_STRING("Bob is here", decision.message.c_str());

    panic.only_unknown = false;
    NotificationPolicy everyone(notify, panic, dispatcher, panic_alert);
    decision = everyone.decide(make_change(CHANGE_ARRIVED, "Alice", "Apple"), 12);
    TEST_ASSERT_EQUAL(DECISION_PANIC, decision.kind);
}

void test_notification_texts()
{
    NotifyConfig notify;
    PanicConfig panic;

    NotificationDispatcher dispatcher;
    std::ostringstream out;
    PanicAlert panic_alert(out, 0);
    NotificationPolicy policy(notify, panic, dispatcher, panic_alert);

    Decision decision = policy.decide(make_change(CHANGE_NEW, "", "Apple"), 12);
    TEST_ASSERT_EQUAL(DECISION_NORMAL, decision.kind);
    TEST_ASSERT_EQUAL_STRING("New Device", decision.title.c_str());
    TEST_ASSERT_EQUAL_STRING("Unknown device (Apple)\nMAC: " MAC_A, decision.body.c_str());

    decision = policy.decide(make_change(CHANGE_NEW, "", ""), 12);
    TEST_ASSERT_EQUAL_STRING("Unknown device\nMAC: " MAC_A, decision.body.c_str());

    decision = policy.decide(make_change(CHANGE_ARRIVED, "Alice", "Apple"), 12);
    TEST_ASSERT_EQUAL_STRING("Arrival", decision.title.c_str());
    TEST_ASSERT_EQUAL_STRING("Alice is now home", decision.body.c_str());

    decision = policy.decide(make_change(CHANGE_LEFT, "Alice", "Apple"), 12);
    TEST_ASSERT_EQUAL_STRING("Departure", decision.title.c_str());
    TEST_ASSERT_EQUAL_STRING("Alice has left", decision.body.c_str());
}

void test_changes_are_delivered_to_every_channel()
{
    NotifyConfig notify;
    PanicConfig panic;

    NotificationDispatcher dispatcher;
    std::ostringstream out;
    PanicAlert panic_alert(out, 0);
    NotificationPolicy policy(notify, panic, dispatcher, panic_alert);

    std::shared_ptr<RecordingChannel> first = std::make_shared<RecordingChannel>("first", false);
    std::shared_ptr<RecordingChannel> second = std::make_shared<RecordingChannel>("second");
    policy.addChannel(first);
    policy.addChannel(second);
    TEST_ASSERT_EQUAL(2, policy.getChannelCount());

    dispatcher.start();
    policy.handle(make_change(CHANGE_ARRIVED, "Alice", ""));
    policy.handle(make_change(CHANGE_LEFT, "Alice", ""));
    dispatcher.stop();

    /* A failing channel does not stop the others */
    std::vector<Delivery> deliveries = second->getDeliveries();
    TEST_ASSERT_EQUAL(2, deliveries.size());
    TEST_ASSERT_EQUAL_STRING("Arrival", deliveries[0].title.c_str());
    TEST_ASSERT_EQUAL_STRING(MAC_A, deliveries[0].mac.c_str());
    TEST_ASSERT_EQUAL_STRING("Departure", deliveries[1].title.c_str());
    TEST_ASSERT_EQUAL(2, first->getDeliveries().size());
    TEST_ASSERT_EQUAL(4, dispatcher.getProcessedCount());
    TEST_ASSERT_TRUE(out.str().empty());
}

void test_panic_replaces_channels()
{
    NotifyConfig notify;
    PanicConfig panic;
    panic.enabled = true;
    panic.sound_loops = 2;

    NotificationDispatcher dispatcher;
    std::ostringstream out;
    PanicAlert panic_alert(out, 0);
    NotificationPolicy policy(notify, panic, dispatcher, panic_alert);

    std::shared_ptr<RecordingChannel> channel = std::make_shared<RecordingChannel>("recording");
    policy.addChannel(channel);

    dispatcher.start();
    policy.handle(make_change(CHANGE_NEW, "", "Apple"));
    dispatcher.stop();

    TEST_ASSERT_EQUAL(0, channel->getDeliveries().size());

    std::string printed = out.str();
    TEST_ASSERT_TRUE(printed.find(DEFAULT_PANIC_MESSAGE) != std::string::npos);
    TEST_ASSERT_TRUE(printed.find("192.168.1.20") != std::string::npos);
    TEST_ASSERT_EQUAL(2, std::count(printed.begin(), printed.end(), '\a'));
}

void test_panic_banner_is_centred()
{
    std::string banner = PanicAlert::render("HI", NULL);
    TEST_ASSERT_TRUE(banner.find("    HI    ") != std::string::npos);
    TEST_ASSERT_TRUE(banner.find(">>>") == std::string::npos);

    Device d;
    d.mac = MAC_A;
    d.name = "Alice";
    banner = PanicAlert::render("HI", &d);
    TEST_ASSERT_TRUE(banner.find(">>> Alice") != std::string::npos);
}

void test_channels_are_created_from_configuration()
{
    NotifyConfig notify;
    notify.sound = false;
    TEST_ASSERT_EQUAL(0, create_channels(notify).size());

    notify.desktop = true;
    notify.telegram_token = "123:abc";
    TEST_ASSERT_EQUAL(1, create_channels(notify).size());

    notify.telegram_chat_id = "42";
    notify.webhook_url = "http://localhost/hook";
    std::vector<std::shared_ptr<NotificationChannel>> channels = create_channels(notify);
    TEST_ASSERT_EQUAL(3, channels.size());
    TEST_ASSERT_EQUAL_STRING("telegram", channels[1]->getName().c_str());
}
