#include <unity.h>

#include "fakes/fake_snapshot_source.hpp"
#include "status_page.hpp"
#include "telegram_channel.hpp"
#include "webhook_channel.hpp"
#include <string>

#define MAC_A   "AA:AA:AA:AA:AA:01"
#define MAC_B   "AA:AA:AA:AA:AA:02"

static bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}

void test_html_escape()
{
    TEST_ASSERT_EQUAL_STRING("Tom &amp; Jerry", html_escape("Tom & Jerry").c_str());
    TEST_ASSERT_EQUAL_STRING("&lt;b&gt;&quot;hi&quot;&#39;", html_escape("<b>\"hi\"'").c_str());
}

void test_status_json_lists_online_devices()
{
    DeviceRegistry registry;
    FakeSnapshotSource source;
    PresenceEngine engine(registry, source, 180);
    StatusPage page(registry, engine);

    source.now = time(NULL);
    source.add(MAC_A, "192.168.1.2", "Apple");
    source.add(MAC_B);
    std::vector<PresenceChange> changes;
    TEST_ASSERT_TRUE(engine.runCycle(changes));
    TEST_ASSERT_TRUE(registry.setName(MAC_A, "Alice \"A\""));

    std::string json = page.buildStatusJson();
    TEST_ASSERT_TRUE(contains(json, "\"online_count\":2,"));
    TEST_ASSERT_TRUE(contains(json, "\"known_count\":2,"));
    TEST_ASSERT_TRUE(contains(json, "\"arrivals_today\":2,"));
    TEST_ASSERT_TRUE(contains(json, "\"name\":\"Alice \\\"A\\\"\""));
    TEST_ASSERT_TRUE(contains(json, "\"event_type\":\"arrived\""));
    TEST_ASSERT_TRUE(contains(json, "\"device_name\":\"Alice \\\"A\\\"\""));

    std::string html = page.buildWebpage();
    TEST_ASSERT_TRUE(contains(html, "Alice &quot;A&quot;"));
    TEST_ASSERT_TRUE(contains(html, "192.168.1.2"));
}

void test_who_json()
{
    DeviceRegistry registry;
    FakeSnapshotSource source;
    PresenceEngine engine(registry, source, 180);
    StatusPage page(registry, engine);

    TEST_ASSERT_EQUAL_STRING("{\"summary\":\"Nobody's home\"}", page.buildWhoJson().c_str());

    source.now = 1000;
    source.add(MAC_A);
    std::vector<PresenceChange> changes;
    TEST_ASSERT_TRUE(engine.runCycle(changes));
    TEST_ASSERT_TRUE(registry.setName(MAC_A, "Alice"));
    source.add(MAC_B);
    TEST_ASSERT_TRUE(engine.runCycle(changes));

    TEST_ASSERT_EQUAL_STRING("{\"summary\":\"Home: Alice\\n+ 1 other device(s)\"}", page.buildWhoJson().c_str());
}

void test_device_edit_from_web()
{
    DeviceRegistry registry;
    FakeSnapshotSource source;
    PresenceEngine engine(registry, source, 180);
    StatusPage page(registry, engine);

    source.now = 1000;
    source.add(MAC_A);
    std::vector<PresenceChange> changes;
    TEST_ASSERT_TRUE(engine.runCycle(changes));

    std::string json;
    TEST_ASSERT_EQUAL(200, page.editDevice("aa-aa-aa-aa-aa-01", "Alice", "family", json));
    TEST_ASSERT_EQUAL_STRING("{\"status\":\"ok\"}", json.c_str());

    Device d;
    TEST_ASSERT_TRUE(registry.get(MAC_A, d));
    TEST_ASSERT_EQUAL_STRING("Alice", d.name.c_str());
    TEST_ASSERT_EQUAL_STRING("family", d.group.c_str());

    /* Group only */
    TEST_ASSERT_EQUAL(200, page.editDevice(MAC_A, NULL, "work", json));
    TEST_ASSERT_TRUE(registry.get(MAC_A, d));
    TEST_ASSERT_EQUAL_STRING("Alice", d.name.c_str());
    TEST_ASSERT_EQUAL_STRING("work", d.group.c_str());

    TEST_ASSERT_EQUAL(404, page.editDevice(MAC_B, "Bob", NULL, json));
    TEST_ASSERT_EQUAL(400, page.editDevice("not-a-mac", "Bob", NULL, json));
    TEST_ASSERT_EQUAL(1, registry.listAll().size());
}

void test_telegram_text()
{
    Device d;
    d.mac = MAC_A;
    d.vendor = "Apple";

    TEST_ASSERT_EQUAL_STRING("*Arrival*\nAlice is now home\nDevice: Apple",
                             TelegramChannel::buildText("Arrival", "Alice is now home", &d).c_str());
    TEST_ASSERT_EQUAL_STRING("*Arrival*\nAlice is now home",
                             TelegramChannel::buildText("Arrival", "Alice is now home", NULL).c_str());
}

void test_webhook_payload()
{
    Device d;
    d.mac = MAC_A;
    d.name = "Alice";
    d.ip = "192.168.1.2";

    std::string json = WebhookChannel::buildPayload("Arrival", "Alice is now home", &d, 1000);
    TEST_ASSERT_TRUE(contains(json, "{\"title\":\"Arrival\",\"message\":\"Alice is now home\",\"timestamp\":\""));
    TEST_ASSERT_TRUE(contains(json, "\"device\":{\"mac\":\"" MAC_A "\",\"name\":\"Alice\",\"vendor\":null,\"ip\":\"192.168.1.2\"}}"));

    json = WebhookChannel::buildPayload("Departure", "line\nbreak", NULL, 1000);
    TEST_ASSERT_TRUE(contains(json, "\"message\":\"line\\nbreak\""));
    TEST_ASSERT_FALSE(contains(json, "\"device\""));
}
