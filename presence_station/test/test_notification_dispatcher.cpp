#include <unity.h>

#include "notification_dispatcher.hpp"
#include <chrono>
#include <vector>

void test_jobs_run_in_order()
{
    NotificationDispatcher dispatcher;
    std::vector<int> order;

    dispatcher.start();
    for (int i = 0; i < 20; ++i)
        TEST_ASSERT_TRUE(dispatcher.post([&order, i] { order.push_back(i); }));
    dispatcher.stop();

    TEST_ASSERT_EQUAL(20, order.size());
    for (int i = 0; i < 20; ++i)
        TEST_ASSERT_EQUAL(i, order[i]);
    TEST_ASSERT_EQUAL(20, dispatcher.getProcessedCount());
}

void test_stop_waits_for_pending_jobs()
{
    NotificationDispatcher dispatcher;
    unsigned int done = 0;

    dispatcher.start();
    for (int i = 0; i < 3; ++i) {
        dispatcher.post([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            done++;
        });
    }
    dispatcher.stop();

    TEST_ASSERT_EQUAL(3, done);
}

void test_post_requires_running_dispatcher()
{
    NotificationDispatcher dispatcher;
    bool called = false;

    TEST_ASSERT_FALSE(dispatcher.post([&called] { called = true; }));

    dispatcher.start();
    dispatcher.stop();
    TEST_ASSERT_FALSE(dispatcher.post([&called] { called = true; }));

    TEST_ASSERT_FALSE(called);
    TEST_ASSERT_EQUAL(0, dispatcher.getProcessedCount());
}
