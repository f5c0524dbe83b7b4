#ifndef NOTIFICATION_DISPATCHER_HPP
#define NOTIFICATION_DISPATCHER_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

typedef std::function<void()> NotificationJob;

/*
 * Runs notification jobs in order on a single worker thread so
 * that slow channels never delay a reconciliation cycle.
 */
class NotificationDispatcher {
public:
    NotificationDispatcher();
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher &d) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher &d) = delete;

    void start();

    /* Run the jobs still queued, then join the worker thread */
    void stop();

    /**
     * @brief Queue a job
     *
     * @return false if the dispatcher is not running, the job is
     * dropped
     */
    bool post(const NotificationJob &job);

    unsigned long getProcessedCount();

private:
    void run();

    std::thread *m_thread;
    bool m_running;
    std::deque<NotificationJob> m_jobs;
    std::mutex m_mutex;
    std::condition_variable m_cond;
    unsigned long m_processed;
};

#endif
