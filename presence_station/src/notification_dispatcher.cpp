#include "logger.hpp"
#include "notification_dispatcher.hpp"
#include <sstream>

NotificationDispatcher::NotificationDispatcher():
m_thread(nullptr),
m_running(false),
m_jobs(),
m_mutex(),
m_cond(),
m_processed(0)
{
}

NotificationDispatcher::~NotificationDispatcher()
{
    if (m_thread)
        stop();
}

void NotificationDispatcher::start()
{
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_running) {
        Logger::warn("Attempted to start already running notification dispatcher");
        return;
    }

    m_running = true;
    m_thread = new std::thread(&NotificationDispatcher::run, this);
}

void NotificationDispatcher::stop()
{
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        if (!m_running) {
            Logger::warn("Attempted to stop already stopped notification dispatcher");
            return;
        }

        m_running = false;
        if (!m_jobs.empty()) {
            std::stringstream ss;
            ss << "Waiting for " << m_jobs.size() << " pending notifications";
            Logger::info(ss.str());
        }
    }

    m_cond.notify_all();
    m_thread->join();
    delete m_thread;
    m_thread = nullptr;
}

bool NotificationDispatcher::post(const NotificationJob &job)
{
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        if (!m_running) {
            Logger::warn("Notification dispatcher not running, dropping notification");
            return false;
        }

        m_jobs.push_back(job);
    }

    m_cond.notify_one();
    return true;
}

unsigned long NotificationDispatcher::getProcessedCount()
{
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_processed;
}

void NotificationDispatcher::run()
{
    while (true) {
        NotificationJob job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cond.wait(lock, [this] { return !m_running || !m_jobs.empty(); });

            /* Drain the queue before leaving */
            if (m_jobs.empty())
                return;

            job = m_jobs.front();
            m_jobs.pop_front();
        }

        job();

        std::lock_guard<std::mutex> guard(m_mutex);
        m_processed++;
    }
}
