#include "core/job_scheduler.hpp"

job_scheduler::~job_scheduler() {
    stop();
}

void job_scheduler::add(const std::string& profile_id, const std::string& job_id,
                        wall_clock::time_point when) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[{profile_id, job_id}] = when;
}

void job_scheduler::remove(const std::string& profile_id, const std::string& job_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase({profile_id, job_id});
}

std::size_t job_scheduler::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::vector<job_scheduler::job_key> job_scheduler::take_due(wall_clock::time_point now) {
    std::vector<job_key> due;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second <= now) {
            due.push_back(it->first);
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
    return due;
}

void job_scheduler::start(std::chrono::milliseconds interval, tick_callback_t on_tick) {
    std::lock_guard<std::mutex> lock(m_thread_mutex);
    if (m_running)
        return;
    m_running = true;
    m_interval = interval;
    m_on_tick = std::move(on_tick);
    m_thread = std::thread(&job_scheduler::run, this);
}

void job_scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_thread_mutex);
        if (!m_running)
            return;
        m_running = false;
    }
    m_cv.notify_all();
    if (m_thread.joinable())
        m_thread.join();
}

void job_scheduler::run() {
    std::unique_lock<std::mutex> lock(m_thread_mutex);
    while (m_running) {
        m_cv.wait_for(lock, m_interval, [this]() { return !m_running; });
        if (!m_running)
            break;
        lock.unlock();
        m_on_tick(wall_clock::now());
        lock.lock();
    }
}
