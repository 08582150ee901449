#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/job.hpp"

// Deferred activation of scheduled jobs. Keeps the (profile, job) -> time table
// and, once started, calls `on_tick` every interval from its own thread.
class job_scheduler {
public:
    using job_key = std::pair<std::string, std::string>; // profile id, job id
    using tick_callback_t = std::function<void(wall_clock::time_point now)>;

    job_scheduler() = default;
    ~job_scheduler();

    job_scheduler(const job_scheduler&) = delete;
    job_scheduler& operator=(const job_scheduler&) = delete;

    void add(const std::string& profile_id, const std::string& job_id,
             wall_clock::time_point when);
    void remove(const std::string& profile_id, const std::string& job_id);
    std::size_t size() const;

    // Removes and returns every entry due at `now`.
    std::vector<job_key> take_due(wall_clock::time_point now);

    void start(std::chrono::milliseconds interval, tick_callback_t on_tick);
    void stop();

private:
    void run();

    mutable std::mutex m_mutex;
    std::map<job_key, wall_clock::time_point> m_entries;

    std::mutex m_thread_mutex;
    std::condition_variable m_cv;
    bool m_running = false;
    std::chrono::milliseconds m_interval{1000};
    tick_callback_t m_on_tick;
    std::thread m_thread;
};
